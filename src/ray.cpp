#include "sightline/ray.hpp"
#include <cstdlib>

namespace sightline {

static void append_ray(const Board& b, Square from, int dir, std::vector<RayStep>& out) {
  const auto& T = ATT();
  const int n = T.ray_len[dir][from];
  for (int i = 0; i < n; ++i) {
    const Square s = T.rays[dir][from][i];
    RayStep st;
    st.square = s;
    st.occupant = b.at(s);
    st.direction = dir;
    st.blocker = !st.occupant.empty();
    out.push_back(st);
    if (st.blocker) break;
  }
}

template <std::size_t N>
static void append_leaps(const Board& b, const std::array<int, N>& to, int n, std::vector<RayStep>& out) {
  for (int i = 0; i < n; ++i) {
    RayStep st;
    st.square = to[static_cast<std::size_t>(i)];
    st.occupant = b.at(st.square);
    st.blocker = !st.occupant.empty();
    out.push_back(st);
  }
}

std::vector<RayStep> cast(const Board& b, Square from, int direction) {
  std::vector<RayStep> out;
  if (from < 0 || from > 63 || direction < 0 || direction >= DIR_N_COUNT) return out;
  append_ray(b, from, direction, out);
  return out;
}

std::vector<RayStep> cast(const Board& b, Square from, DirectionSet set) {
  std::vector<RayStep> out;
  if (from < 0 || from > 63) return out;
  const auto& T = ATT();
  switch (set) {
    case DirectionSet::Knight:
      append_leaps(b, T.knight_to[from], T.knight_sz[from], out);
      break;
    case DirectionSet::King:
      append_leaps(b, T.king_to[from], T.king_sz[from], out);
      break;
    case DirectionSet::WhitePawnCaptures:
      append_leaps(b, T.pawn_to[0][from], T.pawn_sz[0][from], out);
      break;
    case DirectionSet::BlackPawnCaptures:
      append_leaps(b, T.pawn_to[1][from], T.pawn_sz[1][from], out);
      break;
    default:
      for (int d = 0; d < DIR_N_COUNT; ++d)
        if (in_set(set, d)) append_ray(b, from, d, out);
      break;
  }
  return out;
}

DirectionSet attack_set(ColorPiece cp) {
  switch (cp.piece) {
    case Piece::Pawn:
      return cp.color == Color::White ? DirectionSet::WhitePawnCaptures : DirectionSet::BlackPawnCaptures;
    case Piece::Knight: return DirectionSet::Knight;
    case Piece::Bishop: return DirectionSet::Diagonal;
    case Piece::Rook:   return DirectionSet::Orthogonal;
    case Piece::Queen:  return DirectionSet::All;
    default:            return DirectionSet::King;
  }
}

bool in_set(DirectionSet set, int direction) {
  if (direction < 0 || direction >= DIR_N_COUNT) return false;
  switch (set) {
    case DirectionSet::Orthogonal: return !is_diagonal(direction);
    case DirectionSet::Diagonal:   return is_diagonal(direction);
    case DirectionSet::All:        return true;
    default:                       return false;
  }
}

bool is_diagonal(int direction) { return (direction & 1) != 0; }

int opposite_direction(int direction) {
  if (direction < 0) return DIR_NONE;
  return (direction + 4) & 7;
}

bool slides_along(Piece p, int direction) {
  if (direction < 0 || direction >= DIR_N_COUNT) return false;
  switch (p) {
    case Piece::Queen:  return true;
    case Piece::Rook:   return !is_diagonal(direction);
    case Piece::Bishop: return is_diagonal(direction);
    default:            return false;
  }
}

int direction_between(Square from, Square to) {
  if (from == to || from < 0 || to < 0 || from > 63 || to > 63) return DIR_NONE;
  const int df = file_of(to) - file_of(from);
  const int dr = rank_of(to) - rank_of(from);
  if (df != 0 && dr != 0 && std::abs(df) != std::abs(dr)) return DIR_NONE;
  const int sf = (df > 0) - (df < 0);
  const int sr = (dr > 0) - (dr < 0);
  for (int d = 0; d < DIR_N_COUNT; ++d)
    if (DIR_DF[d] == sf && DIR_DR[d] == sr) return d;
  return DIR_NONE;
}

int square_distance(Square a, Square b) {
  const int df = std::abs(file_of(a) - file_of(b));
  const int dr = std::abs(rank_of(a) - rank_of(b));
  return df > dr ? df : dr;
}

Square first_blocker(const Board& b, Square from, int direction) {
  if (from < 0 || from > 63 || direction < 0 || direction >= DIR_N_COUNT) return NO_SQUARE;
  const auto& T = ATT();
  const int n = T.ray_len[direction][from];
  for (int i = 0; i < n; ++i) {
    const Square s = T.rays[direction][from][i];
    if (!b.empty(s)) return s;
  }
  return NO_SQUARE;
}

} // namespace sightline
