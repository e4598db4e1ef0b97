#include "sightline/tactics.hpp"
#include "sightline/attack_index.hpp"
#include "sightline/errors.hpp"
#include "sightline/queries.hpp"
#include "sightline/ray.hpp"
#include "sightline/values.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace sightline {
namespace {

// Squares the piece on `from` could step to by its movement pattern alone:
// no legality, but sliders stop at blockers and pawns push only into gaps.
std::vector<Square> reachable_squares(const Board& b, Square from, ColorPiece cp) {
  std::vector<Square> out;
  if (cp.piece == Piece::Pawn) {
    const int dr = (cp.color == Color::White ? +1 : -1);
    const int start = (cp.color == Color::White ? 1 : 6);
    const int f = file_of(from), r = rank_of(from);
    if (on_board(f, r + dr) && b.empty(make_square(f, r + dr))) {
      out.push_back(make_square(f, r + dr));
      if (r == start && b.empty(make_square(f, r + 2 * dr)))
        out.push_back(make_square(f, r + 2 * dr));
    }
    const int ep_rank = (cp.color == Color::White ? 5 : 2);
    for (const RayStep& st : cast(b, from, attack_set(cp))) {
      const bool ep = st.square == b.ep_square() && rank_of(st.square) == ep_rank;
      if ((st.blocker && st.occupant.color != cp.color) || ep)
        out.push_back(st.square);
    }
    return out;
  }
  for (const RayStep& st : cast(b, from, attack_set(cp))) {
    if (st.blocker && st.occupant.color == cp.color) continue;
    out.push_back(st.square);
  }
  return out;
}

std::vector<PlacedPiece> enemy_targets(const Board& b, const std::vector<Square>& squares, Color us) {
  std::vector<PlacedPiece> out;
  for (Square t : squares) {
    const ColorPiece occ = b.at(t);
    if (!occ.empty() && occ.color != us) out.push_back(PlacedPiece{t, occ});
  }
  return out;
}

int total_value(const std::vector<PlacedPiece>& targets) {
  int v = 0;
  for (const auto& t : targets) v += piece_value(t.piece.piece);
  return v;
}

} // namespace

bool PinRecord::allows(Square s) const {
  if (s == NO_SQUARE || king == NO_SQUARE) return false;
  return direction_between(king, s) == direction && square_distance(king, s) <= square_distance(king, pinner);
}

void require_kings(const Board& b) {
  for (Color c : {Color::White, Color::Black}) {
    const int n = b.king_count(c);
    if (n != 1)
      throw MalformedBoard("expected exactly one " + std::string(c == Color::White ? "white" : "black") +
                           " king, found " + std::to_string(n));
  }
}

std::vector<PinRecord> scan_pins(const Board& b, Color color) {
  std::vector<PinRecord> pins;
  const Square k = b.find_king(color);
  if (k == NO_SQUARE) return pins;

  for (int d = 0; d < DIR_N_COUNT; ++d) {
    const Square first = first_blocker(b, k, d);
    if (first == NO_SQUARE) continue;
    const ColorPiece fp = b.at(first);
    if (fp.color != color) continue;

    const Square second = first_blocker(b, first, d);
    if (second == NO_SQUARE) continue;
    const ColorPiece sp = b.at(second);
    if (sp.color == color || !slides_along(sp.piece, d)) continue;

    PinRecord pr;
    pr.pinned = first;
    pr.pinned_piece = fp;
    pr.pinner = second;
    pr.pinner_piece = sp;
    pr.king = k;
    pr.direction = d;
    pins.push_back(pr);
  }
  return pins;
}

std::vector<PinRecord> find_pins(const Board& b, Color color) {
  require_kings(b);
  return scan_pins(b, color);
}

std::vector<SkewerRecord> find_skewers(const Board& b, Color attacker) {
  std::vector<SkewerRecord> out;
  U64 own = b.pieces(attacker);
  while (own) {
    const Square s = __builtin_ctzll(own);
    own &= own - 1;
    const ColorPiece ap = b.at(s);
    if (!is_slider(ap.piece)) continue;

    for (int d = 0; d < DIR_N_COUNT; ++d) {
      if (!slides_along(ap.piece, d)) continue;
      const Square front = first_blocker(b, s, d);
      if (front == NO_SQUARE) continue;
      const ColorPiece fp = b.at(front);
      if (fp.color == attacker) continue;
      const Square back = first_blocker(b, front, d);
      if (back == NO_SQUARE) continue;
      const ColorPiece bp = b.at(back);
      if (bp.color == attacker) continue;

      SkewerRecord sr;
      if (bp.piece == Piece::King) {
        sr.kind = SkewerKind::Pin;
      } else {
        const int fv = piece_value(fp.piece), bv = piece_value(bp.piece);
        if (fv == bv) continue;
        sr.kind = (fv < bv ? SkewerKind::Skewer : SkewerKind::Reverse);
      }
      sr.attacker = s;
      sr.attacker_piece = ap;
      sr.front = front;
      sr.front_piece = fp;
      sr.back = back;
      sr.back_piece = bp;
      sr.direction = d;
      out.push_back(sr);
    }
  }
  return out;
}

std::vector<ForkRecord> find_forks(const Board& b, Color color) {
  std::vector<ForkRecord> out;
  const AttackIndex idx = AttackIndex::build(b, color);
  U64 own = b.pieces(color);
  while (own) {
    const Square s = __builtin_ctzll(own);
    own &= own - 1;
    auto targets = enemy_targets(b, idx.attacks_from(s), color);
    if (targets.size() < 2) continue;
    ForkRecord fr;
    fr.forker = s;
    fr.forker_piece = b.at(s);
    fr.total_value = total_value(targets);
    fr.targets = std::move(targets);
    out.push_back(std::move(fr));
  }
  return out;
}

std::vector<ForkSquare> find_fork_squares(const Board& b, Color color) {
  std::vector<ForkSquare> out;
  if (__builtin_popcountll(b.pieces(other(color))) < 2) return out;

  U64 own = b.pieces(color);
  while (own) {
    const Square from = __builtin_ctzll(own);
    own &= own - 1;
    const ColorPiece cp = b.at(from);

    for (Square to : reachable_squares(b, from, cp)) {
      Board moved = b.without(from);
      if (cp.piece == Piece::Pawn && to == b.ep_square() && b.empty(to) && file_of(to) != file_of(from))
        moved.clear_square(make_square(file_of(to), rank_of(from)));
      moved.set_piece(cp.color, cp.piece, to);

      const AttackIndex idx = AttackIndex::build(moved, color);
      auto targets = enemy_targets(moved, idx.attacks_from(to), color);
      if (targets.size() < 2) continue;

      ForkSquare fs;
      fs.from = from;
      fs.piece = cp;
      fs.to = to;
      fs.captures = b.at(to);
      fs.total_value = total_value(targets);
      fs.targets = std::move(targets);
      fs.safe = (cp.piece == Piece::King) ? !is_attacked(moved, to, other(color))
                                          : !is_hanging(moved, to);
      out.push_back(std::move(fs));
    }
  }

  std::stable_sort(out.begin(), out.end(), [](const ForkSquare& a, const ForkSquare& c) {
    return a.total_value > c.total_value;
  });
  return out;
}

std::vector<DiscoveryRecord> find_discoveries(const Board& b, Color color) {
  require_kings(b);
  std::vector<DiscoveryRecord> out;
  U64 own = b.pieces(color);
  while (own) {
    const Square s = __builtin_ctzll(own);
    own &= own - 1;
    const ColorPiece sp = b.at(s);
    if (!is_slider(sp.piece)) continue;

    for (int d = 0; d < DIR_N_COUNT; ++d) {
      if (!slides_along(sp.piece, d)) continue;
      const Square q = first_blocker(b, s, d);
      if (q == NO_SQUARE || b.at(q).color != color) continue;

      // Line of sight with the masking piece lifted off the board.
      const Board lifted = b.without(q);
      const auto ray = cast(lifted, s, d);
      if (ray.empty() || !ray.back().blocker) continue;
      const RayStep& hit = ray.back();
      if (hit.occupant.color == color) continue;

      DiscoveryRecord dr;
      dr.slider = s;
      dr.slider_piece = sp;
      dr.blocker = q;
      dr.blocker_piece = b.at(q);
      dr.target = hit.square;
      dr.target_piece = hit.occupant;
      dr.direction = d;
      dr.is_check = (hit.occupant.piece == Piece::King);
      out.push_back(dr);
    }
  }
  return out;
}

} // namespace sightline
