#include "sightline/queries.hpp"
#include "sightline/errors.hpp"
#include "sightline/notation.hpp"

#include <utility>

namespace sightline {

static void require_piece(const Board& b, Square s, const char* what) {
  if (s < 0 || s > 63) throw InvalidQuery(std::string(what) + ": square out of range");
  if (b.empty(s)) throw InvalidQuery(std::string(what) + ": no piece on " + square_name(s));
}

// Shared by is_hanging and the batch helpers once the index already exists.
static bool hanging_with(const Board& b, Square s, const AttackIndex& enemy) {
  const ColorPiece cp = b.at(s);
  if (cp.empty() || cp.piece == Piece::King) return false;
  if (!enemy.attacked(s)) return false;
  const ExchangeResult ex = evaluate_exchange(b, s);
  return ex.capturable() && ex.gain >= 0;
}

AttackList get_attackers(const Board& b, Square s, Color by) {
  if (s < 0 || s > 63) throw InvalidQuery("get_attackers: square out of range");
  return AttackIndex::build(b, by).direct(s);
}

AttackList get_defenders(const Board& b, Square s) {
  require_piece(b, s, "get_defenders");
  return get_attackers(b, s, b.at(s).color);
}

bool is_attacked(const Board& b, Square s, Color by) {
  return !get_attackers(b, s, by).empty();
}

int attack_count(const Board& b, Square s, Color by) {
  return static_cast<int>(get_attackers(b, s, by).size());
}

int defense_count(const Board& b, Square s) {
  return static_cast<int>(get_defenders(b, s).size());
}

bool is_hanging(const Board& b, Square s) {
  if (s < 0 || s > 63) throw InvalidQuery("is_hanging: square out of range");
  const ColorPiece cp = b.at(s);
  if (cp.empty()) return false;
  return hanging_with(b, s, AttackIndex::build(b, other(cp.color)));
}

bool is_protected(const Board& b, Square s) {
  require_piece(b, s, "is_protected");
  return !is_hanging(b, s);
}

std::vector<PlacedPiece> find_hanging_pieces(const Board& b, Color c) {
  std::vector<PlacedPiece> out;
  const AttackIndex enemy = AttackIndex::build(b, other(c));
  U64 own = b.pieces(c);
  while (own) {
    const Square s = __builtin_ctzll(own);
    own &= own - 1;
    if (hanging_with(b, s, enemy)) out.push_back(PlacedPiece{s, b.at(s)});
  }
  return out;
}

std::vector<PlacedPiece> find_undefended_pieces(const Board& b, Color c) {
  std::vector<PlacedPiece> out;
  const AttackIndex friends = AttackIndex::build(b, c);
  U64 own = b.pieces(c) & ~b.pieces(c, Piece::King);
  while (own) {
    const Square s = __builtin_ctzll(own);
    own &= own - 1;
    if (!friends.attacked(s)) out.push_back(PlacedPiece{s, b.at(s)});
  }
  return out;
}

SquareReport analyze_square(const Board& b, Square s) {
  if (s < 0 || s > 63) throw InvalidQuery("analyze_square: square out of range");
  const BoardAttacks atk = BoardAttacks::build(b);

  SquareReport r;
  r.square = s;
  r.occupant = b.at(s);
  r.white_attackers = atk.white.direct(s);
  r.black_attackers = atk.black.direct(s);
  if (r.occupant.empty()) return r;

  const AttackIndex& enemy = atk.of(other(r.occupant.color));
  r.defenders = atk.of(r.occupant.color).direct(s);
  r.hanging = hanging_with(b, s, enemy);
  r.protected_ = !r.hanging;
  if (r.occupant.piece != Piece::King && enemy.attacked(s)) {
    ExchangeResult ex = evaluate_exchange(b, s);
    if (ex.capturable()) r.exchange = std::move(ex);
  }
  return r;
}

} // namespace sightline
