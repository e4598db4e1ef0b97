#include "sightline/exchange.hpp"
#include "sightline/attack_index.hpp"
#include "sightline/errors.hpp"
#include "sightline/notation.hpp"
#include "sightline/tactics.hpp"
#include "sightline/values.hpp"

#include <algorithm>

namespace sightline {
namespace {

// Each capture removes one piece, so no sequence can be longer than this.
constexpr int MAX_EXCHANGE_PLIES = 32;

bool pinned_off_line(const std::vector<PinRecord>& pins, Square from, Square target) {
  for (const auto& p : pins)
    if (p.pinned == from && !p.allows(target)) return true;
  return false;
}

// Cheapest piece of `side` that may capture on `s` in the current position,
// or NO_SQUARE. A king only captures when nothing can take it back.
Square least_valuable_attacker(const Board& b, Square s, Color side) {
  const AttackIndex idx = AttackIndex::build(b, side);
  const auto pins = scan_pins(b, side);

  Square best = NO_SQUARE;
  int best_val = 0;
  for (const AttackRecord& rec : idx.direct(s)) {
    if (pinned_off_line(pins, rec.from, s)) continue;
    const int v = piece_value(rec.attacker.piece);
    if (best == NO_SQUARE || v < best_val) { best = rec.from; best_val = v; }
  }

  if (best != NO_SQUARE && b.piece_at(best) == Piece::King) {
    Board after = b.without(best);
    after.set_piece(side, Piece::King, s);
    if (AttackIndex::build(after, other(side)).attacked(s)) return NO_SQUARE;
  }
  return best;
}

} // namespace

ExchangeResult evaluate_exchange(const Board& b, Square s) {
  ExchangeResult res;
  res.square = s;
  res.occupant = b.at(s);
  if (res.occupant.empty())
    throw InvalidQuery("exchange requested on empty square " + square_name(s));
  if (res.occupant.piece == Piece::King)
    throw InvalidQuery("exchange requested on king square " + square_name(s));

  Board work = b;
  Color side = other(res.occupant.color);
  res.initiator = side;

  // gain[k]: material for the side making capture k+1, assuming nobody
  // recaptures afterwards.
  std::vector<int> gain;
  ColorPiece on_square = res.occupant;
  for (int ply = 0; ply < MAX_EXCHANGE_PLIES; ++ply) {
    const Square from = least_valuable_attacker(work, s, side);
    if (from == NO_SQUARE) break;
    const ColorPiece cp = work.at(from);
    res.sequence.push_back(ExchangeStep{from, cp, on_square});

    const int taken = piece_value(on_square.piece);
    gain.push_back(gain.empty() ? taken : taken - gain.back());

    work.clear_square(from);
    work.set_piece(cp.color, cp.piece, s);
    on_square = cp;
    side = other(side);
  }

  if (gain.empty()) return res;

  // Fold from the end: each side may decline to continue.
  const std::vector<int> raw = gain;
  for (std::size_t k = gain.size() - 1; k > 0; --k)
    gain[k - 1] = -std::max(-gain[k - 1], gain[k]);
  res.gain = gain[0];

  res.played = 1;
  for (std::size_t k = 1; k < gain.size(); ++k) {
    if (gain[k] > -raw[k - 1]) res.played = k + 1;
    else break;
  }
  return res;
}

} // namespace sightline
