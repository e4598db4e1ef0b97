#pragma once
#include <optional>
#include <vector>
#include "sightline/attack_index.hpp"
#include "sightline/board.hpp"
#include "sightline/exchange.hpp"

namespace sightline {

// Direct (non x-ray) attackers of s belonging to `by`, in index order.
AttackList get_attackers(const Board& b, Square s, Color by);

// Attackers of s of the same color as its occupant.
// Throws InvalidQuery if s is empty.
AttackList get_defenders(const Board& b, Square s);

bool is_attacked(const Board& b, Square s, Color by);
int attack_count(const Board& b, Square s, Color by);
int defense_count(const Board& b, Square s); // throws InvalidQuery if empty

// True if the opponent can start an exchange on s and not lose material by
// it (an even trade counts). False on empty squares and on kings.
bool is_hanging(const Board& b, Square s);

// The negation of is_hanging for an occupied square. Throws InvalidQuery if empty.
bool is_protected(const Board& b, Square s);

std::vector<PlacedPiece> find_hanging_pieces(const Board& b, Color c);

// Pieces of c other than the king with no defender at all, attacked or not.
std::vector<PlacedPiece> find_undefended_pieces(const Board& b, Color c);

struct SquareReport {
  Square square = NO_SQUARE;
  ColorPiece occupant{};
  AttackList white_attackers;
  AttackList black_attackers;
  AttackList defenders;               // empty when the square is empty
  bool hanging = false;
  bool protected_ = false;            // meaningful only when occupied
  std::optional<ExchangeResult> exchange; // when the opponent can capture
};

// Everything the queries above say about one square, from one index build.
SquareReport analyze_square(const Board& b, Square s);

} // namespace sightline
