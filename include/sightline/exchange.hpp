#pragma once
#include <cstddef>
#include <vector>
#include "sightline/board.hpp"

namespace sightline {

struct ExchangeStep {
  Square from = NO_SQUARE;
  ColorPiece piece{};     // capturing piece
  ColorPiece captured{};  // piece it takes on the exchange square
};

struct ExchangeResult {
  Square square = NO_SQUARE;
  ColorPiece occupant{};          // piece standing there before the exchange
  Color initiator = Color::White; // side making the first capture
  int gain = 0;                   // material for the initiator with best stopping play
  std::vector<ExchangeStep> sequence; // full forced sequence, least valuable attacker first
  std::size_t played = 0;         // captures actually made when both sides stop optimally

  bool capturable() const { return !sequence.empty(); }
};

// Static exchange evaluation on the occupied square `s`. The side not owning
// the occupant captures first; each step re-derives attackers from the
// mutated copy so pieces behind a vacated square join in, and skips pieces
// pinned off the line through `s`. Throws InvalidQuery on an empty square or
// a king.
ExchangeResult evaluate_exchange(const Board& b, Square s);

} // namespace sightline
