#pragma once
#include "sightline/move.hpp"
#include "sightline/board.hpp"

namespace sightline {

// What apply_move changed, for reporting.
struct Applied {
  Color   us{Color::White};          // side who moved
  ColorPiece moved{};                // piece that moved (pre-promo)
  ColorPiece captured{};             // captured piece (if any)
  Square  captured_sq{NO_SQUARE};    // where the captured piece sat
};

// Plays m on b mechanically according to its kind tag. The mover is the
// piece on m.from, whatever the side to move says. Throws InvalidMove when
// m.from is empty, m is tagged illegal, or its kind cannot be applied.
Applied apply_move(Board& b, const Move& m);

// Copy-then-apply; the input board is left untouched.
Board after_move(const Board& b, const Move& m);

} // namespace sightline
