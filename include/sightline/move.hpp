#pragma once
#include <cstdint>
#include "sightline/types.hpp"


namespace sightline {


// Special-move tag supplied by the move generator; analyses trust it.
enum class MoveKind : uint8_t {
Normal = 0,
EnPassant = 1,
Castle = 2,
Promotion = 3,
};


struct Move {
Square from{0};
Square to{0};
MoveKind kind{MoveKind::Normal};
Piece promo{Piece::None};
bool legal{true}; // caller's legality verdict
};


} // namespace sightline
