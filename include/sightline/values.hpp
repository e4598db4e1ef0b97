#pragma once
#include "sightline/types.hpp"

namespace sightline {

// Conventional material values (centipawns)
constexpr int VAL_NONE   = 0;
constexpr int VAL_PAWN   = 100;
constexpr int VAL_KNIGHT = 320;
constexpr int VAL_BISHOP = 330;
constexpr int VAL_ROOK   = 500;
constexpr int VAL_QUEEN  = 900;
constexpr int VAL_KING   = 20000; // ordering only; a king is never captured

inline constexpr int piece_value(Piece p) {
  switch (p) {
    case Piece::Pawn:   return VAL_PAWN;
    case Piece::Knight: return VAL_KNIGHT;
    case Piece::Bishop: return VAL_BISHOP;
    case Piece::Rook:   return VAL_ROOK;
    case Piece::Queen:  return VAL_QUEEN;
    case Piece::King:   return VAL_KING;
    default:            return VAL_NONE;
  }
}

} // namespace sightline
