#pragma once
#include <string>
#include "sightline/board.hpp"
#include "sightline/move.hpp"

namespace sightline {

// "e4" style names; "-" for NO_SQUARE.
std::string square_name(Square s);

// Parses "a1".."h8"; throws std::invalid_argument otherwise.
Square parse_square(const std::string& name);

// FEN letter of a piece ('N', 'p', ...), '.' for an empty square.
char piece_char(ColorPiece cp);

// "white knight", "black pawn", "empty".
std::string piece_name(ColorPiece cp);

const char* color_name(Color c);

// Accepts "white"/"black"/"w"/"b" in any case; throws std::invalid_argument.
Color parse_color(const std::string& s);

const char* direction_name(int direction);

// Long algebraic, e.g. "e2e4", "a7a8q".
std::string move_to_uci(const Move& m);

// Eight text rows, rank 8 first, with file letters underneath.
std::string board_to_ascii(const Board& b);

} // namespace sightline
