#pragma once
#include <string>
#include <string_view>
#include <stdexcept>
#include "sightline/board.hpp"

namespace sightline {

struct FenError : std::runtime_error { using std::runtime_error::runtime_error; };

// Use a char[] here to avoid any toolchain hiccups with constexpr string_view
inline constexpr char STARTPOS_FEN[] =
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

// Only the placement field is mandatory; missing trailing fields default to
// "w - - 0 1". Throws FenError on anything malformed.
void set_from_fen(Board& b, std::string_view fen);
Board board_from_fen(std::string_view fen);
std::string to_fen(const Board& b);

} // namespace sightline
