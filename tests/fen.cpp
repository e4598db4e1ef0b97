#include <cassert>
#include <string>
#include "sightline/board.hpp"
#include "sightline/fen.hpp"

static bool rejects(const char* fen) {
  try {
    sightline::board_from_fen(fen);
  } catch (const sightline::FenError&) {
    return true;
  }
  return false;
}

int main() {
using namespace sightline;


// Round-trip startpos
Board b1;
set_from_fen(b1, STARTPOS_FEN);
assert(to_fen(b1) == STARTPOS_FEN);


// A position with castling rights only on white
Board b2;
set_from_fen(b2, "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/R3K2R w K - 0 1");
assert(to_fen(b2) == "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/R3K2R w K - 0 1");


// EP square and clocks survive
Board b3 = board_from_fen("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1");
assert(b3.ep_square() == 20);
assert(b3.side_to_move() == Color::Black);


// Placement-only FEN gets defaults
Board b4 = board_from_fen("4k3/8/8/8/8/8/8/4K3");
assert(to_fen(b4) == "4k3/8/8/8/8/8/8/4K3 w - - 0 1");


assert(rejects(""));
assert(rejects("8/8/8"));
assert(rejects("4k3/8/8/8/8/8/8/4K4 w - - 0 1"));
assert(rejects("4k3/8/8/8/8/8/8/4X3 w - - 0 1"));
assert(rejects("4k3/8/8/8/8/8/8/4K3 x - - 0 1"));
assert(rejects("4k3/8/8/8/8/8/8/4K3 w - e4 0 1"));
assert(rejects("4k3/8/8/8/8/8/8/4K3 w - - zero 1"));


return 0;
}
