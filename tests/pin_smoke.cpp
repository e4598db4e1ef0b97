#include <cassert>
#include "sightline/attacks_tbl.hpp"
#include "sightline/errors.hpp"
#include "sightline/fen.hpp"
#include "sightline/notation.hpp"
#include "sightline/ray.hpp"
#include "sightline/tactics.hpp"

using namespace sightline;

static Square sq(const char* name) { return parse_square(name); }

static bool malformed(const char* fen) {
  try { find_pins(board_from_fen(fen), Color::White); }
  catch (const MalformedBoard&) { return true; }
  return false;
}

int main() {
  // Rook pins the e-pawn to its king
  {
    Board b = board_from_fen("k3r3/8/8/8/8/8/4P3/4K3 w - - 0 1");
    auto pins = find_pins(b, Color::White);
    assert(pins.size() == 1);
    const PinRecord& p = pins[0];
    assert(p.pinned == sq("e2") && p.pinner == sq("e8") && p.king == sq("e1"));
    assert(p.direction == DIR_N);
    assert(p.pinned_piece.piece == Piece::Pawn);
    assert(p.pinner_piece == (ColorPiece{Color::Black, Piece::Rook}));
    assert(p.allows(sq("e4")) && p.allows(sq("e8")));
    assert(!p.allows(sq("d3")));
    assert(find_pins(b, Color::Black).empty());

    // Lifting the pinned piece exposes the king to the pinner
    Board lifted = b.without(p.pinned);
    assert(first_blocker(lifted, p.king, p.direction) == p.pinner);
  }

  // Enemy piece first on the line: no pin
  {
    Board b = board_from_fen("k7/8/8/8/4r3/8/4n3/4K3 w - - 0 1");
    assert(find_pins(b, Color::White).empty());
  }

  // Two friendly pieces between king and slider: no pin
  {
    Board b = board_from_fen("k3r3/8/8/8/4B3/8/4P3/4K3 w - - 0 1");
    assert(find_pins(b, Color::White).empty());
  }

  // A rook does not pin along a diagonal, a bishop does
  {
    assert(find_pins(board_from_fen("k7/8/8/8/8/2r5/3P4/4K3 w - - 0 1"), Color::White).empty());
    auto pins = find_pins(board_from_fen("k7/8/8/8/8/2b5/3P4/4K3 w - - 0 1"), Color::White);
    assert(pins.size() == 1);
    assert(pins[0].direction == DIR_NW && pins[0].pinned == sq("d2"));
  }

  // Two pins at once, reported in direction order
  {
    Board b = board_from_fen("4k3/8/8/8/q7/8/2P5/3KB2q w - - 0 1");
    auto pins = find_pins(b, Color::White);
    assert(pins.size() == 2);
    assert(pins[0].pinned == sq("e1") && pins[0].direction == DIR_E);
    assert(pins[1].pinned == sq("c2") && pins[1].direction == DIR_NW);
    assert(pins[1].pinner == sq("a4"));
  }

  // King count is checked
  {
    assert(malformed("8/8/8/8/8/8/4P3/4K3 w - - 0 1"));
    assert(malformed("k3k3/8/8/8/8/8/4P3/4K3 w - - 0 1"));
    assert(!malformed("k7/8/8/8/8/8/4P3/4K3 w - - 0 1"));
    assert(scan_pins(board_from_fen("8/8/8/8/8/8/4P3/8 w - - 0 1"), Color::White).empty());
  }

  return 0;
}
