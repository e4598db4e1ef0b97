#include <cassert>
#include "sightline/attacks_tbl.hpp"
#include "sightline/fen.hpp"
#include "sightline/notation.hpp"
#include "sightline/tactics.hpp"

using namespace sightline;

static Square sq(const char* name) { return parse_square(name); }

int main() {
  // Rook through a knight onto the queen behind it
  {
    Board b = board_from_fen("7k/q7/8/8/n7/8/8/R6K w - - 0 1");
    auto sk = find_skewers(b, Color::White);
    assert(sk.size() == 1);
    assert(sk[0].kind == SkewerKind::Skewer);
    assert(sk[0].attacker == sq("a1"));
    assert(sk[0].front == sq("a4") && sk[0].back == sq("a7"));
    assert(sk[0].back_piece.piece == Piece::Queen);
    assert(sk[0].direction == DIR_N);
    assert(find_skewers(b, Color::Black).empty());
  }

  // King behind the front piece: a pin
  {
    Board b = board_from_fen("k7/8/8/n7/8/8/8/R6K w - - 0 1");
    auto sk = find_skewers(b, Color::White);
    assert(sk.size() == 1);
    assert(sk[0].kind == SkewerKind::Pin);
    assert(sk[0].back_piece.piece == Piece::King);
  }

  // King in front of the queen
  {
    Board b = board_from_fen("4q3/8/8/8/4k3/8/8/4R2K b - - 0 1");
    auto sk = find_skewers(b, Color::White);
    assert(sk.size() == 1);
    assert(sk[0].kind == SkewerKind::Reverse);
    assert(sk[0].front == sq("e4") && sk[0].back == sq("e8"));
  }

  // Equal pieces in a row are not a line tactic
  {
    Board b = board_from_fen("k7/n7/8/8/n7/8/8/R6K w - - 0 1");
    assert(find_skewers(b, Color::White).empty());
  }

  // A friendly piece between attacker and targets stops the scan
  {
    Board b = board_from_fen("7k/q7/8/8/n7/N7/8/R6K w - - 0 1");
    assert(find_skewers(b, Color::White).empty());
  }

  // Bishops only use diagonals
  {
    Board b = board_from_fen("7k/8/8/8/r7/8/8/B1r4K w - - 0 1");
    assert(find_skewers(b, Color::White).empty());
    Board d = board_from_fen("7k/6q1/8/8/3n4/8/8/B6K w - - 0 1");
    auto sk = find_skewers(d, Color::White);
    assert(sk.size() == 1 && sk[0].direction == DIR_NE && sk[0].kind == SkewerKind::Skewer);
  }

  return 0;
}
