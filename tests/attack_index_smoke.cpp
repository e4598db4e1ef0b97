#include <cassert>
#include "sightline/attack_index.hpp"
#include "sightline/fen.hpp"
#include "sightline/notation.hpp"

using namespace sightline;

static Square sq(const char* name) { return parse_square(name); }

int main() {
  // Rook a1 behind its own knight on c1: b1/c1 direct, d1/e1 x-ray only.
  {
    Board b = board_from_fen("4k3/8/8/8/8/8/8/R1N1K3 w - - 0 1");
    AttackIndex w = AttackIndex::build(b, Color::White);
    assert(w.color() == Color::White);

    assert(w.direct(sq("b1")).size() == 1);
    assert(w.direct(sq("c1")).size() == 1); // defends its own knight
    assert(w.direct(sq("c1"))[0].from == sq("a1"));

    const AttackList& d1 = w.direct(sq("d1"));
    assert(d1.size() == 1);
    assert(d1[0].from == sq("e1") && d1[0].attacker.piece == Piece::King);
    assert(!d1[0].xray);

    const AttackList& xd1 = w.xray(sq("d1"));
    assert(xd1.size() == 1 && xd1[0].from == sq("a1") && xd1[0].xray);
    assert(w.xray(sq("e1")).size() == 1);
    assert(w.xray(sq("f1")).empty()); // one blocker deep only

    // attacks_from: N ray first, then E ray
    const auto& from_a1 = w.attacks_from(sq("a1"));
    assert(from_a1.size() == 9);
    assert(from_a1.front() == sq("a2"));
    assert(from_a1.back() == sq("c1"));
  }

  // Records for one square keep ascending attacker-square order
  {
    Board b = board_from_fen("4k3/8/8/8/8/8/8/R3K3 w - - 0 1");
    AttackIndex w = AttackIndex::build(b, Color::White);
    const AttackList& d1 = w.direct(sq("d1"));
    assert(d1.size() == 2);
    assert(d1[0].from == sq("a1") && d1[1].from == sq("e1"));
    assert(d1[0].target == sq("d1"));
  }

  // Pawns attack diagonally only
  {
    Board b = board_from_fen("4k3/8/8/8/4P3/8/8/4K3 w - - 0 1");
    AttackIndex w = AttackIndex::build(b, Color::White);
    assert(w.attacked(sq("d5")) && w.attacked(sq("f5")));
    assert(!w.attacked(sq("e5")));
    AttackIndex k = AttackIndex::build(b, Color::Black);
    assert(k.attacked(sq("d7")) && !k.attacked(sq("e4")));
  }

  // Both colors at once
  {
    Board b = board_from_fen(STARTPOS_FEN);
    BoardAttacks all = BoardAttacks::build(b);
    assert(all.of(Color::White).attacked(sq("f3")));
    assert(!all.of(Color::White).attacked(sq("e4")));
    assert(all.of(Color::Black).attacked(sq("f6")));
    assert(all.white.direct(sq("f3")).size() == 3); // e2, g2, g1
  }

  return 0;
}
