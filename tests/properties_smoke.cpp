#include <cassert>
#include <vector>
#include "sightline/attack_index.hpp"
#include "sightline/fen.hpp"
#include "sightline/move_do.hpp"
#include "sightline/move_safety.hpp"
#include "sightline/notation.hpp"
#include "sightline/queries.hpp"
#include "sightline/ray.hpp"
#include "sightline/tactics.hpp"

using namespace sightline;

static const char* POSITIONS[] = {
  STARTPOS_FEN,
  "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1",
  "rnbqkbnr/ppp2ppp/3p4/4p3/4P3/5N2/PPPP1PPP/RNBQKB1R w KQkq - 0 3",
  "3k4/8/5n2/3p4/7B/2N5/8/4K3 w - - 0 1",
};

static void check_index(const Board& b) {
  for (Color c : {Color::White, Color::Black}) {
    const AttackIndex a = AttackIndex::build(b, c);
    const AttackIndex again = AttackIndex::build(b, c);
    for (Square s = 0; s < 64; ++s) {
      assert(a.direct(s) == again.direct(s));
      assert(a.xray(s) == again.xray(s));
      // a record is never both a direct attack and an x-ray
      for (const auto& x : a.xray(s))
        for (const auto& d : a.direct(s)) assert(x.from != d.from);
      for (const auto& d : a.direct(s)) assert(d.attacker.color == c && d.target == s);
    }
  }
  // No square has an attacker listed for both colors
  const BoardAttacks both = BoardAttacks::build(b);
  for (Square s = 0; s < 64; ++s)
    for (const auto& w : both.white.direct(s))
      for (const auto& k : both.black.direct(s)) assert(w.from != k.from);
}

static void check_queries(const Board& b) {
  for (Square s = 0; s < 64; ++s) {
    if (b.empty(s)) continue;
    const Color us = b.at(s).color;
    if (is_hanging(b, s)) assert(is_attacked(b, s, other(us)));
    assert(is_protected(b, s) == !is_hanging(b, s));
  }
}

static void check_pins(const Board& b) {
  for (Color c : {Color::White, Color::Black}) {
    for (const PinRecord& p : find_pins(b, c)) {
      const Board lifted = b.without(p.pinned);
      assert(first_blocker(lifted, p.king, p.direction) == p.pinner);
      for (Square t = 0; t < 64; ++t) {
        if (t == p.pinned || t == p.pinner || t == p.king || b.empty(t)) continue;
        assert(first_blocker(b.without(t), p.king, p.direction) == p.pinned);
      }
    }
  }
}

int main() {
  for (const char* fen : POSITIONS) {
    const Board b = board_from_fen(fen);
    const Board copy = b;
    check_index(b);
    check_queries(b);
    check_pins(b);
    find_skewers(b, Color::White);
    find_forks(b, Color::Black);
    find_fork_squares(b, Color::White);
    find_discoveries(b, Color::Black);
    assert(b == copy);
    assert(to_fen(b) == fen);
  }

  // Kiwipete move set: the input survives every hypothetical
  {
    const Board b = board_from_fen(POSITIONS[1]);
    const Board copy = b;
    std::vector<Move> moves;
    Move m;
    m.from = parse_square("e5"); m.to = parse_square("f7"); moves.push_back(m);
    m.from = parse_square("e1"); m.to = parse_square("g1"); m.kind = MoveKind::Castle; moves.push_back(m);
    m.from = parse_square("d5"); m.to = parse_square("e6"); m.kind = MoveKind::Normal; moves.push_back(m);
    m.from = parse_square("f3"); m.to = parse_square("f6"); moves.push_back(m);
    for (const Move& mm : moves) {
      MoveReport r = analyze_move(b, mm);
      assert(b == copy);
      assert(r.after != b);
      assert(r.after.side_to_move() == Color::Black);
      assert(r.destination_attackers == get_attackers(after_move(b, mm), mm.to, Color::Black));
    }
  }

  return 0;
}
