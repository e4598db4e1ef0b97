#include <cassert>
#include "sightline/errors.hpp"
#include "sightline/exchange.hpp"
#include "sightline/fen.hpp"
#include "sightline/notation.hpp"

using namespace sightline;

static Square sq(const char* name) { return parse_square(name); }

int main() {
  // Free knight
  {
    Board b = board_from_fen("4k3/8/8/4n3/8/8/8/4RK2 w - - 0 1");
    ExchangeResult r = evaluate_exchange(b, sq("e5"));
    assert(r.initiator == Color::White);
    assert(r.gain == 320);
    assert(r.sequence.size() == 1);
    assert(r.sequence[0].from == sq("e1"));
    assert(r.sequence[0].captured.piece == Piece::Knight);
    assert(r.played == 1);
  }

  // Knight takes a pawn defended by a pawn: forced first capture loses
  {
    Board b = board_from_fen("rnbqkbnr/ppp2ppp/3p4/4p3/4P3/5N2/PPPP1PPP/RNBQKB1R w KQkq - 0 3");
    ExchangeResult r = evaluate_exchange(b, sq("e5"));
    assert(r.gain == -220);
    assert(r.sequence.size() == 2);
    assert(r.played == 2);
  }

  // Doubled rooks: the rook behind joins once the front one has gone
  {
    Board b = board_from_fen("4r1k1/8/8/4p3/8/8/4R3/4R1K1 w - - 0 1");
    ExchangeResult r = evaluate_exchange(b, sq("e5"));
    assert(r.sequence.size() == 3);
    assert(r.sequence[0].from == sq("e2"));
    assert(r.sequence[1].from == sq("e8"));
    assert(r.sequence[2].from == sq("e1"));
    assert(r.gain == 100);
    assert(r.played == 1); // black does better not recapturing
  }

  // A defender pinned to its king off the capture line does not count
  {
    Board b = board_from_fen("3k4/8/5n2/3p4/7B/2N5/8/4K3 w - - 0 1");
    ExchangeResult r = evaluate_exchange(b, sq("d5"));
    assert(r.sequence.size() == 1);
    assert(r.sequence[0].from == sq("c3"));
    assert(r.gain == 100);
  }

  // A pinned rook may still capture along its own pin line
  {
    Board b = board_from_fen("4k3/8/4r3/8/8/8/3K4/4R3 w - - 0 1");
    ExchangeResult r = evaluate_exchange(b, sq("e1"));
    assert(r.initiator == Color::Black);
    assert(r.sequence.size() == 2);
    assert(r.sequence[0].from == sq("e6"));
    assert(r.sequence[1].piece.piece == Piece::King);
    assert(r.gain == 0);
  }

  // The king does not capture into a defended square
  {
    Board b = board_from_fen("3rk3/8/8/8/8/8/3r4/4K3 w - - 0 1");
    ExchangeResult r = evaluate_exchange(b, sq("d2"));
    assert(r.initiator == Color::White);
    assert(!r.capturable());
    assert(r.gain == 0);
  }

  // Nothing attacks the square
  {
    Board b = board_from_fen(STARTPOS_FEN);
    assert(!evaluate_exchange(b, sq("e2")).capturable());

    bool threw = false;
    try { evaluate_exchange(b, sq("e4")); } catch (const InvalidQuery&) { threw = true; }
    assert(threw);
    threw = false;
    try { evaluate_exchange(b, sq("e8")); } catch (const InvalidQuery&) { threw = true; }
    assert(threw);
  }

  return 0;
}
