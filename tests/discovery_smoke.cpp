#include <cassert>
#include "sightline/attacks_tbl.hpp"
#include "sightline/errors.hpp"
#include "sightline/fen.hpp"
#include "sightline/notation.hpp"
#include "sightline/tactics.hpp"

using namespace sightline;

static Square sq(const char* name) { return parse_square(name); }

int main() {
  // Knight masks the rook from the king: discovered check
  {
    Board b = board_from_fen("4k3/8/8/8/4N3/8/8/4RK2 w - - 0 1");
    auto ds = find_discoveries(b, Color::White);
    assert(ds.size() == 1);
    const DiscoveryRecord& d = ds[0];
    assert(d.slider == sq("e1") && d.blocker == sq("e4") && d.target == sq("e8"));
    assert(d.direction == DIR_N);
    assert(d.is_check);
    assert(d.blocker_piece.piece == Piece::Knight);
    assert(b.at(sq("e4")).piece == Piece::Knight); // input untouched
  }

  // Discovered attack on a rook
  {
    Board b = board_from_fen("4k3/8/8/3r4/8/1N6/B7/4K3 w - - 0 1");
    auto ds = find_discoveries(b, Color::White);
    assert(ds.size() == 1);
    assert(ds[0].slider == sq("a2") && ds[0].blocker == sq("b3"));
    assert(ds[0].target == sq("d5") && ds[0].target_piece.piece == Piece::Rook);
    assert(!ds[0].is_check);
  }

  // Enemy piece in the way, or empty line behind the mask
  {
    assert(find_discoveries(board_from_fen("4k3/8/8/8/4n3/8/8/4RK2 w - - 0 1"), Color::White).empty());
    assert(find_discoveries(board_from_fen("3k4/8/8/8/4N3/8/8/4RK2 w - - 0 1"), Color::White).empty());
  }

  // Needs both kings
  {
    bool threw = false;
    try { find_discoveries(board_from_fen("8/8/8/8/4N3/8/8/4R3 w - - 0 1"), Color::White); }
    catch (const MalformedBoard&) { threw = true; }
    assert(threw);
  }

  return 0;
}
