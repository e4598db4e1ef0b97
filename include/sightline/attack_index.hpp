#pragma once
#include <array>
#include <vector>
#include "sightline/board.hpp"

namespace sightline {

struct AttackRecord {
  ColorPiece attacker{};
  Square from = NO_SQUARE;   // attacker square
  Square target = NO_SQUARE;
  bool xray = false;

  bool operator==(const AttackRecord& o) const {
    return attacker == o.attacker && from == o.from && target == o.target && xray == o.xray;
  }
  bool operator!=(const AttackRecord& o) const { return !(*this == o); }
};

using AttackList = std::vector<AttackRecord>;

// Everything one color attacks on a fixed board. Records are appended in scan
// order: attacker square ascending, then direction (N..NW), then distance.
// X-ray records (one blocker deep, sliders only) live in a separate table and
// never count as attacks or defences.
class AttackIndex {
public:
  static AttackIndex build(const Board& b, Color c);

  Color color() const { return color_; }

  const AttackList& direct(Square s) const { return direct_[static_cast<std::size_t>(s)]; }
  const AttackList& xray(Square s) const { return xray_[static_cast<std::size_t>(s)]; }

  // Squares the piece standing on `from` attacks directly, in scan order.
  const std::vector<Square>& attacks_from(Square from) const {
    return from_[static_cast<std::size_t>(from)];
  }

  bool attacked(Square s) const { return !direct(s).empty(); }

private:
  Color color_ = Color::White;
  std::array<AttackList, 64> direct_{};
  std::array<AttackList, 64> xray_{};
  std::array<std::vector<Square>, 64> from_{};
};

// Both colors' indexes for one board, built together for a batch of queries.
struct BoardAttacks {
  AttackIndex white;
  AttackIndex black;

  static BoardAttacks build(const Board& b) {
    return BoardAttacks{AttackIndex::build(b, Color::White), AttackIndex::build(b, Color::Black)};
  }
  const AttackIndex& of(Color c) const { return c == Color::White ? white : black; }
};

} // namespace sightline
