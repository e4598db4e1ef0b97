#pragma once
#include <optional>
#include <string>
#include <vector>
#include "sightline/attack_index.hpp"
#include "sightline/board.hpp"
#include "sightline/exchange.hpp"
#include "sightline/move.hpp"

namespace sightline {

// A friendly slider whose ray the moved piece now cuts short.
struct BlockedLine {
  Square slider = NO_SQUARE;
  ColorPiece slider_piece{};
  int direction = -1;
  std::vector<Square> lost; // squares it attacked before, beyond the destination
};

struct MoveReport {
  Move move{};
  ColorPiece piece{};          // piece as it stands on `to` (promoted piece if any)
  ColorPiece captured{};
  Square captured_sq = NO_SQUARE;

  AttackList destination_attackers;   // opponent, direct, on the new board
  AttackList destination_defenders;   // mover's side, direct, on the new board
  bool destination_attacked = false;

  // Exchange on `to` when the opponent can recapture right away.
  std::optional<ExchangeResult> exchange;

  // Mover's pieces (other than the moved one) hanging now but not before.
  std::vector<PlacedPiece> newly_hanging;
  std::vector<BlockedLine> blocked_lines;

  bool gives_check = false;

  // Quiet move onto a square with more enemy attackers than friendly defenders.
  bool outnumbered = false;
  // The moved piece was defending its own king, which now has fewer defenders.
  bool king_defense_lost = false;
  // One human-readable line per problem found above; empty for a quiet move.
  std::vector<std::string> warnings;

  Board after;
};

// Applies m to a copy of b and reports what it does to safety around the
// board. Throws InvalidMove (see apply_move); b is never modified.
MoveReport analyze_move(const Board& b, const Move& m);

// Short multi-line summary of a report: the move, check, capture outcome and
// warnings, or "no obvious issues".
std::string quick_check(const MoveReport& r);

} // namespace sightline
