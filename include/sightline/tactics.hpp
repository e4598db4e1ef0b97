#pragma once
#include <vector>
#include "sightline/board.hpp"

namespace sightline {

// A piece of `king`'s color standing between its king and an enemy slider
// that moves along that line. `direction` points from the king outward.
struct PinRecord {
  Square pinned = NO_SQUARE;
  ColorPiece pinned_piece{};
  Square pinner = NO_SQUARE;
  ColorPiece pinner_piece{};
  Square king = NO_SQUARE;
  int direction = -1;

  // True if the pinned piece may move to `s` without leaving the pin line.
  bool allows(Square s) const;
};

enum class SkewerKind {
  Pin,      // back piece is the king
  Skewer,   // front piece is worth less than the (non-king) back piece
  Reverse,  // front piece outranks the back piece; it moves and the back one falls
};

struct SkewerRecord {
  Square attacker = NO_SQUARE;
  ColorPiece attacker_piece{};
  Square front = NO_SQUARE;
  ColorPiece front_piece{};
  Square back = NO_SQUARE;
  ColorPiece back_piece{};
  int direction = -1;
  SkewerKind kind = SkewerKind::Skewer;
};

struct ForkRecord {
  Square forker = NO_SQUARE;
  ColorPiece forker_piece{};
  std::vector<PlacedPiece> targets;
  int total_value = 0;
};

// A square a piece could go to (ignoring legality beyond its movement
// pattern) from which it would attack two or more enemy pieces.
struct ForkSquare {
  Square from = NO_SQUARE;
  ColorPiece piece{};
  Square to = NO_SQUARE;
  std::vector<PlacedPiece> targets;
  int total_value = 0;
  ColorPiece captures{};  // piece standing on `to`, if any
  bool safe = true;       // opponent does not win material on `to`
};

struct DiscoveryRecord {
  Square slider = NO_SQUARE;
  ColorPiece slider_piece{};
  Square blocker = NO_SQUARE;
  ColorPiece blocker_piece{};
  Square target = NO_SQUARE;
  ColorPiece target_piece{};
  int direction = -1;
  bool is_check = false;
};

// Throws MalformedBoard unless each color has exactly one king.
void require_kings(const Board& b);

// Pieces of `color` absolutely pinned to their own king. Throws MalformedBoard.
std::vector<PinRecord> find_pins(const Board& b, Color color);

// Same scan without the king check: no king, no pins.
std::vector<PinRecord> scan_pins(const Board& b, Color color);

// Line tactics created by the sliders of `attacker`.
std::vector<SkewerRecord> find_skewers(const Board& b, Color attacker);

// Pieces of `color` attacking two or more enemy pieces right now.
std::vector<ForkRecord> find_forks(const Board& b, Color color);

// Squares where a piece of `color` would fork, best total value first.
std::vector<ForkSquare> find_fork_squares(const Board& b, Color color);

// Friendly pieces of `color` masking one of its sliders from an enemy piece.
// Throws MalformedBoard.
std::vector<DiscoveryRecord> find_discoveries(const Board& b, Color color);

} // namespace sightline
