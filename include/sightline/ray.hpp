#pragma once
#include <vector>
#include "sightline/attacks_tbl.hpp"
#include "sightline/board.hpp"

namespace sightline {

// One square visited by a scan. For sliding rays `blocker` marks the first
// occupied square, which is also the last element of that ray.
struct RayStep {
  Square square = NO_SQUARE;
  ColorPiece occupant{};
  bool blocker = false;
  int direction = DIR_NONE; // DIR_NONE for leaper patterns
};

enum class DirectionSet {
  Orthogonal,          // N, E, S, W
  Diagonal,            // NE, SE, SW, NW
  All,                 // all eight, N..NW
  Knight,
  King,
  WhitePawnCaptures,
  BlackPawnCaptures,
};

// Walk one direction to the first blocker (inclusive) or the board edge.
std::vector<RayStep> cast(const Board& b, Square from, int direction);

// Sliding sets concatenate their rays in direction order; leaper sets return
// the on-board offsets and never block.
std::vector<RayStep> cast(const Board& b, Square from, DirectionSet set);

// Pattern a piece attacks with (queen -> All, white pawn -> WhitePawnCaptures, ...)
DirectionSet attack_set(ColorPiece cp);

bool in_set(DirectionSet set, int direction);
bool is_diagonal(int direction);
int opposite_direction(int direction);

// True if a piece of kind p moves along `direction` without limit.
bool slides_along(Piece p, int direction);

// Direction of the straight line from `from` to `to`, or DIR_NONE.
int direction_between(Square from, Square to);

// King-step distance between two squares.
int square_distance(Square a, Square b);

// First occupied square along a ray, or NO_SQUARE.
Square first_blocker(const Board& b, Square from, int direction);

} // namespace sightline
