#pragma once
#include <array>
#include <cstdint>

namespace sightline {

// Direction indices in scan order (clockwise from north). Every ray scan
// walks directions in this order so result ordering is stable.
enum : int { DIR_N=0, DIR_NE=1, DIR_E=2, DIR_SE=3, DIR_S=4, DIR_SW=5, DIR_W=6, DIR_NW=7, DIR_NONE=-1 };

constexpr int DIR_N_COUNT = 8;
inline constexpr int DIR_DF[8] = { 0, +1, +1, +1,  0, -1, -1, -1};
inline constexpr int DIR_DR[8] = {+1, +1,  0, -1, -1, -1,  0, +1};

struct AttackTables {
  // Knight / King targets (variable-size lists)
  std::array<std::array<int,8>,64>   knight_to{};
  std::array<uint8_t,64>             knight_sz{};
  std::array<std::array<int,8>,64>   king_to{};
  std::array<uint8_t,64>             king_sz{};

  // Pawn capture targets per color: [color][square], at most two
  std::array<std::array<std::array<int,2>,64>,2> pawn_to{};
  std::array<std::array<uint8_t,64>,2>           pawn_sz{};

  // Rays: for each direction, up to 7 squares to the edge
  std::array<std::array<std::array<int,7>,64>,8> rays{};
  std::array<std::array<uint8_t,64>,8>           ray_len{};
};

// Singleton accessor (built once, reused everywhere, never modified)
const AttackTables& ATT();

} // namespace sightline
