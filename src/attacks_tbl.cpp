#include "sightline/attacks_tbl.hpp"
#include "sightline/types.hpp"


namespace sightline {

static AttackTables build() {
  AttackTables T{};

  // Knight jumps, listed in the same clockwise order as the rays
  static constexpr int KN_DF[8] = {+1, +2, +2, +1, -1, -2, -2, -1};
  static constexpr int KN_DR[8] = {+2, +1, -1, -2, -2, -1, +1, +2};
  for (int s = 0; s < 64; ++s) {
    int f0 = file_of(s), r0 = rank_of(s);
    int n = 0;
    for (int i = 0; i < 8; ++i) {
      int f = f0 + KN_DF[i], r = r0 + KN_DR[i];
      if (!on_board(f, r)) continue;
      T.knight_to[s][n++] = make_square(f, r);
    }
    T.knight_sz[s] = static_cast<uint8_t>(n);
  }

  // King steps: 8 neighbors in direction order
  for (int s = 0; s < 64; ++s) {
    int f0 = file_of(s), r0 = rank_of(s);
    int n = 0;
    for (int d = 0; d < DIR_N_COUNT; ++d) {
      int f = f0 + DIR_DF[d], r = r0 + DIR_DR[d];
      if (!on_board(f, r)) continue;
      T.king_to[s][n++] = make_square(f, r);
    }
    T.king_sz[s] = static_cast<uint8_t>(n);
  }

  // Pawn captures: white goes up the board, black down; west before east
  for (int c = 0; c < COLOR_N; ++c) {
    const int dr = (c == 0 ? +1 : -1);
    for (int s = 0; s < 64; ++s) {
      int n = 0;
      for (int df : {-1, +1}) {
        int f = file_of(s) + df, r = rank_of(s) + dr;
        if (!on_board(f, r)) continue;
        T.pawn_to[c][s][n++] = make_square(f, r);
      }
      T.pawn_sz[c][s] = static_cast<uint8_t>(n);
    }
  }

  // Rays
  for (int s = 0; s < 64; ++s) {
    for (int d = 0; d < DIR_N_COUNT; ++d) {
      int f = file_of(s) + DIR_DF[d], r = rank_of(s) + DIR_DR[d];
      int n = 0;
      while (on_board(f, r)) {
        T.rays[d][s][n++] = make_square(f, r);
        f += DIR_DF[d]; r += DIR_DR[d];
      }
      T.ray_len[d][s] = static_cast<uint8_t>(n);
    }
  }

  return T;
}

const AttackTables& ATT() {
  static const AttackTables T = build();
  return T;
}

} // namespace sightline
