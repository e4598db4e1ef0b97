#include "sightline/attack_index.hpp"
#include "sightline/ray.hpp"

namespace sightline {

AttackIndex AttackIndex::build(const Board& b, Color c) {
  AttackIndex idx;
  idx.color_ = c;
  const auto& T = ATT();

  U64 own = b.pieces(c);
  while (own) {
    const Square s = __builtin_ctzll(own);
    own &= own - 1;
    const ColorPiece cp = b.at(s);
    const DirectionSet set = attack_set(cp);

    for (const RayStep& st : cast(b, s, set)) {
      idx.direct_[static_cast<std::size_t>(st.square)].push_back(AttackRecord{cp, s, st.square, false});
      idx.from_[static_cast<std::size_t>(s)].push_back(st.square);
    }

    if (!is_slider(cp.piece)) continue;

    // Secondary pass: look through the first blocker up to the next piece.
    for (int d = 0; d < DIR_N_COUNT; ++d) {
      if (!in_set(set, d)) continue;
      const Square blocker = first_blocker(b, s, d);
      if (blocker == NO_SQUARE) continue;
      const int n = T.ray_len[d][blocker];
      for (int i = 0; i < n; ++i) {
        const Square t = T.rays[d][blocker][i];
        idx.xray_[static_cast<std::size_t>(t)].push_back(AttackRecord{cp, s, t, true});
        if (!b.empty(t)) break;
      }
    }
  }
  return idx;
}

} // namespace sightline
