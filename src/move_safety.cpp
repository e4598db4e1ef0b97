#include "sightline/move_safety.hpp"
#include "sightline/move_do.hpp"
#include "sightline/notation.hpp"
#include "sightline/queries.hpp"
#include "sightline/ray.hpp"
#include "sightline/values.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace sightline {

static bool contains(const std::vector<PlacedPiece>& v, const PlacedPiece& p) {
  return std::find(v.begin(), v.end(), p) != v.end();
}

// Rays of our sliders that used to run through `to` and now stop on it.
static std::vector<BlockedLine> blocked_lines(const Board& before, const Board& after,
                                              const AttackIndex& ours_before, const Move& m, Color us) {
  std::vector<BlockedLine> out;
  if (!before.empty(m.to)) return out; // a capture ends no ray that did not already end there

  U64 sliders = before.pieces(us, Piece::Bishop) | before.pieces(us, Piece::Rook) | before.pieces(us, Piece::Queen);
  while (sliders) {
    const Square s = __builtin_ctzll(sliders);
    sliders &= sliders - 1;
    if (s == m.from || after.at(s) != before.at(s)) continue;

    const ColorPiece sp = before.at(s);
    const int d = direction_between(s, m.to);
    if (!slides_along(sp.piece, d)) continue;
    if (first_blocker(after, s, d) != m.to) continue;

    BlockedLine bl;
    const int reach = square_distance(s, m.to);
    for (Square t : ours_before.attacks_from(s))
      if (direction_between(s, t) == d && square_distance(s, t) > reach) bl.lost.push_back(t);
    if (bl.lost.empty()) continue;

    bl.slider = s;
    bl.slider_piece = sp;
    bl.direction = d;
    out.push_back(std::move(bl));
  }
  return out;
}

MoveReport analyze_move(const Board& b, const Move& m) {
  MoveReport r;
  r.move = m;
  r.after = b;
  const Applied ap = apply_move(r.after, m);
  const Color us = ap.us;
  const Color them = other(us);

  r.piece = r.after.at(m.to);
  r.captured = ap.captured;
  r.captured_sq = ap.captured_sq;

  const BoardAttacks post = BoardAttacks::build(r.after);
  r.destination_attackers = post.of(them).direct(m.to);
  r.destination_defenders = post.of(us).direct(m.to);
  r.destination_attacked = !r.destination_attackers.empty();

  if (r.destination_attacked && r.piece.piece != Piece::King) {
    ExchangeResult ex = evaluate_exchange(r.after, m.to);
    if (ex.capturable()) r.exchange = std::move(ex);
  }

  const auto hanging_before = find_hanging_pieces(b, us);
  for (const PlacedPiece& p : find_hanging_pieces(r.after, us)) {
    if (p.square == m.to) continue;
    if (!contains(hanging_before, p)) r.newly_hanging.push_back(p);
  }

  const AttackIndex ours_before = AttackIndex::build(b, us);
  r.blocked_lines = blocked_lines(b, r.after, ours_before, m, us);

  const Square their_king = r.after.find_king(them);
  r.gives_check = their_king != NO_SQUARE && post.of(us).attacked(their_king);

  const bool quiet = r.captured.empty();
  r.outnumbered = quiet && r.destination_attackers.size() > r.destination_defenders.size();

  const Square our_king = b.find_king(us);
  if (our_king != NO_SQUARE && ap.moved.piece != Piece::King) {
    const AttackList& before = ours_before.direct(our_king);
    bool was_defending = false;
    for (const AttackRecord& rec : before)
      if (rec.from == m.from) was_defending = true;
    r.king_defense_lost = was_defending && post.of(us).direct(our_king).size() < before.size();
  }

  const std::string at = square_name(m.to);
  if (quiet && r.destination_attacked) {
    if (r.destination_defenders.empty())
      r.warnings.push_back(piece_name(r.piece) + " moves to " + at + " which is attacked and undefended");
    else if (r.outnumbered)
      r.warnings.push_back(at + " has more attackers (" + std::to_string(r.destination_attackers.size()) +
                           ") than defenders (" + std::to_string(r.destination_defenders.size()) + ")");
  }
  if (!quiet && r.exchange && r.exchange->gain > piece_value(r.captured.piece))
    r.warnings.push_back("capture on " + at + " loses material to the recapture");
  for (const PlacedPiece& p : r.newly_hanging)
    r.warnings.push_back(piece_name(p.piece) + " on " + square_name(p.square) + " is left hanging");
  if (r.king_defense_lost) r.warnings.push_back("this move weakens king defense");
  return r;
}

std::string quick_check(const MoveReport& r) {
  std::string out = "move: ";
  out += piece_char(r.piece);
  out += square_name(r.move.from);
  out += (r.captured.empty() ? '-' : 'x');
  out += square_name(r.move.to);
  out += '\n';
  if (r.gives_check) out += "gives check\n";
  if (!r.captured.empty()) {
    const int won = piece_value(r.captured.piece);
    const int lost = r.exchange ? r.exchange->gain : 0;
    if (lost <= 0) out += "safe capture (+" + std::to_string(won) + ")\n";
    else out += "capture may trade: +" + std::to_string(won) + " but -" + std::to_string(lost) + "\n";
  }
  for (const std::string& w : r.warnings) out += "warning: " + w + "\n";
  if (r.warnings.empty()) out += "no obvious issues\n";
  return out;
}

} // namespace sightline
