#include "sightline/move_do.hpp"
#include "sightline/errors.hpp"
#include "sightline/notation.hpp"
#include <cstdlib>

namespace sightline {

static inline void clear_rights_after_move(unsigned& r, Color side, Piece moved, Square from){
  if (moved == Piece::King) {
    if (side == Color::White) r &= ~(0x1u | 0x2u);
    else                      r &= ~(0x4u | 0x8u);
  } else if (moved == Piece::Rook) {
    if (side == Color::White) {
      if (from == 7)  r &= ~0x1u; // h1 -> K
      if (from == 0)  r &= ~0x2u; // a1 -> Q
    } else {
      if (from == 63) r &= ~0x4u; // h8 -> k
      if (from == 56) r &= ~0x8u; // a8 -> q
    }
  }
}

static inline void clear_rights_after_capture(unsigned& r, Piece captured, Square cap_sq){
  if (captured != Piece::Rook) return;
  if (cap_sq == 7)  r &= ~0x1u;
  if (cap_sq == 0)  r &= ~0x2u;
  if (cap_sq == 63) r &= ~0x4u;
  if (cap_sq == 56) r &= ~0x8u;
}

static void fail(const Move& m, const std::string& why) {
  throw InvalidMove(move_to_uci(m) + ": " + why);
}

static void check_squares(const Move& m) {
  if (m.from < 0 || m.from > 63 || m.to < 0 || m.to > 63 || m.from == m.to)
    throw InvalidMove("move has bad squares");
}

Applied apply_move(Board& b, const Move& m) {
  check_squares(m);
  if (!m.legal) fail(m, "tagged illegal by caller");

  Applied ap;
  ap.moved = b.at(m.from);
  if (ap.moved.empty()) fail(m, "no piece on " + square_name(m.from));
  ap.us = ap.moved.color;

  const ColorPiece dst = b.at(m.to);
  if (!dst.empty() && dst.color == ap.us) fail(m, "destination holds own piece");
  if (dst.piece == Piece::King) fail(m, "cannot capture a king");

  const int prev_half = b.halfmove_clock();
  unsigned r = b.castling().rights;

  // EP cleared unless this is a double push
  Square new_ep = NO_SQUARE;

  switch (m.kind) {
    case MoveKind::Castle: {
      if (ap.moved.piece != Piece::King) fail(m, "castle by a non-king");
      if (!dst.empty()) fail(m, "castle onto an occupied square");
      if (rank_of(m.from) != rank_of(m.to) || std::abs(file_of(m.to) - file_of(m.from)) != 2)
        fail(m, "castle must move the king two files");
      const int rank = rank_of(m.from);
      const bool king_side = file_of(m.to) > file_of(m.from);
      const Square rook_from = make_square(king_side ? 7 : 0, rank);
      const Square rook_to   = make_square(king_side ? file_of(m.to) - 1 : file_of(m.to) + 1, rank);
      const ColorPiece rook = b.at(rook_from);
      if (rook.piece != Piece::Rook || rook.color != ap.us) fail(m, "no rook to castle with");
      if (!b.empty(rook_to)) fail(m, "rook destination is occupied");

      b.clear_square(m.from);
      b.set_piece(ap.us, Piece::King, m.to);
      b.clear_square(rook_from);
      b.set_piece(ap.us, Piece::Rook, rook_to);
      break;
    }

    case MoveKind::EnPassant: {
      if (ap.moved.piece != Piece::Pawn) fail(m, "en passant by a non-pawn");
      if (!dst.empty()) fail(m, "en passant onto an occupied square");
      if (std::abs(file_of(m.to) - file_of(m.from)) != 1) fail(m, "en passant must change file");
      const Square cap_sq = make_square(file_of(m.to), rank_of(m.from));
      const ColorPiece victim = b.at(cap_sq);
      if (victim.piece != Piece::Pawn || victim.color == ap.us) fail(m, "no pawn to take en passant");
      ap.captured = victim;
      ap.captured_sq = cap_sq;
      b.clear_square(cap_sq);
      b.clear_square(m.from);
      b.set_piece(ap.us, Piece::Pawn, m.to);
      break;
    }

    case MoveKind::Promotion: {
      if (ap.moved.piece != Piece::Pawn) fail(m, "promotion by a non-pawn");
      if (m.promo != Piece::Knight && m.promo != Piece::Bishop &&
          m.promo != Piece::Rook && m.promo != Piece::Queen)
        fail(m, "promotion needs a knight, bishop, rook or queen");
      const int last = (ap.us == Color::White ? 7 : 0);
      if (rank_of(m.to) != last) fail(m, "promotion off the last rank");
      if (!dst.empty()) { ap.captured = dst; ap.captured_sq = m.to; }
      b.clear_square(m.from);
      b.set_piece(ap.us, m.promo, m.to);
      break;
    }

    case MoveKind::Normal:
    default: {
      if (!dst.empty()) { ap.captured = dst; ap.captured_sq = m.to; }
      b.clear_square(m.from);
      b.set_piece(ap.us, ap.moved.piece, m.to);
      // EP square after double push
      if (ap.moved.piece == Piece::Pawn && std::abs(m.to - m.from) == 16 && file_of(m.to) == file_of(m.from))
        new_ep = (m.from + m.to) / 2;
      break;
    }
  }

  b.set_ep_square(new_ep);

  // halfmove clock
  if (!ap.captured.empty() || ap.moved.piece == Piece::Pawn) b.set_halfmove_clock(0);
  else b.set_halfmove_clock(prev_half + 1);

  // fullmove after Black
  if (ap.us == Color::Black) b.set_fullmove_number(b.fullmove_number() + 1);

  // update castling rights (mover + possibly captured rook)
  clear_rights_after_move(r, ap.us, ap.moved.piece, m.from);
  clear_rights_after_capture(r, ap.captured.piece, ap.captured_sq);
  Castling cr{}; cr.rights = r; b.set_castling(cr);

  // swap side
  b.set_side_to_move(other(ap.us));
  return ap;
}

Board after_move(const Board& b, const Move& m) {
  Board copy = b;
  apply_move(copy, m);
  return copy;
}

} // namespace sightline
