#include "sightline/board.hpp"


namespace sightline {


Board::Board() { clear(); }


void Board::clear() {
for (auto& by_color : bb_) for (auto& b : by_color) b = 0ULL;
stm_ = Color::White;
castling_ = {};
ep_square_ = NO_SQUARE;
halfmove_ = 0;
fullmove_ = 1;
}


void Board::set_piece(Color c, Piece p, Square s) {
if (p == Piece::None) { clear_square(s); return; }
clear_square(s);
bb_[static_cast<std::size_t>(c)][static_cast<std::size_t>(p)] |= (1ULL << s);
}


void Board::remove_piece(Color c, Piece p, Square s) {
if (p == Piece::None) return;
bb_[static_cast<std::size_t>(c)][static_cast<std::size_t>(p)] &= ~(1ULL << s);
}


void Board::clear_square(Square s) {
const U64 mask = ~(1ULL << s);
for (auto& by_color : bb_) for (auto& b : by_color) b &= mask;
}


Piece Board::piece_at(Square s, Color* c_out) const {
  for (int c = 0; c < COLOR_N; ++c) {
    for (int p = 0; p < PIECE_N; ++p) {
      if ((bb_[static_cast<std::size_t>(c)][static_cast<std::size_t>(p)] >> s) & 1ULL) {
        if (c_out) *c_out = static_cast<Color>(c);
        return static_cast<Piece>(p);
      }
    }
  }
  return Piece::None;
}


ColorPiece Board::at(Square s) const {
  ColorPiece cp;
  cp.piece = piece_at(s, &cp.color);
  return cp;
}


U64 Board::pieces(Color c) const {
  U64 all = 0ULL;
  for (U64 b : bb_[static_cast<std::size_t>(c)]) all |= b;
  return all;
}


Square Board::find_king(Color c) const {
  U64 k = pieces(c, Piece::King);
  if (!k) return NO_SQUARE;
  return __builtin_ctzll(k);
}


int Board::king_count(Color c) const {
  return __builtin_popcountll(pieces(c, Piece::King));
}


Board Board::without(Square s) const {
  Board copy = *this;
  copy.clear_square(s);
  return copy;
}


Board Board::with(Square s, ColorPiece cp) const {
  Board copy = *this;
  copy.set_piece(cp.color, cp.piece, s);
  return copy;
}


bool Board::operator==(const Board& o) const {
  return bb_ == o.bb_ && stm_ == o.stm_ && castling_.rights == o.castling_.rights &&
         ep_square_ == o.ep_square_ && halfmove_ == o.halfmove_ && fullmove_ == o.fullmove_;
}


} // namespace sightline
