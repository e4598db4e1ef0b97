#pragma once
#include <array>
#include <cstdint>
#include "sightline/types.hpp"


namespace sightline {


struct Castling { // bit 0..3 = KQkq
unsigned rights = 0; // K=1, Q=2, k=4, q=8
};


// Value-type position snapshot. Copying is a flat copy of twelve bitboards
// and a few scalars, so analyses clone freely instead of mutating.
class Board {
public:
Board();
void clear();


// set_piece replaces whatever stood on s
void set_piece(Color c, Piece p, Square s);
void remove_piece(Color c, Piece p, Square s);
void clear_square(Square s);


Piece piece_at(Square s, Color* c_out = nullptr) const;
ColorPiece at(Square s) const;
bool empty(Square s) const { return ((occupied() >> s) & 1ULL) == 0; }


U64 pieces(Color c, Piece p) const {
  return bb_[static_cast<std::size_t>(c)][static_cast<std::size_t>(p)];
}
U64 pieces(Color c) const;
U64 occupied() const { return pieces(Color::White) | pieces(Color::Black); }


Square find_king(Color c) const;
int king_count(Color c) const;


// One-square-changed clones; the receiver is left untouched.
Board without(Square s) const;
Board with(Square s, ColorPiece cp) const;


void set_side_to_move(Color c) { stm_ = c; }
Color side_to_move() const { return stm_; }


void set_castling(Castling c) { castling_ = c; }
Castling castling() const { return castling_; }


void set_ep_square(Square s) { ep_square_ = s; }
Square ep_square() const { return ep_square_; }


void set_halfmove_clock(int n) { halfmove_ = n; }
int halfmove_clock() const { return halfmove_; }


void set_fullmove_number(int n) { fullmove_ = n; }
int fullmove_number() const { return fullmove_; }


bool operator==(const Board& o) const;
bool operator!=(const Board& o) const { return !(*this == o); }


private:
// bitboards[color][piece]
std::array<std::array<U64, PIECE_N>, COLOR_N> bb_{};
Color stm_ = Color::White;
Castling castling_{};
Square ep_square_ = NO_SQUARE;
int halfmove_ = 0;
int fullmove_ = 1;
};


} // namespace sightline
