#pragma once
#include <cstdint>


namespace sightline {


using U64 = std::uint64_t;
using Square = int; // 0..63, a1 = 0, h8 = 63

constexpr Square NO_SQUARE = -1;


enum class Color : int { White = 0, Black = 1 };


enum class Piece : int { Pawn=0, Knight=1, Bishop=2, Rook=3, Queen=4, King=5, None=6 };


constexpr int COLOR_N = 2;
constexpr int PIECE_N = 6; // without None


// A piece together with its owner; Piece::None means an empty square.
struct ColorPiece {
  Color color = Color::White;
  Piece piece = Piece::None;

  bool empty() const { return piece == Piece::None; }
  bool operator==(const ColorPiece& o) const {
    return piece == o.piece && (piece == Piece::None || color == o.color);
  }
  bool operator!=(const ColorPiece& o) const { return !(*this == o); }
};


// A piece and the square it stands on.
struct PlacedPiece {
  Square square = NO_SQUARE;
  ColorPiece piece{};

  bool operator==(const PlacedPiece& o) const { return square == o.square && piece == o.piece; }
  bool operator!=(const PlacedPiece& o) const { return !(*this == o); }
};


inline constexpr int file_of(Square s) { return s & 7; }
inline constexpr int rank_of(Square s) { return s >> 3; }
inline constexpr Square make_square(int file, int rank) { return rank * 8 + file; }
inline constexpr bool on_board(int file, int rank) { return file >= 0 && file < 8 && rank >= 0 && rank < 8; }
inline constexpr Color other(Color c) { return c == Color::White ? Color::Black : Color::White; }

inline constexpr bool is_slider(Piece p) {
  return p == Piece::Bishop || p == Piece::Rook || p == Piece::Queen;
}


} // namespace sightline
