#include "sightline/notation.hpp"
#include "sightline/attacks_tbl.hpp"

#include <cctype>
#include <stdexcept>

namespace sightline {

static inline char file_char(Square s) { return char('a' + file_of(s)); }
static inline char rank_char(Square s) { return char('1' + rank_of(s)); }

static inline char promo_to_char(Piece p) {
  switch (p) {
    case Piece::Queen:  return 'q';
    case Piece::Rook:   return 'r';
    case Piece::Bishop: return 'b';
    case Piece::Knight: return 'n';
    default:            return '\0';
  }
}

std::string square_name(Square s) {
  if (s < 0 || s > 63) return "-";
  std::string out;
  out.push_back(file_char(s));
  out.push_back(rank_char(s));
  return out;
}

Square parse_square(const std::string& name) {
  if (name.size() != 2) throw std::invalid_argument("bad square: " + name);
  const char f = static_cast<char>(std::tolower(static_cast<unsigned char>(name[0])));
  const char r = name[1];
  if (f < 'a' || f > 'h' || r < '1' || r > '8')
    throw std::invalid_argument("bad square: " + name);
  return make_square(f - 'a', r - '1');
}

char piece_char(ColorPiece cp) {
  const char* W = "PNBRQK";
  const char* B = "pnbrqk";
  if (cp.empty()) return '.';
  const int idx = static_cast<int>(cp.piece);
  return (cp.color == Color::White ? W[idx] : B[idx]);
}

std::string piece_name(ColorPiece cp) {
  static const char* NAMES[PIECE_N] = {"pawn", "knight", "bishop", "rook", "queen", "king"};
  if (cp.empty()) return "empty";
  return std::string(color_name(cp.color)) + ' ' + NAMES[static_cast<int>(cp.piece)];
}

const char* color_name(Color c) { return c == Color::White ? "white" : "black"; }

Color parse_color(const std::string& s) {
  std::string lower;
  for (char ch : s) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  if (lower == "white" || lower == "w") return Color::White;
  if (lower == "black" || lower == "b") return Color::Black;
  throw std::invalid_argument("bad color: " + s);
}

const char* direction_name(int direction) {
  static const char* NAMES[DIR_N_COUNT] = {"N", "NE", "E", "SE", "S", "SW", "W", "NW"};
  if (direction < 0 || direction >= DIR_N_COUNT) return "-";
  return NAMES[direction];
}

std::string move_to_uci(const Move& m) {
  std::string s;
  s.reserve(5);
  s += square_name(m.from);
  s += square_name(m.to);
  char pc = promo_to_char(m.promo);
  if (pc) s.push_back(pc);
  return s;
}

std::string board_to_ascii(const Board& b) {
  std::string out;
  for (int r = 7; r >= 0; --r) {
    out.push_back(char('1' + r));
    out.push_back(' ');
    for (int f = 0; f < 8; ++f) {
      out.push_back(piece_char(b.at(make_square(f, r))));
      if (f < 7) out.push_back(' ');
    }
    out.push_back('\n');
  }
  out += "  a b c d e f g h\n";
  return out;
}

} // namespace sightline
