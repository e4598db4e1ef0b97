#include "sightline/fen.hpp"
#include <cctype>
#include <sstream>
#include <string>

namespace sightline {

static inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

static int to_int(const std::string& s, const char* what) {
  if (s.empty()) throw FenError(std::string("Empty ") + what + " in FEN");
  for (char c : s)
    if (!is_digit(c)) throw FenError(std::string("Invalid ") + what + " in FEN: " + s);
  try {
    return std::stoi(s);
  } catch (const std::out_of_range&) {
    throw FenError(std::string("Out-of-range ") + what + " in FEN: " + s);
  }
}

static inline Piece char_to_piece(char c, Color& out_color) {
  out_color = std::isupper(static_cast<unsigned char>(c)) ? Color::White : Color::Black;
  switch (std::tolower(static_cast<unsigned char>(c))) {
    case 'p': return Piece::Pawn;
    case 'n': return Piece::Knight;
    case 'b': return Piece::Bishop;
    case 'r': return Piece::Rook;
    case 'q': return Piece::Queen;
    case 'k': return Piece::King;
    default:  return Piece::None;
  }
}

static inline char piece_to_char(Piece p, Color c) {
  const char* W = "PNBRQK";
  const char* B = "pnbrqk";
  if (p == Piece::None) return '.';
  int idx = static_cast<int>(p);
  return (c == Color::White ? W[idx] : B[idx]);
}

static void parse_placement(Board& b, const std::string& placement) {
  int r = 7, f = 0;
  for (char ch : placement) {
    if (ch == '/') {
      if (f != 8) throw FenError("Rank does not cover 8 files in FEN");
      if (--r < 0) throw FenError("Too many ranks in FEN");
      f = 0;
      continue;
    }
    if (is_digit(ch)) {
      if (ch == '0' || ch == '9') throw FenError("Invalid empty-run digit in FEN");
      f += ch - '0';
      if (f > 8) throw FenError("Rank overflows 8 files in FEN");
      continue;
    }
    Color col; Piece p = char_to_piece(ch, col);
    if (p == Piece::None) throw FenError(std::string("Invalid piece character in FEN: ") + ch);
    if (f > 7) throw FenError("Rank overflows 8 files in FEN");
    b.set_piece(col, p, make_square(f, r));
    ++f;
  }
  if (r != 0 || f != 8) throw FenError("Piece placement does not describe 8 full ranks");
}

void set_from_fen(Board& b, std::string_view fen) {
  b.clear();

  std::string fen_str(fen);
  std::istringstream ss(fen_str);
  std::string placement, active = "w", castling = "-", ep = "-", half = "0", full = "1";
  if (!(ss >> placement)) throw FenError("Empty FEN");
  ss >> active >> castling >> ep >> half >> full;
  std::string extra;
  if (ss >> extra) throw FenError("Trailing garbage after FEN: " + extra);

  // 1) Piece placement
  parse_placement(b, placement);

  // 2) Active color
  if (active == "w") b.set_side_to_move(Color::White);
  else if (active == "b") b.set_side_to_move(Color::Black);
  else throw FenError("Invalid active color in FEN");

  // 3) Castling rights
  Castling cr{};
  if (castling != "-") {
    for (char cch : castling) {
      if (cch == 'K') cr.rights |= 0x1;
      else if (cch == 'Q') cr.rights |= 0x2;
      else if (cch == 'k') cr.rights |= 0x4;
      else if (cch == 'q') cr.rights |= 0x8;
      else throw FenError("Invalid castling char in FEN");
    }
  }
  b.set_castling(cr);

  // 4) En-passant square
  if (ep == "-") {
    b.set_ep_square(NO_SQUARE);
  } else {
    if (ep.size() != 2) throw FenError("Invalid en-passant square in FEN");
    int file = ep[0] - 'a';
    int rank = ep[1] - '1';
    if (!on_board(file, rank)) throw FenError("EP square out of range");
    if (rank != 2 && rank != 5) throw FenError("EP square must be on rank 3 or 6");
    b.set_ep_square(make_square(file, rank));
  }

  // 5) Halfmove & 6) Fullmove clocks
  b.set_halfmove_clock(to_int(half, "halfmove clock"));
  b.set_fullmove_number(to_int(full, "fullmove number"));
}

Board board_from_fen(std::string_view fen) {
  Board b;
  set_from_fen(b, fen);
  return b;
}

std::string to_fen(const Board& b) {
  std::string out;

  // 1) Piece placement
  for (int r = 7; r >= 0; --r) {
    int empties = 0;
    for (int f = 0; f < 8; ++f) {
      Color c;
      Piece p = b.piece_at(make_square(f, r), &c);
      if (p == Piece::None) {
        ++empties;
      } else {
        if (empties) { out += char('0' + empties); empties = 0; }
        out += piece_to_char(p, c);
      }
    }
    if (empties) out += char('0' + empties);
    if (r) out += '/';
  }
  out += ' ';

  // 2) Active color
  out += (b.side_to_move() == Color::White ? 'w' : 'b');
  out += ' ';

  // 3) Castling
  unsigned cr = b.castling().rights;
  if (cr == 0) out += '-';
  else {
    if (cr & 0x1) out += 'K';
    if (cr & 0x2) out += 'Q';
    if (cr & 0x4) out += 'k';
    if (cr & 0x8) out += 'q';
  }
  out += ' ';

  // 4) En-passant square
  Square ep = b.ep_square();
  if (ep == NO_SQUARE) out += '-';
  else {
    out += char('a' + file_of(ep));
    out += char('1' + rank_of(ep));
  }
  out += ' ';

  // 5) Halfmove & 6) Fullmove
  out += std::to_string(b.halfmove_clock());
  out += ' ';
  out += std::to_string(b.fullmove_number());

  return out;
}

} // namespace sightline
