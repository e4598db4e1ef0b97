#include <cstdlib>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "sightline/board.hpp"
#include "sightline/errors.hpp"
#include "sightline/fen.hpp"
#include "sightline/move_safety.hpp"
#include "sightline/notation.hpp"
#include "sightline/queries.hpp"
#include "sightline/tactics.hpp"
#include "sightline/types.hpp"

using namespace sightline;

static void usage() {
  std::cout <<
    "Sightline CLI\n"
    "Usage:\n"
    "  sightline_cli board                      [fen <FEN...>]\n"
    "  sightline_cli analyze <square>           [fen <FEN...>]\n"
    "  sightline_cli move <from> <to> [q|r|b|n] [fen <FEN...>]\n"
    "  sightline_cli check <from> <to> [q|r|b|n] [fen <FEN...>]\n"
    "  sightline_cli hanging <white|black>      [fen <FEN...>]\n"
    "  sightline_cli tactics <white|black> [limit <N>] [fen <FEN...>]\n"
    "  sightline_cli all                        [fen <FEN...>]\n"
    "If FEN omitted, uses startpos.\n";
}

static std::string join_from(const std::vector<std::string>& a, size_t i) {
  if (i >= a.size()) return "";
  std::ostringstream oss;
  for (size_t k = i; k < a.size(); ++k) {
    if (k > i) oss << ' ';
    oss << a[k];
  }
  return oss.str();
}

// Splits "<args...> fen <FEN...>" into the leading args and a board.
static Board board_from_args(std::vector<std::string>& a) {
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i] != "fen") continue;
    Board b = board_from_fen(join_from(a, i + 1));
    a.resize(i);
    return b;
  }
  return board_from_fen(STARTPOS_FEN);
}

static Piece promo_from_string(const std::string& s) {
  if (s == "q") return Piece::Queen;
  if (s == "r") return Piece::Rook;
  if (s == "b") return Piece::Bishop;
  if (s == "n") return Piece::Knight;
  throw std::invalid_argument("bad promotion piece: " + s);
}

// The CLI plays the move generator's part: it tags the special kind from
// the position and trusts the user on legality.
static Move infer_move(const Board& b, Square from, Square to, Piece promo) {
  Move m{from, to, MoveKind::Normal, Piece::None, true};
  const ColorPiece cp = b.at(from);
  if (cp.piece == Piece::King && rank_of(from) == rank_of(to) && std::abs(file_of(to) - file_of(from)) == 2) {
    m.kind = MoveKind::Castle;
  } else if (cp.piece == Piece::Pawn) {
    const int last = (cp.color == Color::White ? 7 : 0);
    if (rank_of(to) == last) {
      m.kind = MoveKind::Promotion;
      m.promo = (promo == Piece::None ? Piece::Queen : promo);
    } else if (to == b.ep_square() && b.empty(to) && file_of(to) != file_of(from)) {
      m.kind = MoveKind::EnPassant;
    }
  }
  return m;
}

static std::string list(const AttackList& l) {
  if (l.empty()) return "none";
  std::string out;
  for (const auto& r : l) {
    if (!out.empty()) out += ", ";
    out += piece_char(r.attacker);
    out += square_name(r.from);
  }
  return out;
}

static std::string list(const std::vector<PlacedPiece>& l) {
  if (l.empty()) return "none";
  std::string out;
  for (const auto& p : l) {
    if (!out.empty()) out += ", ";
    out += piece_char(p.piece);
    out += square_name(p.square);
  }
  return out;
}

static void print_square(const Board& b, Square s) {
  const SquareReport r = analyze_square(b, s);
  std::cout << "square " << square_name(s) << ": " << piece_name(r.occupant) << "\n"
            << "  white attackers: " << list(r.white_attackers) << "\n"
            << "  black attackers: " << list(r.black_attackers) << "\n";
  if (r.occupant.empty()) return;
  std::cout << "  defenders: " << list(r.defenders) << "\n"
            << "  hanging: " << (r.hanging ? "yes" : "no")
            << "  protected: " << (r.protected_ ? "yes" : "no") << "\n";
  if (r.exchange)
    std::cout << "  exchange: " << r.exchange->gain << " for " << color_name(r.exchange->initiator)
              << " after " << r.exchange->played << " capture(s)\n";
}

static void print_move(const Board& b, const Move& m) {
  const MoveReport r = analyze_move(b, m);
  std::cout << "move " << move_to_uci(m) << ": " << piece_name(r.piece);
  if (!r.captured.empty()) std::cout << " takes " << piece_name(r.captured) << " on " << square_name(r.captured_sq);
  std::cout << "\n";
  if (r.gives_check) std::cout << "  gives check\n";
  std::cout << "  destination attackers: " << list(r.destination_attackers) << "\n"
            << "  destination defenders: " << list(r.destination_defenders) << "\n";
  if (r.exchange)
    std::cout << "  recapture: opponent nets " << r.exchange->gain << " over "
              << r.exchange->played << " capture(s)\n";
  if (!r.newly_hanging.empty())
    std::cout << "  left hanging: " << list(r.newly_hanging) << "\n";
  for (const auto& bl : r.blocked_lines) {
    std::cout << "  blocks " << piece_char(bl.slider_piece) << square_name(bl.slider)
              << " toward " << direction_name(bl.direction) << " (";
    for (size_t i = 0; i < bl.lost.size(); ++i) std::cout << (i ? " " : "") << square_name(bl.lost[i]);
    std::cout << ")\n";
  }
  for (const auto& w : r.warnings) std::cout << "  warning: " << w << "\n";
}

static void print_hanging(const Board& b, Color c) {
  std::cout << color_name(c) << " hanging: " << list(find_hanging_pieces(b, c)) << "\n"
            << color_name(c) << " undefended: " << list(find_undefended_pieces(b, c)) << "\n";
}

static void print_tactics(const Board& b, Color c, size_t limit) {
  require_kings(b);
  std::cout << "tactics for " << color_name(c) << "\n";
  for (const auto& f : find_forks(b, c))
    std::cout << "  fork: " << piece_char(f.forker_piece) << square_name(f.forker)
              << " hits " << list(f.targets) << "\n";
  const auto squares = find_fork_squares(b, c);
  for (size_t i = 0; i < squares.size() && i < limit; ++i) {
    const auto& fs = squares[i];
    std::cout << "  fork square: " << piece_char(fs.piece) << square_name(fs.from) << "-" << square_name(fs.to)
              << " hits " << list(fs.targets) << (fs.safe ? "" : " (unsafe)") << "\n";
  }
  for (Color side : {c, other(c)})
    for (const auto& p : find_pins(b, side))
      std::cout << "  pin: " << piece_char(p.pinned_piece) << square_name(p.pinned)
                << " pinned by " << piece_char(p.pinner_piece) << square_name(p.pinner) << "\n";
  for (const auto& s : find_skewers(b, c)) {
    const char* kind = s.kind == SkewerKind::Pin ? "pin" : s.kind == SkewerKind::Skewer ? "skewer" : "reverse skewer";
    std::cout << "  " << kind << ": " << piece_char(s.attacker_piece) << square_name(s.attacker)
              << " through " << piece_char(s.front_piece) << square_name(s.front)
              << " onto " << piece_char(s.back_piece) << square_name(s.back) << "\n";
  }
  for (const auto& d : find_discoveries(b, c))
    std::cout << "  discovery: move " << piece_char(d.blocker_piece) << square_name(d.blocker)
              << " to unmask " << piece_char(d.slider_piece) << square_name(d.slider)
              << " on " << piece_char(d.target_piece) << square_name(d.target)
              << (d.is_check ? " (check)" : "") << "\n";
}

static int run(std::vector<std::string> args) {
  const std::string cmd = args[0];
  Board b = board_from_args(args);

  if (cmd == "board") {
    std::cout << board_to_ascii(b) << to_fen(b) << "\n";
    return 0;
  }
  if (cmd == "analyze") {
    if (args.size() < 2) { usage(); return 1; }
    print_square(b, parse_square(args[1]));
    return 0;
  }
  if (cmd == "move") {
    if (args.size() < 3) { usage(); return 1; }
    const Piece promo = args.size() > 3 ? promo_from_string(args[3]) : Piece::None;
    print_move(b, infer_move(b, parse_square(args[1]), parse_square(args[2]), promo));
    return 0;
  }
  if (cmd == "check") {
    if (args.size() < 3) { usage(); return 1; }
    const Piece promo = args.size() > 3 ? promo_from_string(args[3]) : Piece::None;
    const Move m = infer_move(b, parse_square(args[1]), parse_square(args[2]), promo);
    std::cout << quick_check(analyze_move(b, m));
    return 0;
  }
  if (cmd == "hanging") {
    if (args.size() < 2) { usage(); return 1; }
    print_hanging(b, parse_color(args[1]));
    return 0;
  }
  if (cmd == "tactics") {
    if (args.size() < 2) { usage(); return 1; }
    size_t limit = 5;
    if (args.size() >= 4 && args[2] == "limit") limit = static_cast<size_t>(std::stoul(args[3]));
    print_tactics(b, parse_color(args[1]), limit);
    return 0;
  }
  if (cmd == "all") {
    require_kings(b);
    std::cout << board_to_ascii(b) << "\n";
    print_hanging(b, Color::White);
    print_hanging(b, Color::Black);
    print_tactics(b, b.side_to_move(), 5);
    return 0;
  }

  usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) { usage(); return 0; }

  try {
    return run(std::move(args));
  } catch (const FenError& e) {
    std::cerr << "error: bad FEN: " << e.what() << "\n";
  } catch (const AnalysisError& e) {
    std::cerr << "error: " << e.what() << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "error: " << e.what() << "\n";
    usage();
  } catch (const std::out_of_range& e) {
    std::cerr << "error: number out of range: " << e.what() << "\n";
  }
  return 1;
}
