#include "attacks.h"

#include <algorithm>
#include <array>
#include <cstdlib>

namespace motif {
namespace {

constexpr std::array<Direction, 4> kBishopDirs = {{{-1, -1}, {-1, 1}, {1, -1}, {1, 1}}};
constexpr std::array<Direction, 4> kRookDirs = {{{-1, 0}, {1, 0}, {0, -1}, {0, 1}}};
constexpr std::array<Direction, 8> kQueenDirs = {
    {{-1, -1}, {-1, 1}, {1, -1}, {1, 1}, {-1, 0}, {1, 0}, {0, -1}, {0, 1}}};

constexpr int sign(int v) {
  return (v > 0) - (v < 0);
}

constexpr int pawn_forward(Color c) {
  return c == Color::White ? -1 : 1;
}

constexpr int pawn_start_row(Color c) {
  return c == Color::White ? 6 : 1;
}

constexpr int promotion_row(Color c) {
  return c == Color::White ? 0 : kBoardSize - 1;
}

bool diagonal(Direction d) {
  return d.dr != 0 && d.dc != 0;
}

// Walks the open line between `from` and `to`; both are already validated.
bool line_clear(const Board& board, Square from, Square to, Direction dir) {
  Square cur = offset(from, dir.dr, dir.dc);
  while (cur != to) {
    if (!board.empty(cur)) {
      return false;
    }
    cur = offset(cur, dir.dr, dir.dc);
  }
  return true;
}

struct AttackProbe {
  const Board& board;
  Square from;
  Square to;

  bool slide(bool diagonals, bool orthogonals) const {
    const auto dir = line_direction(from, to);
    if (!dir) {
      return false;
    }
    const bool diag = diagonal(*dir);
    if ((diag && !diagonals) || (!diag && !orthogonals)) {
      return false;
    }
    return line_clear(board, from, to, *dir);
  }

  bool operator()(const motion::Pawn& pawn) const {
    return to.row == from.row + pawn_forward(pawn.color) && std::abs(to.col - from.col) == 1;
  }
  bool operator()(const motion::Knight&) const {
    const int dr = std::abs(to.row - from.row);
    const int dc = std::abs(to.col - from.col);
    return (dr == 1 && dc == 2) || (dr == 2 && dc == 1);
  }
  bool operator()(const motion::Bishop&) const { return slide(true, false); }
  bool operator()(const motion::Rook&) const { return slide(false, true); }
  bool operator()(const motion::Queen&) const { return slide(true, true); }
  bool operator()(const motion::King&) const {
    return std::max(std::abs(to.row - from.row), std::abs(to.col - from.col)) == 1;
  }
};

Move shaped_move(const Board& board, Square from, Square to) {
  Move m{from, to, PieceType::None};
  const Piece pc = board.piece_on(from);
  if (type_of(pc) == PieceType::Pawn && to.row == promotion_row(color_of(pc))) {
    m.promotion = PieceType::Queen;
  }
  return m;
}

}  // namespace

std::optional<Mover> mover_for(Piece pc) {
  switch (type_of(pc)) {
    case PieceType::Pawn:
      return Mover{motion::Pawn{color_of(pc)}};
    case PieceType::Knight:
      return Mover{motion::Knight{}};
    case PieceType::Bishop:
      return Mover{motion::Bishop{}};
    case PieceType::Rook:
      return Mover{motion::Rook{}};
    case PieceType::Queen:
      return Mover{motion::Queen{}};
    case PieceType::King:
      return Mover{motion::King{}};
    case PieceType::None:
      break;
  }
  return std::nullopt;
}

std::span<const Direction> slider_directions(PieceType pt) {
  switch (pt) {
    case PieceType::Bishop:
      return kBishopDirs;
    case PieceType::Rook:
      return kRookDirs;
    case PieceType::Queen:
      return kQueenDirs;
    default:
      return {};
  }
}

std::optional<Direction> line_direction(Square from, Square to) {
  if (from == to) {
    return std::nullopt;
  }
  const int dr = to.row - from.row;
  const int dc = to.col - from.col;
  if (dr == 0 || dc == 0 || std::abs(dr) == std::abs(dc)) {
    return Direction{sign(dr), sign(dc)};
  }
  return std::nullopt;
}

bool can_attack(const Board& board, Square from, Piece piece, Square to) {
  if (!is_valid(from) || !is_valid(to) || from == to) {
    return false;
  }
  const auto mover = mover_for(piece);
  if (!mover) {
    return false;
  }
  return std::visit(AttackProbe{board, from, to}, *mover);
}

std::vector<Square> attackers_of(const Board& board, Square sq, Color by) {
  std::vector<Square> out;
  if (!is_valid(sq)) {
    return out;
  }
  for (int idx = 0; idx < kSquareCount; ++idx) {
    const Square from = square_at(idx);
    const Piece pc = board.piece_on(from);
    if (pc == Piece::None || color_of(pc) != by || from == sq) {
      continue;
    }
    if (can_attack(board, from, pc, sq)) {
      out.push_back(from);
    }
  }
  return out;
}

bool is_attacked_by(const Board& board, Square sq, Color by) {
  if (!is_valid(sq)) {
    return false;
  }
  for (int idx = 0; idx < kSquareCount; ++idx) {
    const Square from = square_at(idx);
    const Piece pc = board.piece_on(from);
    if (pc != Piece::None && color_of(pc) == by && can_attack(board, from, pc, sq)) {
      return true;
    }
  }
  return false;
}

int count_attackers(const Board& board, Square sq, Color by) {
  return static_cast<int>(attackers_of(board, sq, by).size());
}

int count_defenders(const Board& board, Square sq, Color owner) {
  return count_attackers(board, sq, owner);
}

int lowest_attacker_value(const Board& board, Square sq, Color by) {
  int lowest = 0;
  for (const Square from : attackers_of(board, sq, by)) {
    const int value = piece_value(board.piece_on(from));
    if (lowest == 0 || value < lowest) {
      lowest = value;
    }
  }
  return lowest;
}

int lowest_defender_value(const Board& board, Square sq, Color owner) {
  return lowest_attacker_value(board, sq, owner);
}

std::vector<Square> attacked_enemies(const Board& board, Square from) {
  std::vector<Square> out;
  if (!is_valid(from)) {
    return out;
  }
  const Piece pc = board.piece_on(from);
  if (pc == Piece::None) {
    return out;
  }
  for (int idx = 0; idx < kSquareCount; ++idx) {
    const Square to = square_at(idx);
    const Piece target = board.piece_on(to);
    if (target != Piece::None && color_of(target) != color_of(pc) &&
        can_attack(board, from, pc, to)) {
      out.push_back(to);
    }
  }
  return out;
}

RayHit ray_scan(const Board& board, Square from, Direction dir) {
  RayHit hit;
  if (!is_valid(from) || (dir.dr == 0 && dir.dc == 0)) {
    return hit;
  }
  for (Square cur = offset(from, dir.dr, dir.dc); is_valid(cur);
       cur = offset(cur, dir.dr, dir.dc)) {
    if (board.empty(cur)) {
      continue;
    }
    if (!hit.first) {
      hit.first = cur;
    } else {
      hit.second = cur;
      break;
    }
  }
  return hit;
}

bool is_between(Square a, Square b, Square mid) {
  if (!is_valid(a) || !is_valid(b) || !is_valid(mid)) {
    return false;
  }
  const auto dir = line_direction(a, b);
  if (!dir) {
    return false;
  }
  for (Square cur = offset(a, dir->dr, dir->dc); cur != b; cur = offset(cur, dir->dr, dir->dc)) {
    if (cur == mid) {
      return true;
    }
  }
  return false;
}

bool in_check(const Board& board, Color c) {
  const auto king = board.king_square(c);
  return king && is_attacked_by(board, *king, flip(c));
}

bool gives_check(const Board& board, Square sq) {
  if (!is_valid(sq)) {
    return false;
  }
  const Piece pc = board.piece_on(sq);
  if (pc == Piece::None) {
    return false;
  }
  const auto king = board.king_square(flip(color_of(pc)));
  return king && can_attack(board, sq, pc, *king);
}

bool can_move_to(const Board& board, Square from, Square to) {
  if (!is_valid(from) || !is_valid(to) || from == to) {
    return false;
  }
  const Piece pc = board.piece_on(from);
  if (pc == Piece::None) {
    return false;
  }
  const Piece target = board.piece_on(to);
  const Color us = color_of(pc);
  if (target != Piece::None && color_of(target) == us) {
    return false;
  }
  if (type_of(pc) != PieceType::Pawn) {
    return can_attack(board, from, pc, to);
  }

  const int fwd = pawn_forward(us);
  if (to.col == from.col) {
    if (target != Piece::None) {
      return false;
    }
    if (to.row == from.row + fwd) {
      return true;
    }
    return from.row == pawn_start_row(us) && to.row == from.row + 2 * fwd &&
           board.empty(offset(from, fwd, 0));
  }
  if (to.row != from.row + fwd || std::abs(to.col - from.col) != 1) {
    return false;
  }
  return target != Piece::None || board.en_passant_square() == to;
}

bool leaves_king_safe(const Board& board, const Move& m) {
  if (m.is_null() || board.empty(m.from)) {
    return false;
  }
  const Color us = color_of(board.piece_on(m.from));
  return !in_check(board.after(m), us);
}

int king_safe_squares(const Board& board, Color c) {
  const auto king = board.king_square(c);
  if (!king) {
    return 0;
  }
  const Piece king_piece = board.piece_on(*king);
  int count = 0;
  for (int dr = -1; dr <= 1; ++dr) {
    for (int dc = -1; dc <= 1; ++dc) {
      const Square to = offset(*king, dr, dc);
      if ((dr == 0 && dc == 0) || !is_valid(to)) {
        continue;
      }
      const Piece occupant = board.piece_on(to);
      if (occupant != Piece::None && color_of(occupant) == c) {
        continue;
      }
      Board probe = board;
      probe.set_piece(*king, Piece::None);
      probe.set_piece(to, king_piece);
      if (!is_attacked_by(probe, to, flip(c))) {
        ++count;
      }
    }
  }
  return count;
}

int safe_squares_for_piece(const Board& board, Square sq) {
  if (!is_valid(sq) || board.empty(sq)) {
    return 0;
  }
  const Color us = color_of(board.piece_on(sq));
  int count = 0;
  for (int idx = 0; idx < kSquareCount; ++idx) {
    const Square to = square_at(idx);
    if (!can_move_to(board, sq, to)) {
      continue;
    }
    const Board next = board.after(shaped_move(board, sq, to));
    if (!is_attacked_by(next, to, flip(us))) {
      ++count;
    }
  }
  return count;
}

int king_zone_pressure(const Board& board, Color c) {
  const auto king = board.king_square(c);
  if (!king) {
    return 0;
  }
  return king_zone_pressure(board, *king, flip(c));
}

int king_zone_pressure(const Board& board, Square center, Color by) {
  int count = 0;
  for (int dr = -1; dr <= 1; ++dr) {
    for (int dc = -1; dc <= 1; ++dc) {
      const Square sq = offset(center, dr, dc);
      if ((dr == 0 && dc == 0) || !is_valid(sq)) {
        continue;
      }
      if (is_attacked_by(board, sq, by)) {
        ++count;
      }
    }
  }
  return count;
}

bool is_checkmated(const Board& board, Color c) {
  if (!in_check(board, c)) {
    return false;
  }
  for (int from_idx = 0; from_idx < kSquareCount; ++from_idx) {
    const Square from = square_at(from_idx);
    const Piece pc = board.piece_on(from);
    if (pc == Piece::None || color_of(pc) != c) {
      continue;
    }
    for (int to_idx = 0; to_idx < kSquareCount; ++to_idx) {
      const Square to = square_at(to_idx);
      if (can_move_to(board, from, to) && leaves_king_safe(board, shaped_move(board, from, to))) {
        return false;
      }
    }
  }
  return true;
}

bool has_mate_in_one(const Board& board, Color c) {
  const Color them = flip(c);
  if (!board.king_square(them)) {
    return false;
  }
  for (int from_idx = 0; from_idx < kSquareCount; ++from_idx) {
    const Square from = square_at(from_idx);
    const Piece pc = board.piece_on(from);
    if (pc == Piece::None || color_of(pc) != c) {
      continue;
    }
    for (int to_idx = 0; to_idx < kSquareCount; ++to_idx) {
      const Square to = square_at(to_idx);
      if (!can_move_to(board, from, to)) {
        continue;
      }
      const Board next = board.after(shaped_move(board, from, to));
      if (in_check(next, c) || !in_check(next, them)) {
        continue;
      }
      if (is_checkmated(next, them)) {
        return true;
      }
    }
  }
  return false;
}

}  // namespace motif
