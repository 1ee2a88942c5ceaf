#include "common.h"

#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace motif {

namespace {
constexpr std::array<char, 13> kPieceChars = {
    '.', 'P', 'N', 'B', 'R', 'Q', 'K', 'p', 'n', 'b', 'r', 'q', 'k'};

constexpr std::array<std::string_view, 7> kPieceNames = {
    "pawn", "knight", "bishop", "rook", "queen", "king", "piece"};
}

std::string square_to_string(Square sq) {
  if (!is_valid(sq)) {
    return "--";
  }
  const char file = static_cast<char>('a' + sq.col);
  const char rank = static_cast<char>('8' - sq.row);
  return std::string{file, rank};
}

std::optional<Square> square_from_string(std::string_view token) {
  if (token.size() < 2) {
    return std::nullopt;
  }
  const char file_char = static_cast<char>(std::tolower(static_cast<unsigned char>(token[0])));
  const char rank_char = token[1];
  if (file_char < 'a' || file_char > 'h' || rank_char < '1' || rank_char > '8') {
    return std::nullopt;
  }
  return make_square('8' - rank_char, file_char - 'a');
}

std::string_view piece_name(PieceType pt) {
  return kPieceNames[static_cast<std::size_t>(pt)];
}

char piece_to_char(Piece pc) {
  return kPieceChars[static_cast<std::uint8_t>(pc)];
}

Piece piece_from_char(char c) {
  switch (c) {
    case 'P':
      return Piece::WPawn;
    case 'N':
      return Piece::WKnight;
    case 'B':
      return Piece::WBishop;
    case 'R':
      return Piece::WRook;
    case 'Q':
      return Piece::WQueen;
    case 'K':
      return Piece::WKing;
    case 'p':
      return Piece::BPawn;
    case 'n':
      return Piece::BKnight;
    case 'b':
      return Piece::BBishop;
    case 'r':
      return Piece::BRook;
    case 'q':
      return Piece::BQueen;
    case 'k':
      return Piece::BKing;
    default:
      return Piece::None;
  }
}

PieceType promotion_from_char(char c) {
  switch (std::tolower(static_cast<unsigned char>(c))) {
    case 'n':
      return PieceType::Knight;
    case 'b':
      return PieceType::Bishop;
    case 'r':
      return PieceType::Rook;
    case 'q':
      return PieceType::Queen;
    default:
      return PieceType::None;
  }
}

std::optional<Move> parse_move(std::string_view token) {
  if (token.size() < 4 || token.size() > 5) {
    return std::nullopt;
  }
  const auto from = square_from_string(token.substr(0, 2));
  const auto to = square_from_string(token.substr(2, 2));
  if (!from || !to || *from == *to) {
    return std::nullopt;
  }
  Move move{*from, *to, PieceType::None};
  if (token.size() == 5) {
    move.promotion = promotion_from_char(token[4]);
    if (move.promotion == PieceType::None) {
      return std::nullopt;
    }
  }
  return move;
}

std::string move_to_string(const Move& m) {
  if (m.is_null()) {
    return "0000";
  }
  std::string out = square_to_string(m.from) + square_to_string(m.to);
  if (m.promotion != PieceType::None) {
    out.push_back(static_cast<char>(std::tolower(
        static_cast<unsigned char>(piece_to_char(make_piece(Color::White, m.promotion))))));
  }
  return out;
}

namespace detail {

[[noreturn]] void motif_trap(const char* expr, const char* file, int line) {
  std::cerr << "MOTIF assertion failed: " << expr << " (" << file << ':' << line << ")\n";
  std::abort();
}

void check_finite(double value, const char* expr, const char* file, int line) {
#ifndef NDEBUG
  if (!std::isfinite(value)) {
    motif_trap(expr, file, line);
  }
#else
  (void)value;
  (void)expr;
  (void)file;
  (void)line;
#endif
}

}  // namespace detail

}  // namespace motif
