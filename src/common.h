#pragma once
// common.h -- Shared primitive types, move encoding, and debug helpers.
// Squares are (row, col) with row 0 holding rank 8, matching FEN order.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace motif {

constexpr int kBoardSize = 8;
constexpr int kSquareCount = kBoardSize * kBoardSize;

enum class Color : std::uint8_t { White = 0, Black = 1 };

constexpr Color flip(Color c) {
  return c == Color::White ? Color::Black : Color::White;
}

constexpr int color_index(Color c) {
  return c == Color::White ? 0 : 1;
}

struct Square {
  int row{-1};
  int col{-1};

  constexpr bool operator==(const Square&) const = default;
};

constexpr Square kNoSquare{};

constexpr Square make_square(int row, int col) {
  return Square{row, col};
}

constexpr bool is_valid(Square sq) {
  return sq.row >= 0 && sq.row < kBoardSize && sq.col >= 0 && sq.col < kBoardSize;
}

constexpr int square_index(Square sq) {
  return sq.row * kBoardSize + sq.col;
}

constexpr Square square_at(int index) {
  return Square{index / kBoardSize, index % kBoardSize};
}

constexpr Square offset(Square sq, int dr, int dc) {
  return Square{sq.row + dr, sq.col + dc};
}

std::string square_to_string(Square sq);
std::optional<Square> square_from_string(std::string_view token);

enum class PieceType : std::uint8_t { Pawn = 0, Knight, Bishop, Rook, Queen, King, None = 6 };

enum class Piece : std::uint8_t {
  None = 0,
  WPawn,
  WKnight,
  WBishop,
  WRook,
  WQueen,
  WKing,
  BPawn,
  BKnight,
  BBishop,
  BRook,
  BQueen,
  BKing
};

constexpr Piece make_piece(Color c, PieceType pt) {
  if (pt == PieceType::None) {
    return Piece::None;
  }
  constexpr std::uint8_t base[2] = {static_cast<std::uint8_t>(Piece::WPawn),
                                    static_cast<std::uint8_t>(Piece::BPawn)};
  return static_cast<Piece>(base[color_index(c)] + static_cast<std::uint8_t>(pt));
}

constexpr Color color_of(Piece pc) {
  if (pc == Piece::None) {
    return Color::White;
  }
  return static_cast<std::uint8_t>(pc) < static_cast<std::uint8_t>(Piece::BPawn)
             ? Color::White
             : Color::Black;
}

constexpr PieceType type_of(Piece pc) {
  if (pc == Piece::None) {
    return PieceType::None;
  }
  const auto raw = static_cast<std::uint8_t>(pc);
  return static_cast<PieceType>((raw - 1) % 6);
}

constexpr bool is_slider(PieceType pt) {
  return pt == PieceType::Bishop || pt == PieceType::Rook || pt == PieceType::Queen;
}

// Material in pawns; the king carries a large sentinel so it always outranks.
constexpr std::array<int, 7> kPieceValues = {1, 3, 3, 5, 9, 100, 0};

constexpr int piece_value(PieceType pt) {
  return kPieceValues[static_cast<std::size_t>(pt)];
}

constexpr int piece_value(Piece pc) {
  return piece_value(type_of(pc));
}

std::string_view piece_name(PieceType pt);
char piece_to_char(Piece pc);
Piece piece_from_char(char c);
PieceType promotion_from_char(char c);

struct Move {
  Square from{};
  Square to{};
  PieceType promotion{PieceType::None};

  constexpr bool operator==(const Move&) const = default;

  [[nodiscard]] constexpr bool is_null() const { return !is_valid(from) || !is_valid(to); }
};

// Accepts "e2e4" and "e7e8q"; anything outside the 4-5 character pattern is rejected.
std::optional<Move> parse_move(std::string_view token);
std::string move_to_string(const Move& m);

namespace detail {
[[noreturn]] void motif_trap(const char* expr, const char* file, int line);
void check_finite(double value, const char* expr, const char* file, int line);
}  // namespace detail

}  // namespace motif

#ifdef NDEBUG
#define MOTIF_ASSERT(expr) do { (void)sizeof(expr); } while (false)
#define MOTIF_INVARIANT(expr) do { (void)sizeof(expr); } while (false)
#else
#define MOTIF_ASSERT(expr)                                                        \
  do {                                                                            \
    if (!(expr)) {                                                                \
      ::motif::detail::motif_trap(#expr, __FILE__, __LINE__);                     \
    }                                                                             \
  } while (false)
#define MOTIF_INVARIANT(expr) MOTIF_ASSERT(expr)
#endif

#define MOTIF_TRAP_ON_NAN(value)                                                  \
  ::motif::detail::check_finite(static_cast<double>(value), #value, __FILE__, __LINE__)
