#pragma once
// board.h -- Fixed 8x8 mailbox board with FEN parsing and move application.
// No legality is enforced; callers may hand in any arrangement of pieces.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "common.h"

namespace motif {

enum CastlingRights : std::uint8_t {
  CastleNone = 0,
  CastleWK = 1 << 0,
  CastleWQ = 1 << 1,
  CastleBK = 1 << 2,
  CastleBQ = 1 << 3
};

class Board {
public:
  Board();

  // Strict parsing requires placement, side, castling and en-passant fields;
  // lenient parsing accepts the placement field alone. Throws std::runtime_error.
  static Board from_fen(std::string_view fen, bool strict = true);
  static Board startpos();
  std::string to_fen() const;

  [[nodiscard]] Piece piece_on(Square sq) const {
    MOTIF_ASSERT(is_valid(sq));
    return cells_[static_cast<std::size_t>(square_index(sq))];
  }
  [[nodiscard]] bool empty(Square sq) const { return piece_on(sq) == Piece::None; }
  void set_piece(Square sq, Piece pc) {
    MOTIF_ASSERT(is_valid(sq));
    cells_[static_cast<std::size_t>(square_index(sq))] = pc;
  }

  [[nodiscard]] Color side_to_move() const { return side_; }
  void set_side_to_move(Color c) { side_ = c; }
  [[nodiscard]] std::uint8_t castling_rights() const { return castling_; }
  [[nodiscard]] std::optional<Square> en_passant_square() const { return ep_square_; }

  [[nodiscard]] std::optional<Square> king_square(Color c) const;
  [[nodiscard]] int piece_count() const;
  [[nodiscard]] std::uint64_t key() const;

  // Plays `m` without legality checks and returns the captured piece.
  Piece apply(const Move& m);
  [[nodiscard]] Board after(const Move& m) const;

  void clear();
  void copy_from(const Board& other);

  bool operator==(const Board&) const = default;

private:
  std::array<Piece, kSquareCount> cells_{};
  Color side_{Color::White};
  std::uint8_t castling_{CastleNone};
  std::optional<Square> ep_square_{};
  std::uint16_t halfmove_clock_{0};
  std::uint16_t fullmove_number_{1};
};

}  // namespace motif
