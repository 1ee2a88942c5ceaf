#include "board.h"

#include <array>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

namespace motif {
namespace {

constexpr std::string_view kStartFen =
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

struct ZobristTables {
  std::array<std::array<std::uint64_t, kSquareCount>, 13> piece{};
  std::uint64_t side{0};
};

constexpr std::uint64_t splitmix64(std::uint64_t& state) {
  std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

const ZobristTables& zobrist_tables() {
  static const ZobristTables tables = [] {
    ZobristTables t{};
    std::uint64_t seed = 0xBADC0FFEE0DDF00DULL;
    for (auto& per_piece : t.piece) {
      for (auto& key : per_piece) {
        key = splitmix64(seed);
      }
    }
    t.side = splitmix64(seed);
    return t;
  }();
  return tables;
}

bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

void parse_placement(std::string_view placement, Board& board) {
  int row = 0;
  int col = 0;
  for (const char c : placement) {
    if (c == '/') {
      if (col != kBoardSize) {
        throw std::runtime_error("FEN rank does not cover 8 files");
      }
      ++row;
      col = 0;
      if (row >= kBoardSize) {
        throw std::runtime_error("FEN has more than 8 ranks");
      }
      continue;
    }
    if (is_digit(c)) {
      const int run = c - '0';
      if (run < 1 || run > 8) {
        throw std::runtime_error("Invalid empty-square run in FEN");
      }
      col += run;
    } else {
      const Piece pc = piece_from_char(c);
      if (pc == Piece::None) {
        throw std::runtime_error("Invalid piece in FEN");
      }
      if (col >= kBoardSize) {
        throw std::runtime_error("FEN rank overflows 8 files");
      }
      board.set_piece(make_square(row, col), pc);
      ++col;
    }
    if (col > kBoardSize) {
      throw std::runtime_error("FEN rank overflows 8 files");
    }
  }
  if (row != kBoardSize - 1 || col != kBoardSize) {
    throw std::runtime_error("FEN placement must describe 8 ranks");
  }
}

}  // namespace

Board::Board() {
  clear();
}

Board Board::from_fen(std::string_view fen, bool strict) {
  Board board;

  std::array<std::string_view, 6> fields{};
  std::size_t field_idx = 0;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= fen.size(); ++i) {
    if (i == fen.size() || fen[i] == ' ') {
      if (i > start && field_idx < fields.size()) {
        fields[field_idx++] = fen.substr(start, i - start);
      }
      start = i + 1;
    }
  }

  if (field_idx == 0) {
    throw std::runtime_error("FEN is empty");
  }
  if (strict && field_idx < 4) {
    throw std::runtime_error("FEN requires at least 4 fields");
  }

  parse_placement(fields[0], board);

  if (field_idx >= 2) {
    if (fields[1] == "b") {
      board.side_ = Color::Black;
    } else if (fields[1] == "w") {
      board.side_ = Color::White;
    } else if (strict) {
      throw std::runtime_error("Invalid side to move");
    }
  }

  if (field_idx >= 3 && fields[2] != "-") {
    for (const char c : fields[2]) {
      switch (c) {
        case 'K':
          board.castling_ |= CastleWK;
          break;
        case 'Q':
          board.castling_ |= CastleWQ;
          break;
        case 'k':
          board.castling_ |= CastleBK;
          break;
        case 'q':
          board.castling_ |= CastleBQ;
          break;
        default:
          if (strict) {
            throw std::runtime_error("Invalid castling rights");
          }
      }
    }
  }

  if (field_idx >= 4 && fields[3] != "-") {
    const auto ep_sq = square_from_string(fields[3]);
    if (ep_sq) {
      board.ep_square_ = *ep_sq;
    } else if (strict) {
      throw std::runtime_error("Invalid en passant square");
    }
  }

  if (field_idx >= 5) {
    std::from_chars(fields[4].data(), fields[4].data() + fields[4].size(),
                    board.halfmove_clock_);
  }
  if (field_idx >= 6) {
    std::from_chars(fields[5].data(), fields[5].data() + fields[5].size(),
                    board.fullmove_number_);
  }

  return board;
}

Board Board::startpos() {
  return from_fen(kStartFen, true);
}

std::string Board::to_fen() const {
  std::ostringstream oss;
  for (int row = 0; row < kBoardSize; ++row) {
    int empty_run = 0;
    for (int col = 0; col < kBoardSize; ++col) {
      const Piece pc = piece_on(make_square(row, col));
      if (pc == Piece::None) {
        ++empty_run;
      } else {
        if (empty_run > 0) {
          oss << empty_run;
          empty_run = 0;
        }
        oss << piece_to_char(pc);
      }
    }
    if (empty_run > 0) {
      oss << empty_run;
    }
    if (row < kBoardSize - 1) {
      oss << '/';
    }
  }
  oss << ' ' << (side_ == Color::White ? 'w' : 'b') << ' ';
  if (castling_ == CastleNone) {
    oss << '-';
  } else {
    if (castling_ & CastleWK) oss << 'K';
    if (castling_ & CastleWQ) oss << 'Q';
    if (castling_ & CastleBK) oss << 'k';
    if (castling_ & CastleBQ) oss << 'q';
  }
  oss << ' ' << (ep_square_ ? square_to_string(*ep_square_) : std::string{"-"});
  oss << ' ' << halfmove_clock_ << ' ' << fullmove_number_;
  return oss.str();
}

std::optional<Square> Board::king_square(Color c) const {
  const Piece king = make_piece(c, PieceType::King);
  for (int idx = 0; idx < kSquareCount; ++idx) {
    if (cells_[static_cast<std::size_t>(idx)] == king) {
      return square_at(idx);
    }
  }
  return std::nullopt;
}

int Board::piece_count() const {
  int count = 0;
  for (const Piece pc : cells_) {
    if (pc != Piece::None) {
      ++count;
    }
  }
  return count;
}

std::uint64_t Board::key() const {
  const auto& tables = zobrist_tables();
  std::uint64_t key = 0ULL;
  for (int idx = 0; idx < kSquareCount; ++idx) {
    const Piece pc = cells_[static_cast<std::size_t>(idx)];
    if (pc != Piece::None) {
      key ^= tables.piece[static_cast<std::size_t>(pc)][static_cast<std::size_t>(idx)];
    }
  }
  if (side_ == Color::Black) {
    key ^= tables.side;
  }
  return key;
}

Piece Board::apply(const Move& m) {
  MOTIF_ASSERT(!m.is_null());
  Piece moving = piece_on(m.from);
  Piece captured = piece_on(m.to);
  const Color us = color_of(moving);
  const PieceType type = type_of(moving);

  if (type == PieceType::Pawn && m.from.col != m.to.col && captured == Piece::None) {
    // Diagonal pawn step onto an empty square can only be en passant.
    const Square victim_sq = make_square(m.from.row, m.to.col);
    if (type_of(piece_on(victim_sq)) == PieceType::Pawn &&
        color_of(piece_on(victim_sq)) != us) {
      captured = piece_on(victim_sq);
      set_piece(victim_sq, Piece::None);
    }
  }

  if (type == PieceType::King && m.from.row == m.to.row && std::abs(m.to.col - m.from.col) == 2) {
    const bool kingside = m.to.col > m.from.col;
    const Square rook_from = make_square(m.from.row, kingside ? kBoardSize - 1 : 0);
    const Square rook_to = make_square(m.from.row, kingside ? m.to.col - 1 : m.to.col + 1);
    if (type_of(piece_on(rook_from)) == PieceType::Rook) {
      set_piece(rook_to, piece_on(rook_from));
      set_piece(rook_from, Piece::None);
    }
  }

  if (m.promotion != PieceType::None && moving != Piece::None) {
    moving = make_piece(us, m.promotion);
  }

  set_piece(m.to, moving);
  set_piece(m.from, Piece::None);

  ep_square_.reset();
  if (type == PieceType::Pawn && std::abs(m.to.row - m.from.row) == 2) {
    ep_square_ = make_square((m.to.row + m.from.row) / 2, m.from.col);
  }
  if (type == PieceType::King) {
    castling_ &= static_cast<std::uint8_t>(us == Color::White ? ~(CastleWK | CastleWQ)
                                                              : ~(CastleBK | CastleBQ));
  }
  if (moving != Piece::None) {
    side_ = flip(us);
  }
  halfmove_clock_ = (type == PieceType::Pawn || captured != Piece::None)
                        ? 0
                        : static_cast<std::uint16_t>(halfmove_clock_ + 1);
  if (us == Color::Black) {
    ++fullmove_number_;
  }
  return captured;
}

Board Board::after(const Move& m) const {
  Board copy = *this;
  copy.apply(m);
  return copy;
}

void Board::clear() {
  cells_.fill(Piece::None);
  side_ = Color::White;
  castling_ = CastleNone;
  ep_square_.reset();
  halfmove_clock_ = 0;
  fullmove_number_ = 1;
}

void Board::copy_from(const Board& other) {
  *this = other;
}

}  // namespace motif
