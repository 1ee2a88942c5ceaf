#include "board.h"

#include <stdexcept>
#include <string_view>

#include <catch2/catch_test_macros.hpp>

namespace motif::test {

constexpr std::string_view kStartFen =
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

TEST_CASE("FEN round-trip maintains state", "[board]") {
  constexpr std::string_view custom_fen =
      "r1bqkbnr/pppp1ppp/2n5/4p3/2B1P3/5N2/PPPP1PPP/RNBQK2R w KQkq - 3 4";
  const Board board = Board::from_fen(custom_fen, true);
  REQUIRE(board.to_fen() == custom_fen);
  REQUIRE(Board::startpos().to_fen() == kStartFen);
}

TEST_CASE("Squares use row 0 for rank 8", "[board]") {
  const auto e8 = square_from_string("e8");
  REQUIRE(e8.has_value());
  REQUIRE(e8->row == 0);
  REQUIRE(e8->col == 4);
  REQUIRE(square_to_string(make_square(7, 0)) == "a1");
  REQUIRE_FALSE(square_from_string("i9").has_value());
  REQUIRE(Board::startpos().piece_on(*e8) == Piece::BKing);
}

TEST_CASE("Move codes outside 4-5 characters are rejected", "[board]") {
  REQUIRE(parse_move("e2e4").has_value());
  REQUIRE(parse_move("e7e8q")->promotion == PieceType::Queen);
  REQUIRE_FALSE(parse_move("e2").has_value());
  REQUIRE_FALSE(parse_move("e2e4e5").has_value());
  REQUIRE_FALSE(parse_move("e2e2").has_value());
  REQUIRE_FALSE(parse_move("e7e8x").has_value());
  REQUIRE(move_to_string(*parse_move("b1c3")) == "b1c3");
}

TEST_CASE("Strict FEN parsing rejects malformed input", "[board]") {
  REQUIRE_THROWS_AS(Board::from_fen("", true), std::runtime_error);
  REQUIRE_THROWS_AS(Board::from_fen("8/8/8/8 w - -", true), std::runtime_error);
  REQUIRE_THROWS_AS(Board::from_fen("8/8/8/8/8/8/8/9 w - -", true), std::runtime_error);
  REQUIRE_THROWS_AS(Board::from_fen("8/8/8/8/8/8/8/7X w - -", true), std::runtime_error);
  REQUIRE_THROWS_AS(Board::from_fen("4k3/8/8/8/8/8/8/4K3", true), std::runtime_error);
  REQUIRE_NOTHROW(Board::from_fen("4k3/8/8/8/8/8/8/4K3", false));
}

TEST_CASE("Applying moves handles captures, castling and en passant", "[board]") {
  Board board = Board::from_fen("4k3/8/8/3pP3/8/8/8/R3K2R w KQ d6 0 1", true);
  const Piece taken = board.apply(*parse_move("e5d6"));
  REQUIRE(taken == Piece::BPawn);
  REQUIRE(board.empty(*square_from_string("d5")));
  REQUIRE(board.side_to_move() == Color::Black);

  Board castle = Board::from_fen("4k3/8/8/8/8/8/8/R3K2R w KQ - 0 1", true);
  castle.apply(*parse_move("e1g1"));
  REQUIRE(castle.piece_on(*square_from_string("f1")) == Piece::WRook);
  REQUIRE(castle.piece_on(*square_from_string("g1")) == Piece::WKing);
  REQUIRE(castle.castling_rights() == CastleNone);

  Board promo = Board::from_fen("4k3/P7/8/8/8/8/8/4K3 w - - 0 1", true);
  promo.apply(*parse_move("a7a8n"));
  REQUIRE(promo.piece_on(*square_from_string("a8")) == Piece::WKnight);
}

TEST_CASE("Board key tracks placement and side", "[board]") {
  const Board a = Board::startpos();
  const Board b = Board::from_fen(kStartFen, true);
  REQUIRE(a.key() == b.key());
  const Board moved = a.after(*parse_move("e2e4"));
  REQUIRE(moved.key() != a.key());
  Board flipped = a;
  flipped.set_side_to_move(Color::Black);
  REQUIRE(flipped.key() != a.key());
}

TEST_CASE("Cleared board is empty and copies compare equal", "[board]") {
  Board board = Board::startpos();
  REQUIRE(board.piece_count() == 32);
  Board copy;
  copy.copy_from(board);
  REQUIRE(copy == board);
  board.clear();
  REQUIRE(board.piece_count() == 0);
  REQUIRE_FALSE(board.king_square(Color::White).has_value());
}

}  // namespace motif::test
