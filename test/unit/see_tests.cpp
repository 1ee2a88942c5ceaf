#include "see.h"

#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "debug.h"
#include "scratch_pool.h"

namespace motif::test {

namespace {

Square sq(std::string_view name) {
  return *square_from_string(name);
}

std::vector<std::string>* g_see_sink = nullptr;

void see_trace_writer(TraceTopic, std::string_view payload) {
  if (g_see_sink) {
    g_see_sink->emplace_back(payload);
  }
}

}  // namespace

TEST_CASE("Undefended victim yields its full value", "[see]") {
  const Board board = Board::from_fen("3b4/k7/8/8/8/8/8/3R3K w - - 0 1", true);
  REQUIRE(evaluate_exchange(board, sq("d8"), Piece::WRook, sq("d1")) == 3);
  REQUIRE(capture_gain(board, sq("d8"), Color::White) == 3);
  REQUIRE(is_winnable(board, sq("d8"), Color::White));
}

TEST_CASE("Recapture turns a grab into a loss", "[see]") {
  const Board board = Board::from_fen("4k3/8/4p3/3n4/8/8/8/3R3K w - - 0 1", true);
  REQUIRE(evaluate_exchange(board, sq("d5"), Piece::WRook, sq("d1")) == -2);
  REQUIRE(capture_gain(board, sq("d5"), Color::White) == -2);
  REQUIRE_FALSE(is_winnable(board, sq("d5"), Color::White));

  const Board pawn_grab = Board::from_fen("4k3/8/4p3/3p4/8/8/8/3Q3K w - - 0 1", true);
  REQUIRE(evaluate_exchange(pawn_grab, sq("d5"), Piece::WQueen, sq("d1")) == -8);
}

TEST_CASE("Pinned recapturer is not credited", "[see]") {
  const Board board = Board::from_fen("4k3/8/4p3/3n4/8/8/8/3RR2K w - - 0 1", true);
  REQUIRE(evaluate_exchange(board, sq("d5"), Piece::WRook, sq("d1")) == 3);
}

TEST_CASE("Recapture must answer a discovered check", "[see]") {
  const Board checked = Board::from_fen("4k3/8/2p5/3n4/4B3/8/8/4R2K w - - 0 1", true);
  REQUIRE(evaluate_exchange(checked, sq("d5"), Piece::WBishop, sq("e4")) == 3);
  const Board quiet = Board::from_fen("4k3/8/2p5/3n4/4B3/8/8/5R1K w - - 0 1", true);
  REQUIRE(evaluate_exchange(quiet, sq("d5"), Piece::WBishop, sq("e4")) == 0);
}

TEST_CASE("Batteries continue the exchange through the vacated square", "[see]") {
  const Board board = Board::from_fen("7k/8/5n2/3p4/8/8/3R4/3R3K w - - 0 1", true);
  REQUIRE(evaluate_exchange(board, sq("d5"), Piece::WRook, sq("d2")) == -1);
}

TEST_CASE("Equal trade evaluates to zero", "[see]") {
  const Board board = Board::from_fen("4k3/3q4/8/8/8/8/8/3Q3K w - - 0 1", true);
  REQUIRE(evaluate_exchange(board, sq("d7"), Piece::WQueen, sq("d1")) == 0);
}

TEST_CASE("Hypothetical attacker placement is simulated", "[see]") {
  const Board board = Board::from_fen("3b4/k7/8/8/8/8/8/7K w - - 0 1", true);
  REQUIRE(board.empty(sq("d1")));
  REQUIRE(evaluate_exchange(board, sq("d8"), Piece::WRook, sq("d1")) == 3);
  REQUIRE(board.empty(sq("d1")));
}

TEST_CASE("Invalid exchange inputs evaluate to zero", "[see]") {
  const Board board = Board::from_fen("3b4/k7/8/8/8/8/8/3R3K w - - 0 1", true);
  REQUIRE(evaluate_exchange(board, kNoSquare, Piece::WRook, sq("d1")) == 0);
  REQUIRE(evaluate_exchange(board, sq("d4"), Piece::WRook, sq("d1")) == 0);
  REQUIRE(evaluate_exchange(board, sq("d8"), Piece::BRook, sq("d1")) == 0);
  REQUIRE(evaluate_exchange(board, sq("d8"), Piece::None, sq("d1")) == 0);
  REQUIRE(capture_gain(board, sq("h1"), Color::White) == 0);
}

TEST_CASE("Exchange cache returns stored values and borrows pooled boards", "[see]") {
  const Board board = Board::from_fen("4k3/8/4p3/3n4/8/8/8/3R3K w - - 0 1", true);
  ScratchPool pool(4);
  SeeCache cache;
  AnalysisContext ctx;
  ctx.pool = &pool;
  ctx.see_cache = &cache;

  int cached = 0;
  REQUIRE_FALSE(cache.probe(board.key(), Piece::WRook, sq("d1"), sq("d5"), cached));
  REQUIRE(evaluate_exchange(board, sq("d5"), Piece::WRook, sq("d1"), &ctx) == -2);
  REQUIRE(cache.probe(board.key(), Piece::WRook, sq("d1"), sq("d5"), cached));
  REQUIRE(cached == -2);
  REQUIRE(evaluate_exchange(board, sq("d5"), Piece::WRook, sq("d1"), &ctx) == -2);

  const PoolStats stats = pool.stats();
  REQUIRE(stats.rented == 1);
  REQUIRE(stats.returned == 1);
  REQUIRE(pool.idle() == 1);

  cache.clear();
  REQUIRE_FALSE(cache.probe(board.key(), Piece::WRook, sq("d1"), sq("d5"), cached));
}

TEST_CASE("Exchange sequence is traced when enabled", "[see]") {
  const Board board = Board::from_fen("4k3/8/4p3/3n4/8/8/8/3R3K w - - 0 1", true);
  std::vector<std::string> payloads;
  g_see_sink = &payloads;
  set_trace_writer(&see_trace_writer);
  set_trace_topic(TraceTopic::See, true);

  REQUIRE(evaluate_exchange(board, sq("d5"), Piece::WRook, sq("d1")) == -2);

  set_trace_topic(TraceTopic::See, false);
  set_trace_writer(nullptr);
  g_see_sink = nullptr;

  REQUIRE(payloads.size() == 1);
  REQUIRE(payloads.front() == "trace see exchange on d5: Rd1(3) pe6(2) => -2");
}

}  // namespace motif::test
