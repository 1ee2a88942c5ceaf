#include "tactics.h"

#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "scratch_pool.h"
#include "see.h"

namespace motif::test {

namespace {

struct Played {
  Board before;
  Board after;
  Move move;
};

Played play(std::string_view fen, std::string_view uci) {
  Played p{Board::from_fen(fen, false), Board{}, *parse_move(uci)};
  p.after = p.before.after(p.move);
  return p;
}

Detection run(Detector detect, std::string_view fen, std::string_view uci,
              const std::vector<PvLine>* pv = nullptr,
              const AnalysisParams& params = AnalysisParams{}) {
  const Played p = play(fen, uci);
  ScratchPool pool;
  AnalysisContext ctx;
  ctx.pool = &pool;
  ctx.params = params;
  const TacticInput in{p.before, p.after, p.move, p.after.piece_on(p.move.to),
                       color_of(p.before.piece_on(p.move.from)), pv};
  return detect(in, ctx);
}

std::string text_of(const Detection& d) {
  return d.found() ? d.finding->text : std::string{};
}

}  // namespace

TEST_CASE("Knight on king and queen is a royal fork", "[tactics][fork]") {
  const Detection d = run(&detect_fork, "8/3q4/6k1/8/2N5/8/8/K7 w - - 0 1", "c4e5");
  REQUIRE(d.ok());
  REQUIRE(text_of(d) == "royal fork (king and queen)");
  REQUIRE(d.finding->importance == 10);
}

TEST_CASE("Royal fork fires even when the knight can be taken", "[tactics][fork]") {
  const Detection d = run(&detect_fork, "8/3q4/3p2k1/8/2N5/8/8/K7 w - - 0 1", "c4e5");
  REQUIRE(text_of(d) == "royal fork (king and queen)");
}

TEST_CASE("Knight fork of two rooks", "[tactics][fork]") {
  const Detection d = run(&detect_fork, "2r1r3/8/8/1N5k/8/8/8/K7 w - - 0 1", "b5d6");
  REQUIRE(text_of(d) == "forks rook and rook");
}

TEST_CASE("Bishop pins knight to king", "[tactics][pin]") {
  const Detection d = run(&detect_pin, "4k3/8/2n5/8/8/8/8/4KB2 w - - 0 1", "f1b5");
  REQUIRE(text_of(d) == "pins knight to king (absolute)");
  REQUIRE(d.finding->category == FindingCategory::Tactic);
}

TEST_CASE("Knights never pin", "[tactics][pin]") {
  const Detection d = run(&detect_pin, "8/3q4/6k1/8/2N5/8/8/K7 w - - 0 1", "c4e5");
  REQUIRE(d.ok());
  REQUIRE_FALSE(d.found());
}

TEST_CASE("Rook skewers king to rook", "[tactics][skewer]") {
  const Detection d = run(&detect_skewer, "4r3/8/4k3/8/8/8/7K/R7 w - - 0 1", "a1e1");
  REQUIRE(text_of(d) == "skewers king, winning rook");
}

TEST_CASE("Discovered check that also hits the queen", "[tactics][discovered]") {
  const Detection d =
      run(&detect_discovered_attack, "4k3/3q4/8/8/4N3/8/8/4R2K w - - 0 1", "e4c5");
  REQUIRE(text_of(d) == "discovered check, wins queen");
}

TEST_CASE("Knight check plus rook check is a double check", "[tactics][check]") {
  const Detection d = run(&detect_double_check, "4k3/8/8/8/4N3/8/8/4R2K w - - 0 1", "e4f6");
  REQUIRE(text_of(d) == "double check!");
  const Detection single = run(&detect_double_check, "4k3/8/8/8/4N3/8/8/4R2K w - - 0 1", "e4c3");
  REQUIRE_FALSE(single.found());
}

TEST_CASE("Bishop creates a threat on the queen", "[tactics][threat]") {
  const Detection d = run(&detect_threat, "4k3/8/8/q7/8/8/8/2B1K3 w - - 0 1", "c1d2");
  REQUIRE(text_of(d) == "creates threat on queen");
}

TEST_CASE("Back rank patterns", "[tactics][backrank]") {
  const Detection mate = run(&detect_back_rank, "7k/5ppp/8/8/8/8/8/4Q2K w - - 0 1", "e1e8");
  REQUIRE(text_of(mate) == "back rank mate threat");

  const Detection quiet = run(&detect_back_rank, "5b1k/6pp/8/8/8/8/8/4R2K w - - 0 1", "e1e8");
  REQUIRE(text_of(quiet) == "threatens back rank");

  const Detection escape = run(&detect_back_rank, "7k/5pp1/8/8/8/8/8/4Q2K w - - 0 1", "e1e8");
  REQUIRE_FALSE(escape.found());

  const Detection takes_checker =
      run(&detect_back_rank, "6k1/6pp/8/8/8/8/8/5R1K w - - 0 1", "f1f8");
  REQUIRE_FALSE(takes_checker.found());
}

TEST_CASE("Pawn near promotion", "[tactics][promotion]") {
  REQUIRE(text_of(run(&detect_promotion_threat, "4k3/8/P7/8/8/8/8/4K3 w - - 0 1", "a6a7")) ==
          "threatens promotion");
  const Detection passed =
      run(&detect_promotion_threat, "4k3/8/8/P7/8/8/8/4K3 w - - 0 1", "a5a6");
  REQUIRE(text_of(passed) == "advances passed pawn");
  REQUIRE(passed.finding->category == FindingCategory::Positional);
  REQUIRE_FALSE(
      run(&detect_promotion_threat, "4k3/1p6/8/P7/8/8/8/4K3 w - - 0 1", "a5a6").found());
}

TEST_CASE("Undefended piece without escape squares", "[tactics][hanging]") {
  constexpr std::string_view fen = "n7/8/1P6/P5k1/8/8/8/4K2R w - - 0 1";
  REQUIRE(text_of(run(&detect_hanging_piece, fen, "h1h8")) == "wins undefended knight");
  REQUIRE(text_of(run(&detect_trapped_piece, fen, "h1h8")) == "traps knight");
}

TEST_CASE("Capturing the only defender", "[tactics][removal]") {
  const Detection d =
      run(&detect_removal_of_defender, "7k/8/2n5/1B2b3/8/8/8/4R1K1 w - - 0 1", "b5c6");
  REQUIRE(text_of(d) == "removes defender of bishop");
}

TEST_CASE("Defender with two duties is overloaded", "[tactics][overloading]") {
  const Detection d =
      run(&detect_overloading, "3r1n2/8/3b4/k7/7B/8/8/K7 w - - 0 1", "h4e7");
  REQUIRE(text_of(d) == "overloads defender of knight and bishop");
}

TEST_CASE("Luring the only guard of a king square", "[tactics][deflection]") {
  const Detection d = run(&detect_deflection, "5b1k/8/8/8/8/8/8/R1K3Q1 w - - 0 1", "a1a3");
  REQUIRE(text_of(d) == "deflects key defender");
}

TEST_CASE("Rook battery behind a defended target is an x-ray", "[tactics][xray]") {
  const Detection d = run(&detect_xray, "4b2k/3n4/8/8/3R4/8/8/Q6K w - - 0 1", "a1d1");
  REQUIRE(text_of(d) == "x-ray attack");
}

TEST_CASE("Decoy requires the king to take per the main line", "[tactics][decoy]") {
  constexpr std::string_view fen = "6k1/8/8/8/8/8/8/K6R w - - 0 1";
  const std::vector<PvLine> pv{parse_pv_line("h1h8+ g8h8 a1b2")};
  const Detection d = run(&detect_decoy, fen, "h1h8", &pv);
  REQUIRE(text_of(d) == "decoy sacrifice");
  REQUIRE(d.finding->category == FindingCategory::Sacrifice);

  const std::vector<PvLine> declined{parse_pv_line("h1h8+ g8f7 h8h7+")};
  REQUIRE_FALSE(run(&detect_decoy, fen, "h1h8", &declined).found());
  REQUIRE_FALSE(run(&detect_decoy, fen, "h1h8").found());
}

TEST_CASE("Perpetual check needs repetition and enough checks", "[tactics][perpetual]") {
  constexpr std::string_view fen = "6k1/5ppp/8/8/8/8/8/K3Q3 w - - 0 1";
  const std::vector<PvLine> alternating{
      parse_pv_line("Qe8+ Kh7 Qh5+ Kg8 Qe8+ Kh7 Qh5+ Kg8 (0.00)")};
  REQUIRE_FALSE(run(&detect_perpetual_check, fen, "e1e8", &alternating).found());

  AnalysisParams relaxed;
  relaxed.perpetual_check_ratio = 0.5;
  REQUIRE(text_of(run(&detect_perpetual_check, fen, "e1e8", &alternating, relaxed)) ==
          "perpetual check");

  const std::vector<PvLine> all_checks{
      parse_pv_line("Qe8+ Kh7+ Qh5+ Kg8+ Qe8+ Kh7+ Qh5+ Kg8+")};
  REQUIRE(text_of(run(&detect_perpetual_check, fen, "e1e8", &all_checks)) == "perpetual check");

  const std::vector<PvLine> short_line{parse_pv_line("Qe8+ Kh7+ Qh5+ Kg8+ Qe8+ Kh7+")};
  REQUIRE_FALSE(run(&detect_perpetual_check, fen, "e1e8", &short_line).found());
}

TEST_CASE("Plain checks", "[tactics][check]") {
  REQUIRE(text_of(run(&detect_check, "4k3/8/8/8/8/8/8/R6K w - - 0 1", "a1a8")) == "gives check");
  REQUIRE(text_of(run(&detect_check, "4k3/r7/8/8/8/8/8/Q6K w - - 0 1", "a1a4")) ==
          "check with attack");
  REQUIRE_FALSE(run(&detect_check, "4k3/8/8/8/8/8/8/R6K w - - 0 1", "a1a2").found());
}

TEST_CASE("Detectors report malformed input instead of guessing", "[tactics][errors]") {
  const Board before = Board::from_fen("4k3/8/8/8/8/8/8/R6K w - - 0 1", false);
  const Board after = before;
  AnalysisContext ctx;

  const TacticInput off_board{before, after, Move{}, Piece::WRook, Color::White, nullptr};
  REQUIRE(detect_check(off_board, ctx).error == DetectError::InvalidSquare);

  const Move ghost = *parse_move("c3c4");
  const TacticInput empty{before, after, ghost, Piece::WRook, Color::White, nullptr};
  const Detection d = detect_fork(empty, ctx);
  REQUIRE(d.error == DetectError::EmptySource);
  REQUIRE_FALSE(d.found());

  const Board no_king = Board::from_fen("8/8/8/8/8/8/8/R6K w - - 0 1", false);
  const Move up = *parse_move("a1a8");
  const Board moved = no_king.after(up);
  const TacticInput kingless{no_king, moved, up, Piece::WRook, Color::White, nullptr};
  REQUIRE(detect_double_check(kingless, ctx).error == DetectError::KingMissing);
}

TEST_CASE("Battery lists detectors in priority order", "[tactics]") {
  const auto battery = tactic_battery();
  REQUIRE(battery.size() == 19);
  REQUIRE(battery.front().name == "threat");
  REQUIRE(battery[5].name == "fork");
  REQUIRE(battery.back().name == "check");
}

}  // namespace motif::test
