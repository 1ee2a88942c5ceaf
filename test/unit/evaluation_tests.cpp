#include "evaluation.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace motif::test {

TEST_CASE("Decimal evaluations parse with or without sign", "[evaluation]") {
  REQUIRE(parse_evaluation("+1.50")->pawns == Catch::Approx(1.5));
  REQUIRE(parse_evaluation("-0.75")->pawns == Catch::Approx(-0.75));
  REQUIRE(parse_evaluation(" 0.00 ")->pawns == Catch::Approx(0.0));
  REQUIRE_FALSE(parse_evaluation("+1.50")->mate);
  REQUIRE_FALSE(parse_evaluation("").has_value());
  REQUIRE_FALSE(parse_evaluation("winning").has_value());
  REQUIRE_FALSE(parse_evaluation("1.5x").has_value());
}

TEST_CASE("Mate announcements map to the mate score", "[evaluation]") {
  const auto mate = parse_evaluation("Mate in 3");
  REQUIRE(mate.has_value());
  REQUIRE(mate->mate);
  REQUIRE(mate->mate_in == 3);
  REQUIRE(mate->pawns == Catch::Approx(kMateScore));

  const auto mated = parse_evaluation("Mate in -2");
  REQUIRE(mated->pawns == Catch::Approx(-kMateScore));
  REQUIRE(mated->mate_in == -2);
}

TEST_CASE("Scores are turned to the mover's point of view", "[evaluation]") {
  const Evaluation decimal{1.25, false, 0};
  REQUIRE(mover_score(decimal, Color::White) == Catch::Approx(1.25));
  REQUIRE(mover_score(decimal, Color::Black) == Catch::Approx(-1.25));
  const Evaluation mate{kMateScore, true, 2};
  REQUIRE(mover_score(mate, Color::Black) == Catch::Approx(kMateScore));
}

TEST_CASE("PV lines strip numbering, annotations and check marks", "[evaluation][pv]") {
  const PvLine line = parse_pv_line("1. e2e4 e7e5 2. g1f3+ Nc6!? (+0.35)");
  REQUIRE(line.moves.size() == 4);
  REQUIRE(line.moves[0].uci.has_value());
  REQUIRE(move_to_string(*line.moves[0].uci) == "e2e4");
  REQUIRE(line.moves[2].check);
  REQUIRE(line.moves[2].text == "g1f3");
  REQUIRE(line.moves[3].text == "Nc6");
  REQUIRE_FALSE(line.moves[3].uci.has_value());
  REQUIRE(line.eval.has_value());
  REQUIRE(line.eval->pawns == Catch::Approx(0.35));

  const PvLine mate = parse_pv_line("Qxf7#");
  REQUIRE(mate.moves.size() == 1);
  REQUIRE(mate.moves[0].mate);
  REQUIRE(mate.moves[0].check);
  REQUIRE(parse_pv_line("   ").empty());
}

TEST_CASE("Singular move needs a wide gap between the top lines", "[evaluation][pv]") {
  std::vector<PvLine> lines{parse_pv_line("e2e4 (+2.00)"), parse_pv_line("d2d4 (+0.50)")};
  REQUIRE(is_singular(lines, 1.5));
  lines[1] = parse_pv_line("d2d4 (+0.51)");
  REQUIRE_FALSE(is_singular(lines, 1.5));
  REQUIRE_FALSE(is_singular({parse_pv_line("e2e4 (+2.00)")}, 1.5));
  REQUIRE_FALSE(is_singular({parse_pv_line("e2e4"), parse_pv_line("d2d4 (+0.50)")}, 1.5));
}

TEST_CASE("Evaluation drops are graded for the mover", "[evaluation]") {
  const AnalysisParams params;
  const Evaluation before{1.0, false, 0};
  REQUIRE(classify_eval_drop(before, Evaluation{-2.0, false, 0}, Color::White, params) ==
          EvalDrop::Blunder);
  REQUIRE(classify_eval_drop(before, Evaluation{-0.5, false, 0}, Color::White, params) ==
          EvalDrop::Mistake);
  REQUIRE(classify_eval_drop(before, Evaluation{0.25, false, 0}, Color::White, params) ==
          EvalDrop::Inaccuracy);
  REQUIRE(classify_eval_drop(before, Evaluation{0.5, false, 0}, Color::White, params) ==
          EvalDrop::None);
  // Black gains when White's score falls.
  REQUIRE(classify_eval_drop(before, Evaluation{-2.0, false, 0}, Color::Black, params) ==
          EvalDrop::None);
  REQUIRE(eval_drop_name(EvalDrop::Blunder) == "Blunder");
}

}  // namespace motif::test
