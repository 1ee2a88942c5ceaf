#include "defense.h"

#include <algorithm>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

namespace motif::test {

namespace {

std::vector<Finding> defenses(std::string_view fen, std::string_view uci) {
  const Board board = Board::from_fen(fen, false);
  const Move move = *parse_move(uci);
  AnalysisContext ctx;
  return analyze_defenses(board, move, color_of(board.piece_on(move.from)), ctx);
}

bool has_text(const std::vector<Finding>& found, std::string_view text) {
  return std::any_of(found.begin(), found.end(),
                     [&](const Finding& f) { return f.text == text; });
}

}  // namespace

TEST_CASE("King steps out of check", "[defense]") {
  const auto found = defenses("4r2k/8/8/8/8/8/8/4K3 w - - 0 1", "e1d1");
  REQUIRE_FALSE(found.empty());
  REQUIRE(found.front().text == "gets out of check");
  REQUIRE(found.front().importance == 5);
}

TEST_CASE("Interposing on the second rank eases king pressure", "[defense]") {
  constexpr std::string_view fen = "4k3/8/8/8/8/8/r7/3R3K w - - 0 1";
  REQUIRE(has_text(defenses(fen, "d1d2"), "improves king safety"));
  REQUIRE_FALSE(has_text(defenses(fen, "d1d8"), "improves king safety"));
}

TEST_CASE("Attacked knight retreats to safety", "[defense]") {
  constexpr std::string_view fen = "4r2k/8/8/4p3/3N4/8/8/K7 w - - 0 1";
  REQUIRE(has_text(defenses(fen, "d4b3"), "saves knight"));
  REQUIRE_FALSE(has_text(defenses(fen, "d4e6"), "saves knight"));
}

TEST_CASE("Rook lift defends the hanging bishop", "[defense]") {
  const auto found = defenses("2r4k/8/8/8/2B5/8/8/R6K w - - 0 1", "a1a4");
  REQUIRE(has_text(found, "defends bishop on c4"));
}

TEST_CASE("Knight interposes on the file", "[defense]") {
  const auto found = defenses("4r2k/8/8/8/6N1/8/4B3/7K w - - 0 1", "g4e5");
  REQUIRE(has_text(found, "blocks attack on bishop"));
}

TEST_CASE("Parrying a mate in one", "[defense]") {
  const auto found = defenses("6k1/8/8/8/8/8/5PPP/r3R1K1 w - - 0 1", "e1a1");
  REQUIRE(has_text(found, "stops mate threat"));
}

TEST_CASE("Defense findings are capped and ordered", "[defense]") {
  const auto found = defenses("4r2k/8/8/8/8/8/8/4K3 w - - 0 1", "e1d1");
  REQUIRE(found.size() <= kMaxDefenseFindings);
  REQUIRE(std::is_sorted(found.begin(), found.end(), [](const Finding& a, const Finding& b) {
    return a.importance > b.importance;
  }));
  REQUIRE(defenses("4k3/8/8/8/8/8/8/4K3 w - - 0 1", "e1e2").empty());
}

TEST_CASE("Empty source square yields nothing", "[defense]") {
  REQUIRE(defenses("4k3/8/8/8/8/8/8/4K3 w - - 0 1", "c3c4").empty());
}

}  // namespace motif::test
