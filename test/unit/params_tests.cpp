#include "analysisparams.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <string>

namespace motif::test {

TEST_CASE("Defaults match the documented thresholds", "[params]") {
  const AnalysisParams params;
  REQUIRE(params.decisive_advantage == Catch::Approx(2.0));
  REQUIRE(params.bad_position == Catch::Approx(0.70));
  REQUIRE(params.sacrifice_min_material == 2);
  REQUIRE(params.pin_min_gain == 4);
  REQUIRE(params.singular_gap == Catch::Approx(1.5));
  REQUIRE(params.perpetual_min_plies == 8);
  REQUIRE(params.perpetual_check_ratio == Catch::Approx(0.6));
  REQUIRE(params.show_see_values);
  REQUIRE(params.complexity == ComplexityLevel::Intermediate);
}

TEST_CASE("Numeric options parse and clamp", "[params]") {
  AnalysisParams params;
  std::string error;
  REQUIRE(set_param(params, "Decisive Advantage", "3.5", error));
  REQUIRE(params.decisive_advantage == Catch::Approx(3.5));
  REQUIRE(error.empty());

  REQUIRE(set_param(params, "Perpetual Check Ratio", "1.7", error));
  REQUIRE(params.perpetual_check_ratio == Catch::Approx(1.0));

  REQUIRE(set_param(params, "Sacrifice Min Material", "42", error));
  REQUIRE(params.sacrifice_min_material == 9);

  REQUIRE(set_param(params, "Pin Min Gain", "2.6", error));
  REQUIRE(params.pin_min_gain == 3);

  REQUIRE(set_param(params, "Exchange Sacrifice Floor", "-1.25", error));
  REQUIRE(params.exchange_sacrifice_floor == Catch::Approx(-1.25));
}

TEST_CASE("Malformed values leave the field untouched", "[params]") {
  AnalysisParams params;
  std::string error;
  REQUIRE_FALSE(set_param(params, "Singular Gap", "wide", error));
  REQUIRE(error == "expected a number, got 'wide'");
  REQUIRE(params.singular_gap == Catch::Approx(1.5));

  REQUIRE_FALSE(set_param(params, "Perpetual Window", "", error));
  REQUIRE(params.perpetual_window == 12);

  REQUIRE_FALSE(set_param(params, "Show SEE Values", "maybe", error));
  REQUIRE(params.show_see_values);

  REQUIRE_FALSE(set_param(params, "Hash", "64", error));
  REQUIRE(error == "unknown option 'Hash'");
}

TEST_CASE("Boolean and complexity options", "[params]") {
  AnalysisParams params;
  std::string error;
  REQUIRE(set_param(params, "Show SEE Values", "FALSE", error));
  REQUIRE_FALSE(params.show_see_values);
  REQUIRE(set_param(params, "Show SEE Values", "1", error));
  REQUIRE(params.show_see_values);

  REQUIRE(set_param(params, "Complexity", "beginner", error));
  REQUIRE(params.complexity == ComplexityLevel::Beginner);
  REQUIRE(complexity_name(params.complexity) == "Beginner");
  REQUIRE_FALSE(set_param(params, "Complexity", "grandmaster", error));
  REQUIRE(params.complexity == ComplexityLevel::Beginner);
}

}  // namespace motif::test
