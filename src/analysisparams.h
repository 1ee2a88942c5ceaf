#pragma once
// analysisparams.h -- POD container for every tunable threshold used during analysis.
// Shared by the detectors, the classifier and the protocol layer's setoption.

#include <cstdint>
#include <string>
#include <string_view>

namespace motif {

enum class ComplexityLevel : std::uint8_t { Beginner = 0, Intermediate, Advanced, Master };

struct AnalysisParams {
  // Brilliancy gates, in pawns from the mover's point of view.
  double decisive_advantage{2.0};
  double bad_position{0.70};
  int sacrifice_min_material{2};

  int pin_min_gain{4};
  double singular_gap{1.5};

  int perpetual_min_plies{8};
  double perpetual_check_ratio{0.6};
  int perpetual_window{12};

  double exchange_sacrifice_floor{-0.5};
  double sacrifice_floor{0.5};

  double blunder_drop{3.0};
  double mistake_drop{1.5};
  double inaccuracy_drop{0.75};

  bool show_see_values{true};
  ComplexityLevel complexity{ComplexityLevel::Intermediate};
};

// setoption-style update. Names match the protocol's option names
// ("Decisive Advantage", "Show SEE Values", ...). Numeric values are clamped.
bool set_param(AnalysisParams& params, std::string_view name, std::string_view value,
               std::string& error);

std::string_view complexity_name(ComplexityLevel level);

}  // namespace motif
