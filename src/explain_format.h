#pragma once
// explain_format.h -- Complexity-level rewording and coarse categorisation of explanations.

#include <cstdint>
#include <string>
#include <string_view>

#include "analysisparams.h"

namespace motif {

// Beginner drops engine jargon ("(SEE +3)" becomes "(wins 3)"); other levels keep the text.
std::string format_explanation(std::string_view text, ComplexityLevel level);

enum class ExplanationCategory : std::uint8_t {
  Tactical = 0,
  Forced,
  Endgame,
  Opening,
  Positional,
  Strategic,
  Unknown
};

ExplanationCategory categorize_explanation(std::string_view text);
std::string_view explanation_category_name(ExplanationCategory category);

}  // namespace motif
