#include "explain_format.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <utility>

namespace motif {
namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kBeginnerTerms = {{
    {"SEE +", "wins "},
    {"SEE -", "loses "},
    {"(SEE ", "("},
    {"singular move", "best move"},
    {"only good move", "best move"},
    {"advances passed pawn", "advances pawn"},
}};

void replace_all(std::string& text, std::string_view from, std::string_view to) {
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

bool contains_any(std::string_view haystack, std::initializer_list<std::string_view> needles) {
  return std::any_of(needles.begin(), needles.end(), [&](std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
  });
}

}  // namespace

std::string format_explanation(std::string_view text, ComplexityLevel level) {
  std::string out(text);
  if (level != ComplexityLevel::Beginner) {
    return out;
  }
  for (const auto& [from, to] : kBeginnerTerms) {
    replace_all(out, from, to);
  }
  return out;
}

ExplanationCategory categorize_explanation(std::string_view text) {
  if (text.empty()) {
    return ExplanationCategory::Unknown;
  }
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (contains_any(lower, {"fork", "pin", "skewer", "discovered", "sacrifice", "threat"})) {
    return ExplanationCategory::Tactical;
  }
  if (contains_any(lower, {"check", "forced", "only", "mate"})) {
    return ExplanationCategory::Forced;
  }
  if (contains_any(lower, {"endgame", "zugzwang", "bare king"})) {
    return ExplanationCategory::Endgame;
  }
  if (contains_any(lower, {"opening", "develops", "castles"})) {
    return ExplanationCategory::Opening;
  }
  if (contains_any(lower, {"pawn", "outpost", "centralizes", "king safety"})) {
    return ExplanationCategory::Positional;
  }
  if (contains_any(lower, {"advantage", "position", "balance"})) {
    return ExplanationCategory::Strategic;
  }
  return ExplanationCategory::Unknown;
}

std::string_view explanation_category_name(ExplanationCategory category) {
  switch (category) {
    case ExplanationCategory::Tactical:
      return "Tactical";
    case ExplanationCategory::Forced:
      return "Forced";
    case ExplanationCategory::Endgame:
      return "Endgame";
    case ExplanationCategory::Opening:
      return "Opening";
    case ExplanationCategory::Positional:
      return "Positional";
    case ExplanationCategory::Strategic:
      return "Strategic";
    case ExplanationCategory::Unknown:
      break;
  }
  return "Unknown";
}

}  // namespace motif
