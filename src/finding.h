#pragma once
// finding.h -- Detector output types shared by the tactic, defense and composer layers.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace motif {

enum class FindingCategory : std::uint8_t {
  Signal = 0,
  Capture,
  Sacrifice,
  Tactic,
  Defense,
  Check,
  Positional,
  Evaluation
};

struct Finding {
  std::string text;
  int importance{0};
  FindingCategory category{FindingCategory::Tactic};

  bool operator==(const Finding&) const = default;
};

enum class DetectError : std::uint8_t { None = 0, InvalidSquare, EmptySource, KingMissing, Internal };

// "No finding" and "could not look" are kept apart so callers and tests can tell them apart.
struct Detection {
  std::optional<Finding> finding{};
  DetectError error{DetectError::None};
  std::string message{};

  [[nodiscard]] bool ok() const { return error == DetectError::None; }
  [[nodiscard]] bool found() const { return finding.has_value(); }

  static Detection none() { return Detection{}; }
  static Detection hit(std::string text, int importance, FindingCategory category) {
    return Detection{Finding{std::move(text), importance, category}, DetectError::None, {}};
  }
  static Detection failure(DetectError error, std::string message) {
    return Detection{std::nullopt, error, std::move(message)};
  }
};

std::string_view category_name(FindingCategory category);
std::string_view detect_error_name(DetectError error);

}  // namespace motif
