#include "finding.h"

namespace motif {

std::string_view category_name(FindingCategory category) {
  switch (category) {
    case FindingCategory::Signal:
      return "signal";
    case FindingCategory::Capture:
      return "capture";
    case FindingCategory::Sacrifice:
      return "sacrifice";
    case FindingCategory::Tactic:
      return "tactic";
    case FindingCategory::Defense:
      return "defense";
    case FindingCategory::Check:
      return "check";
    case FindingCategory::Positional:
      return "positional";
    case FindingCategory::Evaluation:
      return "evaluation";
  }
  return "unknown";
}

std::string_view detect_error_name(DetectError error) {
  switch (error) {
    case DetectError::None:
      return "none";
    case DetectError::InvalidSquare:
      return "invalid-square";
    case DetectError::EmptySource:
      return "empty-source";
    case DetectError::KingMissing:
      return "king-missing";
    case DetectError::Internal:
      return "internal";
  }
  return "unknown";
}

}  // namespace motif
