#include "analysisparams.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <optional>

namespace motif {
namespace {

std::optional<std::int64_t> parse_int(std::string_view token) {
  std::int64_t value = 0;
  const auto* begin = token.data();
  const auto* end = begin + token.size();
  const auto result = std::from_chars(begin, end, value);
  if (result.ec == std::errc{} && result.ptr == end) {
    return value;
  }
  return std::nullopt;
}

std::optional<double> parse_double(std::string_view token) {
  if (token.empty()) {
    return std::nullopt;
  }
  std::string copy(token);
  char* end = nullptr;
  const double value = std::strtod(copy.c_str(), &end);
  if (end == copy.c_str() || (end && *end != '\0') || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::string lowercase(std::string_view sv) {
  std::string out(sv.begin(), sv.end());
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool assign_double(double& field, std::string_view value, double lo, double hi,
                   std::string& error) {
  if (auto parsed = parse_double(value)) {
    field = std::clamp(*parsed, lo, hi);
    return true;
  }
  error = "expected a number, got '" + std::string(value) + "'";
  return false;
}

bool assign_int(int& field, std::string_view value, int lo, int hi, std::string& error) {
  if (auto parsed = parse_int(value)) {
    field = static_cast<int>(std::clamp<std::int64_t>(*parsed, lo, hi));
    return true;
  }
  if (auto parsed = parse_double(value)) {
    const auto rounded = static_cast<std::int64_t>(std::llround(*parsed));
    field = static_cast<int>(std::clamp<std::int64_t>(rounded, lo, hi));
    return true;
  }
  error = "expected an integer, got '" + std::string(value) + "'";
  return false;
}

}  // namespace

bool set_param(AnalysisParams& params, std::string_view name, std::string_view value,
               std::string& error) {
  error.clear();
  if (name == "Decisive Advantage") {
    return assign_double(params.decisive_advantage, value, 0.0, 100.0, error);
  }
  if (name == "Bad Position") {
    return assign_double(params.bad_position, value, 0.0, 100.0, error);
  }
  if (name == "Sacrifice Min Material") {
    return assign_int(params.sacrifice_min_material, value, 1, 9, error);
  }
  if (name == "Pin Min Gain") {
    return assign_int(params.pin_min_gain, value, 0, 9, error);
  }
  if (name == "Singular Gap") {
    return assign_double(params.singular_gap, value, 0.0, 100.0, error);
  }
  if (name == "Perpetual Min Plies") {
    return assign_int(params.perpetual_min_plies, value, 2, 64, error);
  }
  if (name == "Perpetual Check Ratio") {
    return assign_double(params.perpetual_check_ratio, value, 0.0, 1.0, error);
  }
  if (name == "Perpetual Window") {
    return assign_int(params.perpetual_window, value, 2, 64, error);
  }
  if (name == "Exchange Sacrifice Floor") {
    return assign_double(params.exchange_sacrifice_floor, value, -100.0, 100.0, error);
  }
  if (name == "Sacrifice Floor") {
    return assign_double(params.sacrifice_floor, value, -100.0, 100.0, error);
  }
  if (name == "Blunder Threshold") {
    return assign_double(params.blunder_drop, value, 0.0, 100.0, error);
  }
  if (name == "Mistake Threshold") {
    return assign_double(params.mistake_drop, value, 0.0, 100.0, error);
  }
  if (name == "Inaccuracy Threshold") {
    return assign_double(params.inaccuracy_drop, value, 0.0, 100.0, error);
  }
  if (name == "Show SEE Values") {
    const std::string lowered = lowercase(value);
    if (lowered == "true" || lowered == "1") {
      params.show_see_values = true;
      return true;
    }
    if (lowered == "false" || lowered == "0") {
      params.show_see_values = false;
      return true;
    }
    error = "expected true or false, got '" + std::string(value) + "'";
    return false;
  }
  if (name == "Complexity") {
    const std::string lowered = lowercase(value);
    for (const ComplexityLevel level : {ComplexityLevel::Beginner, ComplexityLevel::Intermediate,
                                        ComplexityLevel::Advanced, ComplexityLevel::Master}) {
      if (lowered == lowercase(complexity_name(level))) {
        params.complexity = level;
        return true;
      }
    }
    error = "unknown complexity '" + std::string(value) + "'";
    return false;
  }
  error = "unknown option '" + std::string(name) + "'";
  return false;
}

std::string_view complexity_name(ComplexityLevel level) {
  switch (level) {
    case ComplexityLevel::Beginner:
      return "Beginner";
    case ComplexityLevel::Intermediate:
      return "Intermediate";
    case ComplexityLevel::Advanced:
      return "Advanced";
    case ComplexityLevel::Master:
      return "Master";
  }
  return "Intermediate";
}

}  // namespace motif
