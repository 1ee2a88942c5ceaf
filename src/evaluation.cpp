#include "evaluation.h"

#include <charconv>
#include <cmath>
#include <cstdlib>

namespace motif {
namespace {

std::string_view trim_view(std::string_view sv) {
  const auto first = sv.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = sv.find_last_not_of(" \t\r\n");
  return sv.substr(first, last - first + 1);
}

std::optional<double> parse_decimal(std::string_view token) {
  if (!token.empty() && token.front() == '+') {
    token.remove_prefix(1);
  }
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

bool is_move_number(std::string_view token) {
  std::size_t digits = 0;
  while (digits < token.size() && token[digits] >= '0' && token[digits] <= '9') {
    ++digits;
  }
  if (digits == 0 || digits == token.size()) {
    return false;
  }
  return token.find_first_not_of('.', digits) == std::string_view::npos;
}

}  // namespace

std::optional<Evaluation> parse_evaluation(std::string_view text) {
  const std::string_view trimmed = trim_view(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  if (trimmed.find("Mate") != std::string_view::npos) {
    Evaluation eval;
    eval.mate = true;
    eval.pawns = trimmed.find('-') != std::string_view::npos ? -kMateScore : kMateScore;
    const auto digits = trimmed.find_first_of("0123456789");
    if (digits != std::string_view::npos) {
      int moves = 0;
      std::from_chars(trimmed.data() + digits, trimmed.data() + trimmed.size(), moves);
      eval.mate_in = eval.pawns < 0 ? -moves : moves;
    }
    return eval;
  }
  if (const auto value = parse_decimal(trimmed)) {
    return Evaluation{*value, false, 0};
  }
  return std::nullopt;
}

double mover_score(const Evaluation& eval, Color mover) {
  MOTIF_TRAP_ON_NAN(eval.pawns);
  if (eval.mate) {
    return eval.pawns;
  }
  return mover == Color::White ? eval.pawns : -eval.pawns;
}

PvLine parse_pv_line(std::string_view line) {
  PvLine pv;
  std::string_view view = trim_view(line);
  while (!view.empty()) {
    const auto first = view.find_first_not_of(' ');
    if (first == std::string_view::npos) {
      break;
    }
    view.remove_prefix(first);

    if (view.front() == '(') {
      const auto close = view.find(')');
      const std::string_view inner =
          view.substr(1, close == std::string_view::npos ? std::string_view::npos : close - 1);
      if (!pv.eval) {
        pv.eval = parse_evaluation(inner);
      }
      view = close == std::string_view::npos ? std::string_view{} : view.substr(close + 1);
      continue;
    }

    const auto end = view.find(' ');
    std::string_view token = view.substr(0, end);
    view = end == std::string_view::npos ? std::string_view{} : view.substr(end + 1);

    if (is_move_number(token)) {
      continue;
    }
    PvMove move;
    while (!token.empty()) {
      const char last = token.back();
      if (last == '+') {
        move.check = true;
      } else if (last == '#') {
        move.check = true;
        move.mate = true;
      } else if (last != '!' && last != '?') {
        break;
      }
      token.remove_suffix(1);
    }
    if (token.empty()) {
      continue;
    }
    move.text = std::string(token);
    move.uci = parse_move(token);
    pv.moves.push_back(std::move(move));
  }
  return pv;
}

bool is_singular(const std::vector<PvLine>& lines, double gap) {
  if (lines.size() < 2 || !lines[0].eval || !lines[1].eval) {
    return false;
  }
  return std::abs(lines[0].eval->pawns - lines[1].eval->pawns) >= gap;
}

EvalDrop classify_eval_drop(const Evaluation& before, const Evaluation& after, Color mover,
                            const AnalysisParams& params) {
  const double drop = mover_score(before, mover) - mover_score(after, mover);
  if (drop >= params.blunder_drop) {
    return EvalDrop::Blunder;
  }
  if (drop >= params.mistake_drop) {
    return EvalDrop::Mistake;
  }
  if (drop >= params.inaccuracy_drop) {
    return EvalDrop::Inaccuracy;
  }
  return EvalDrop::None;
}

std::string_view eval_drop_name(EvalDrop drop) {
  switch (drop) {
    case EvalDrop::None:
      return "";
    case EvalDrop::Inaccuracy:
      return "Inaccuracy";
    case EvalDrop::Mistake:
      return "Mistake";
    case EvalDrop::Blunder:
      return "Blunder";
  }
  return "";
}

}  // namespace motif
