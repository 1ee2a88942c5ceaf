#pragma once
// evaluation.h -- Engine evaluation strings, PV line parsing and evaluation-change classes.
// Decimal scores are from White's point of view; "Mate in N" is from the mover's.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "analysisparams.h"
#include "common.h"

namespace motif {

inline constexpr double kMateScore = 100.0;

struct Evaluation {
  double pawns{0.0};
  bool mate{false};
  int mate_in{0};
};

// "+1.50", "-0.75", "0.00", "Mate in 3", "Mate in -2". Anything else yields nullopt.
std::optional<Evaluation> parse_evaluation(std::string_view text);
// Score from `mover`'s point of view. Mate scores are already mover-relative.
double mover_score(const Evaluation& eval, Color mover);

struct PvMove {
  std::string text;
  std::optional<Move> uci{};
  bool check{false};
  bool mate{false};
};

struct PvLine {
  std::vector<PvMove> moves;
  std::optional<Evaluation> eval{};

  [[nodiscard]] bool empty() const { return moves.empty(); }
};

// Space separated moves, optionally numbered ("1." / "1..."), '+' and '#'
// suffixes, and one parenthesised evaluation such as "(+0.80)".
PvLine parse_pv_line(std::string_view line);

// Gap between the first two PV evaluations reaches `gap` pawns.
bool is_singular(const std::vector<PvLine>& lines, double gap);

enum class EvalDrop : std::uint8_t { None = 0, Inaccuracy, Mistake, Blunder };

EvalDrop classify_eval_drop(const Evaluation& before, const Evaluation& after, Color mover,
                            const AnalysisParams& params);
std::string_view eval_drop_name(EvalDrop drop);

}  // namespace motif
