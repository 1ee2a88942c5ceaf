#pragma once
/**
 * @file explain.h
 * @brief Composes the short justification for one engine move.
 *
 * The composer runs supplied signals, the capture/sacrifice verdict, the
 * tactic battery, the defense analyzer and positional extras in that order,
 * keeps the first two distinct reasons, and falls back to evaluation-derived
 * text when nothing fires.
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "board.h"
#include "context.h"
#include "evaluation.h"
#include "finding.h"
#include "sacrifice.h"

namespace motif {

inline constexpr std::size_t kMaxReasons = 2;
inline constexpr std::string_view kEngineFallback = "best move by engine";

struct ExplainRequest {
  Move move{};
  std::string evaluation{};
  std::string previous_evaluation{};
  std::vector<PvLine> pv_lines{};
  // In check with exactly one legal reply; computed by the caller.
  bool forced_reply{false};
};

struct Explanation {
  std::vector<Finding> findings;
  std::optional<int> see{};
  SacrificeReport sacrifice{};
  EvalDrop drop{EvalDrop::None};
  std::string_view move_category{"quiet"};

  [[nodiscard]] std::vector<std::string> reasons() const;
  // Reasons joined with ", ".
  [[nodiscard]] std::string text() const;
};

// "forcing" for captures, promotions and checks, otherwise "quiet".
std::string_view move_category(const Board& board, const Move& move);

// Never throws. An off-board move or an empty source square yields no reasons.
Explanation explain_move(const Board& board, const ExplainRequest& request, AnalysisContext& ctx);

// String boundary used by the protocol and the fuzzers. Formats for
// ctx.params.complexity and answers "best move by engine" if analysis fails.
std::string explain_move_text(std::string_view fen, std::string_view move,
                              std::string_view evaluation, const std::vector<std::string>& pv_lines,
                              AnalysisContext& ctx);

}  // namespace motif
