#pragma once
// defense.h -- What a move newly protects: check escapes, rescued pieces, blocks
// and king-safety gains. At most two findings, highest importance first.

#include <vector>

#include "board.h"
#include "context.h"
#include "finding.h"

namespace motif {

inline constexpr std::size_t kMaxDefenseFindings = 2;

std::vector<Finding> analyze_defenses(const Board& board, const Move& move, Color color,
                                      const AnalysisContext& ctx);

}  // namespace motif
