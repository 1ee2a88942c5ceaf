#pragma once
/**
 * @file tactics.h
 * @brief Independent tactical pattern detectors for a single played move.
 *
 * Each detector inspects the board before and after the move and returns a
 * Detection. Detectors never throw: malformed input is reported through the
 * Detection error code and internal failures resolve to "no finding".
 * `tactic_battery()` lists them in the priority order the composer uses.
 */

#include <span>
#include <string_view>
#include <vector>

#include "board.h"
#include "context.h"
#include "evaluation.h"
#include "finding.h"

namespace motif {

struct TacticInput {
  const Board& before;
  const Board& after;
  Move move;
  Piece piece;  // as it stands on move.to after the move (promotions resolved)
  Color color;
  const std::vector<PvLine>* pv{nullptr};
};

using Detector = Detection (*)(const TacticInput&, const AnalysisContext&);

struct NamedDetector {
  std::string_view name;
  Detector detect;
};

Detection detect_threat(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_double_check(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_discovered_attack(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_pin(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_skewer(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_fork(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_removal_of_defender(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_overloading(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_deflection(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_trapped_piece(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_hanging_piece(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_back_rank(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_promotion_threat(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_smothered_mate(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_xray(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_decoy(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_double_attack(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_perpetual_check(const TacticInput& in, const AnalysisContext& ctx);
Detection detect_check(const TacticInput& in, const AnalysisContext& ctx);

// Threat creation through plain check, highest priority first.
std::span<const NamedDetector> tactic_battery();

}  // namespace motif
