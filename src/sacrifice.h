#pragma once
// sacrifice.h -- Capture verdicts, sound sacrifices and the brilliancy tag.
// Evaluations are pawns from the mover's point of view.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "board.h"
#include "context.h"

namespace motif {

enum class CaptureVerdict : std::uint8_t {
  None = 0,
  FairTrade,
  WinningCapture,
  NeutralCapture,
  LosingCapture
};

enum class SacrificeKind : std::uint8_t { None = 0, Exchange, Queen, Rook, Piece };

struct SacrificeInput {
  const Board& before;
  const Board& after;
  Move move;
  Color color;
  std::optional<double> eval_before{};
  std::optional<double> eval_after{};
};

struct SacrificeReport {
  CaptureVerdict verdict{CaptureVerdict::None};
  std::optional<int> see{};
  std::string capture_text{};
  SacrificeKind kind{SacrificeKind::None};
  std::string sacrifice_text{};
  bool brilliant{false};

  [[nodiscard]] bool is_capture() const { return verdict != CaptureVerdict::None; }
  [[nodiscard]] bool is_sacrifice() const { return kind != SacrificeKind::None || brilliant; }
};

SacrificeReport classify_move(const SacrificeInput& in, const AnalysisContext& ctx);

// Brilliancy gate on its own; also applies to quiet piece placements.
bool is_brilliant(const SacrificeInput& in, const AnalysisContext& ctx);

std::string_view verdict_name(CaptureVerdict verdict);

}  // namespace motif
