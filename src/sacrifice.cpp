#include "sacrifice.h"

#include <exception>

#include "attacks.h"
#include "debug.h"
#include "see.h"

namespace motif {
namespace {

constexpr int kMinorValue = 3;

// The piece taken by `move`, including a pawn removed en passant.
Piece captured_piece(const Board& before, const Move& move) {
  const Piece target = before.piece_on(move.to);
  if (target != Piece::None) {
    return target;
  }
  const Piece mover = before.piece_on(move.from);
  if (type_of(mover) == PieceType::Pawn && move.from.col != move.to.col) {
    const Piece passed = before.piece_on(make_square(move.from.row, move.to.col));
    if (type_of(passed) == PieceType::Pawn && color_of(passed) != color_of(mover)) {
      return passed;
    }
  }
  return Piece::None;
}

std::string name_of(Piece pc) {
  return std::string(piece_name(type_of(pc)));
}

void classify_capture(const SacrificeInput& in, const AnalysisContext& ctx, Piece mover,
                      Piece victim, SacrificeReport& report) {
  const Color them = flip(in.color);
  const int see = in.before.piece_on(in.move.to) == Piece::None
                      ? piece_value(victim)
                      : evaluate_exchange(in.before, in.move.to, mover, in.move.from, &ctx);
  const bool defended = count_defenders(in.after, in.move.to, them) > 0;
  const bool same_value = piece_value(mover) == piece_value(victim);
  const std::string name = name_of(victim);
  report.see = see;

  if (see >= 0 && defended && same_value) {
    report.verdict = CaptureVerdict::FairTrade;
    report.capture_text = "trades " + name;
  } else if (see > 0) {
    report.verdict = CaptureVerdict::WinningCapture;
    report.capture_text = "wins " + name;
    if (ctx.params.show_see_values) {
      report.capture_text += " (SEE +" + std::to_string(see) + ")";
    }
  } else if (see == 0) {
    report.verdict = defended ? CaptureVerdict::FairTrade : CaptureVerdict::NeutralCapture;
    report.capture_text = (defended ? "trades " : "captures ") + name;
  } else {
    report.verdict = CaptureVerdict::LosingCapture;
    report.capture_text = "captures " + name;
    if (ctx.params.show_see_values) {
      report.capture_text += " (loses exchange)";
    }
  }

  if (!defended || !in.eval_after) {
    return;
  }
  const PieceType mover_type = type_of(mover);
  const PieceType victim_type = type_of(victim);
  if (mover_type == PieceType::Rook &&
      (victim_type == PieceType::Bishop || victim_type == PieceType::Knight) && see < -1 &&
      *in.eval_after > ctx.params.exchange_sacrifice_floor) {
    report.kind = SacrificeKind::Exchange;
    report.sacrifice_text = "exchange sacrifice (rook for minor piece)";
    return;
  }
  if (piece_value(mover) <= piece_value(victim) || see > -ctx.params.sacrifice_min_material ||
      *in.eval_after <= ctx.params.sacrifice_floor) {
    return;
  }
  switch (mover_type) {
    case PieceType::Queen:
      report.kind = SacrificeKind::Queen;
      report.sacrifice_text = "queen sacrifice";
      break;
    case PieceType::Rook:
      report.kind = SacrificeKind::Rook;
      report.sacrifice_text = "rook sacrifice";
      break;
    case PieceType::Bishop:
    case PieceType::Knight:
      report.kind = SacrificeKind::Piece;
      report.sacrifice_text = "piece sacrifice";
      break;
    default:
      break;
  }
}

}  // namespace

bool is_brilliant(const SacrificeInput& in, const AnalysisContext& ctx) {
  if (!in.eval_before || !in.eval_after || in.move.is_null()) {
    return false;
  }
  const Piece mover = in.after.piece_on(in.move.to);
  const int sacrificed = piece_value(mover);
  if (mover == Piece::None || type_of(mover) == PieceType::King || sacrificed < kMinorValue) {
    return false;
  }
  const AnalysisParams& params = ctx.params;
  if (*in.eval_before >= params.decisive_advantage || *in.eval_after <= -params.bad_position) {
    return false;
  }
  const Piece victim = captured_piece(in.before, in.move);
  const int captured = piece_value(victim);
  if (captured >= sacrificed) {
    return false;
  }

  const Color them = flip(in.color);
  const int loss = victim != Piece::None && in.before.piece_on(in.move.to) != Piece::None
                       ? -evaluate_exchange(in.before, in.move.to, in.before.piece_on(in.move.from),
                                            in.move.from, &ctx)
                       : capture_gain(in.after, in.move.to, them, &ctx);
  if (loss < params.sacrifice_min_material) {
    return false;
  }
  for (const Square sq : attackers_of(in.after, in.move.to, them)) {
    if (type_of(in.after.piece_on(sq)) == PieceType::Pawn &&
        leaves_king_safe(in.after, Move{sq, in.move.to, PieceType::None})) {
      return false;
    }
  }
  return count_defenders(in.after, in.move.to, in.color) == 0;
}

SacrificeReport classify_move(const SacrificeInput& in, const AnalysisContext& ctx) {
  SacrificeReport report;
  if (in.move.is_null() || in.before.empty(in.move.from)) {
    return report;
  }
  try {
    const Piece mover = in.before.piece_on(in.move.from);
    const Piece victim = captured_piece(in.before, in.move);
    if (victim != Piece::None && color_of(victim) != color_of(mover)) {
      classify_capture(in, ctx, mover, victim, report);
    }
    report.brilliant = is_brilliant(in, ctx);
  } catch (const std::exception& ex) {
    trace_emit(TraceTopic::Sacrifice, std::string("classification failed: ") + ex.what());
    return SacrificeReport{};
  }
  if (trace_enabled(TraceTopic::Sacrifice)) {
    trace_emit(TraceTopic::Sacrifice,
               std::string(verdict_name(report.verdict)) + " see " +
                   (report.see ? std::to_string(*report.see) : std::string{"-"}) +
                   (report.sacrifice_text.empty() ? "" : " " + report.sacrifice_text) +
                   (report.brilliant ? " brilliant" : ""));
  }
  return report;
}

std::string_view verdict_name(CaptureVerdict verdict) {
  switch (verdict) {
    case CaptureVerdict::None:
      return "none";
    case CaptureVerdict::FairTrade:
      return "fair-trade";
    case CaptureVerdict::WinningCapture:
      return "winning-capture";
    case CaptureVerdict::NeutralCapture:
      return "neutral-capture";
    case CaptureVerdict::LosingCapture:
      return "losing-capture";
  }
  return "none";
}

}  // namespace motif
