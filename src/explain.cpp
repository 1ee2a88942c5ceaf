#include "explain.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <utility>

#include "attacks.h"
#include "debug.h"
#include "defense.h"
#include "explain_format.h"
#include "tactics.h"

namespace motif {
namespace {

class ReasonList {
public:
  [[nodiscard]] bool full() const { return findings_.size() >= kMaxReasons; }
  [[nodiscard]] bool empty() const { return findings_.empty(); }

  void add(Finding finding) {
    if (full() || finding.text.empty()) {
      return;
    }
    const bool seen = std::any_of(findings_.begin(), findings_.end(),
                                  [&](const Finding& f) { return f.text == finding.text; });
    if (!seen) {
      if (trace_enabled(TraceTopic::Compose)) {
        trace_emit(TraceTopic::Compose, "reason: " + finding.text);
      }
      findings_.push_back(std::move(finding));
    }
  }

  std::vector<Finding> take() { return std::move(findings_); }

private:
  std::vector<Finding> findings_;
};

// Generic battery entries that only speak when nothing more specific has.
bool is_fallback(std::string_view detector) {
  return detector == "double-attack" || detector == "check";
}

bool is_minor(PieceType type) {
  return type == PieceType::Knight || type == PieceType::Bishop;
}

void positional_extras(const Board& before, const Board& after, const Move& move,
                       bool capture_reported, ReasonList& out) {
  const Piece pc = before.piece_on(move.from);
  const PieceType type = type_of(pc);
  const bool white = color_of(pc) == Color::White;

  if (!capture_reported && after.piece_count() < before.piece_count()) {
    const Piece taken = before.piece_on(move.to) != Piece::None
                            ? before.piece_on(move.to)
                            : make_piece(flip(color_of(pc)), PieceType::Pawn);
    out.add(Finding{"captures " + std::string(piece_name(type_of(taken))), 2,
                    FindingCategory::Capture});
  }
  if (type == PieceType::Pawn) {
    const int advance = white ? move.from.row - move.to.row : move.to.row - move.from.row;
    if (advance == 2) {
      out.add(Finding{"aggressive pawn push", 2, FindingCategory::Positional});
    }
    if (move.promotion != PieceType::None) {
      const char letter = static_cast<char>(
          std::toupper(static_cast<unsigned char>(piece_to_char(make_piece(Color::White, move.promotion)))));
      out.add(Finding{std::string("promotes to ") + letter, 6, FindingCategory::Positional});
    }
  }
  if (is_minor(type) && move.to.col >= 2 && move.to.col <= 5 && move.to.row >= 2 &&
      move.to.row <= 5) {
    out.add(Finding{"centralizes piece", 2, FindingCategory::Positional});
  }
  if (is_minor(type) && (move.from.row == 0 || move.from.row == kBoardSize - 1)) {
    out.add(Finding{"develops piece", 2, FindingCategory::Positional});
  }
  if (type == PieceType::King && move.from.row == move.to.row &&
      std::abs(move.to.col - move.from.col) == 2) {
    out.add(Finding{move.to.col > move.from.col ? "castles kingside for safety" : "castles queenside",
                    3, FindingCategory::Positional});
  }
}

Finding evaluation_fallback(const std::optional<Evaluation>& eval, Color mover) {
  if (eval) {
    const double score = mover_score(*eval, mover);
    if (std::abs(score) > 3.0) {
      return Finding{score > 0 ? "maintains winning advantage" : "fights back in difficult position",
                     1, FindingCategory::Evaluation};
    }
    if (std::abs(score) < 0.3) {
      return Finding{"maintains balance", 1, FindingCategory::Evaluation};
    }
  }
  return Finding{"improves position", 1, FindingCategory::Evaluation};
}

void compose(const Board& board, const ExplainRequest& request, AnalysisContext& ctx,
             Explanation& out) {
  const Move& move = request.move;
  const Color us = color_of(board.piece_on(move.from));
  const Board after = board.after(move);
  const auto eval = parse_evaluation(request.evaluation);
  const auto previous = parse_evaluation(request.previous_evaluation);
  ReasonList reasons;

  if (request.forced_reply) {
    reasons.add(Finding{"only legal move", 10, FindingCategory::Signal});
  }
  if (is_singular(request.pv_lines, ctx.params.singular_gap)) {
    reasons.add(Finding{"only good move", 10, FindingCategory::Signal});
  }

  SacrificeInput verdict_input{board, after, move, us};
  if (eval) {
    verdict_input.eval_after = mover_score(*eval, us);
  }
  // Without a previous evaluation the current one stands in for it.
  verdict_input.eval_before = previous ? std::optional<double>(mover_score(*previous, us))
                                       : verdict_input.eval_after;
  out.sacrifice = classify_move(verdict_input, ctx);
  if (out.sacrifice.is_capture() && ctx.params.show_see_values) {
    out.see = out.sacrifice.see;
  }
  if (!out.sacrifice.sacrifice_text.empty()) {
    reasons.add(Finding{out.sacrifice.sacrifice_text, 9, FindingCategory::Sacrifice});
  } else if (!out.sacrifice.capture_text.empty()) {
    reasons.add(Finding{out.sacrifice.capture_text, 8, FindingCategory::Capture});
  }

  const TacticInput input{board, after, move, after.piece_on(move.to), us, &request.pv_lines};
  bool tactic_found = false;
  for (const NamedDetector& detector : tactic_battery()) {
    if (reasons.full()) {
      break;
    }
    if (tactic_found && is_fallback(detector.name)) {
      continue;
    }
    Detection result = detector.detect(input, ctx);
    if (!result.ok()) {
      trace_emit(TraceTopic::Compose, std::string(detector.name) + " skipped: " +
                                          std::string(detect_error_name(result.error)) + " " +
                                          result.message);
      continue;
    }
    if (result.found()) {
      tactic_found = true;
      reasons.add(std::move(*result.finding));
    }
  }

  if (!reasons.full()) {
    for (Finding& defense : analyze_defenses(board, move, us, ctx)) {
      reasons.add(std::move(defense));
    }
  }
  if (!reasons.full()) {
    positional_extras(board, after, move, out.sacrifice.is_capture(), reasons);
  }
  if (reasons.empty()) {
    reasons.add(evaluation_fallback(eval, us));
  }

  out.findings = reasons.take();
  if (eval && previous) {
    out.drop = classify_eval_drop(*previous, *eval, us, ctx.params);
  }
  out.move_category = move_category(board, move);
}

}  // namespace

std::vector<std::string> Explanation::reasons() const {
  std::vector<std::string> out;
  out.reserve(findings.size());
  for (const Finding& f : findings) {
    out.push_back(f.text);
  }
  return out;
}

std::string Explanation::text() const {
  std::string out;
  for (const Finding& f : findings) {
    if (!out.empty()) {
      out += ", ";
    }
    out += f.text;
  }
  return out;
}

std::string_view move_category(const Board& board, const Move& move) {
  if (move.is_null() || board.empty(move.from)) {
    return "quiet";
  }
  if (move.promotion != PieceType::None) {
    return "forcing";
  }
  const Board after = board.after(move);
  if (after.piece_count() < board.piece_count()) {
    return "forcing";
  }
  return in_check(after, flip(color_of(board.piece_on(move.from)))) ? "forcing" : "quiet";
}

Explanation explain_move(const Board& board, const ExplainRequest& request, AnalysisContext& ctx) {
  Explanation out;
  const Move& move = request.move;
  if (move.is_null() || board.empty(move.from)) {
    trace_emit(TraceTopic::Compose, "rejected move " + move_to_string(move));
    return out;
  }
  if (trace_enabled(TraceTopic::Compose)) {
    const InvariantStatus status = validate_board(board);
    trace_emit(TraceTopic::Compose, "explaining " + move_to_string(move) + " on " +
                                        board.to_fen() + " (" + status.message + ")");
  }
  try {
    compose(board, request, ctx, out);
  } catch (const std::exception& ex) {
    trace_emit(TraceTopic::Compose, std::string("composition failed: ") + ex.what());
    out = Explanation{};
    out.findings.push_back(Finding{std::string(kEngineFallback), 0, FindingCategory::Evaluation});
  }
  return out;
}

std::string explain_move_text(std::string_view fen, std::string_view move,
                              std::string_view evaluation, const std::vector<std::string>& pv_lines,
                              AnalysisContext& ctx) {
  try {
    const Board board = Board::from_fen(fen, false);
    const auto parsed = parse_move(move);
    if (!parsed) {
      return {};
    }
    ExplainRequest request;
    request.move = *parsed;
    request.evaluation = std::string(evaluation);
    for (const std::string& line : pv_lines) {
      request.pv_lines.push_back(parse_pv_line(line));
    }
    const Explanation explanation = explain_move(board, request, ctx);
    return format_explanation(explanation.text(), ctx.params.complexity);
  } catch (const std::exception& ex) {
    trace_emit(TraceTopic::Compose, std::string("explain failed: ") + ex.what());
    return std::string(kEngineFallback);
  }
}

}  // namespace motif
