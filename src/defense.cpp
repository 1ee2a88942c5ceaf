#include "defense.h"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

#include "attacks.h"
#include "debug.h"

namespace motif {
namespace {

constexpr int kMinorValue = 3;

std::string name_of(Piece pc) {
  return std::string(piece_name(type_of(pc)));
}

void newly_defended(const Board& before, const Board& after, const Move& move, Color us,
                    std::vector<Finding>& out) {
  const Color them = flip(us);
  for (int idx = 0; idx < kSquareCount; ++idx) {
    const Square sq = square_at(idx);
    const Piece pc = after.piece_on(sq);
    if (sq == move.to || pc == Piece::None || color_of(pc) != us ||
        type_of(pc) == PieceType::King || before.piece_on(sq) != pc) {
      continue;
    }
    if (!is_attacked_by(before, sq, them)) {
      continue;
    }
    const int defenders_before = count_defenders(before, sq, us);
    const int attackers_before = count_attackers(before, sq, them);
    const int defenders_after = count_defenders(after, sq, us);
    const int attackers_after = count_attackers(after, sq, them);
    const bool vulnerable = defenders_before == 0 || attackers_before > defenders_before;
    const bool safe = defenders_after > 0 && defenders_after >= attackers_after;
    if (vulnerable && safe && defenders_after > defenders_before) {
      out.push_back(Finding{"defends " + name_of(pc) + " on " + square_to_string(sq),
                            std::min(piece_value(pc), 5), FindingCategory::Defense});
    }
  }
}

void escape(const Board& before, const Board& after, const Move& move, Color us,
            std::vector<Finding>& out) {
  const Color them = flip(us);
  const Piece pc = before.piece_on(move.from);
  const int value = piece_value(pc);
  if (type_of(pc) == PieceType::King || value < kMinorValue) {
    return;
  }
  if (!is_attacked_by(before, move.from, them)) {
    return;
  }
  const bool cheaper_attacker = lowest_attacker_value(before, move.from, them) < value;
  const bool outnumbered =
      count_attackers(before, move.from, them) > count_defenders(before, move.from, us);
  if (!cheaper_attacker && !outnumbered) {
    return;
  }
  if (is_attacked_by(after, move.to, them)) {
    return;
  }
  out.push_back(Finding{"saves " + name_of(pc), std::min(value - 1, 4), FindingCategory::Defense});
}

void blocks(const Board& before, const Board& after, const Move& move, Color us,
            std::vector<Finding>& out) {
  const Color them = flip(us);
  for (int idx = 0; idx < kSquareCount; ++idx) {
    const Square sq = square_at(idx);
    const Piece pc = before.piece_on(sq);
    if (sq == move.from || pc == Piece::None || color_of(pc) != us ||
        piece_value(pc) < kMinorValue) {
      continue;
    }
    bool through = false;
    for (const Square attacker : attackers_of(before, sq, them)) {
      if (is_slider(type_of(before.piece_on(attacker))) && is_between(attacker, sq, move.to)) {
        through = true;
        break;
      }
    }
    if (!through || is_attacked_by(after, sq, them)) {
      continue;
    }
    out.push_back(Finding{"blocks attack on " + name_of(pc),
                          std::min(piece_value(pc) / 2 + 1, 4), FindingCategory::Defense});
  }
}

void king_safety(const Board& before, const Board& after, Color us, std::vector<Finding>& out) {
  const auto king = after.king_square(us);
  if (!king) {
    return;
  }
  const Color them = flip(us);
  const bool was_in_check = in_check(before, us);
  if (was_in_check && !in_check(after, us)) {
    out.push_back(Finding{"gets out of check", 5, FindingCategory::Defense});
    return;
  }
  const int pressure_before = king_zone_pressure(before, *king, them);
  const int pressure_after = king_zone_pressure(after, *king, them);
  if (pressure_before >= 2 && pressure_after < pressure_before) {
    out.push_back(Finding{"improves king safety", 3, FindingCategory::Defense});
  }
}

void mate_threat(const Board& before, const Board& after, Color us, std::vector<Finding>& out) {
  const Color them = flip(us);
  if (in_check(after, us)) {
    return;
  }
  if (has_mate_in_one(before, them) && !has_mate_in_one(after, them)) {
    out.push_back(Finding{"stops mate threat", 5, FindingCategory::Defense});
  }
}

}  // namespace

std::vector<Finding> analyze_defenses(const Board& board, const Move& move, Color color,
                                      const AnalysisContext&) {
  std::vector<Finding> found;
  if (move.is_null() || board.empty(move.from)) {
    return found;
  }
  try {
    const Board after = board.after(move);
    king_safety(board, after, color, found);
    mate_threat(board, after, color, found);
    newly_defended(board, after, move, color, found);
    escape(board, after, move, color, found);
    blocks(board, after, move, color, found);
  } catch (const std::exception& ex) {
    trace_emit(TraceTopic::Defense, std::string("defense analysis failed: ") + ex.what());
  }

  std::vector<Finding> unique;
  for (Finding& f : found) {
    const bool seen = std::any_of(unique.begin(), unique.end(),
                                  [&](const Finding& u) { return u.text == f.text; });
    if (!seen) {
      unique.push_back(std::move(f));
    }
  }
  std::stable_sort(unique.begin(), unique.end(),
                   [](const Finding& a, const Finding& b) { return a.importance > b.importance; });
  if (unique.size() > kMaxDefenseFindings) {
    unique.resize(kMaxDefenseFindings);
  }
  if (trace_enabled(TraceTopic::Defense)) {
    for (const Finding& f : unique) {
      trace_emit(TraceTopic::Defense, f.text);
    }
  }
  return unique;
}

}  // namespace motif
