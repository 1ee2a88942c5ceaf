#include "tactics.h"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <exception>
#include <set>
#include <string>
#include <utility>

#include "attacks.h"
#include "debug.h"
#include "scratch_pool.h"
#include "see.h"

namespace motif {
namespace {

constexpr int kMinorValue = 3;
constexpr int kMajorValue = 5;

template <typename Body>
Detection guarded(std::string_view name, const TacticInput& in, Body&& body) {
  if (!is_valid(in.move.from) || !is_valid(in.move.to)) {
    return Detection::failure(DetectError::InvalidSquare, "move squares are off the board");
  }
  if (in.piece == Piece::None || in.after.piece_on(in.move.to) != in.piece) {
    return Detection::failure(DetectError::EmptySource, "no moved piece on the destination");
  }
  try {
    Detection result = body();
    if (result.found() && trace_enabled(TraceTopic::Tactics)) {
      trace_emit(TraceTopic::Tactics, std::string(name) + ": " + result.finding->text);
    }
    return result;
  } catch (const std::exception& ex) {
    trace_emit(TraceTopic::Tactics, std::string(name) + " failed: " + ex.what());
    return Detection::failure(DetectError::Internal, ex.what());
  }
}

std::string name_on(const Board& board, Square sq) {
  return std::string(piece_name(type_of(board.piece_on(sq))));
}

bool is_king(const Board& board, Square sq) {
  return type_of(board.piece_on(sq)) == PieceType::King;
}

bool holds(const Board& board, std::optional<Square> sq, Color c) {
  return sq && !board.empty(*sq) && color_of(board.piece_on(*sq)) == c;
}

// Enemy pieces attacked from `from`, most valuable first, square order on ties.
std::vector<Square> targets_by_value(const Board& board, Square from, int min_value,
                                     bool include_king) {
  std::vector<Square> out;
  for (const Square sq : attacked_enemies(board, from)) {
    if (piece_value(board.piece_on(sq)) < min_value) {
      continue;
    }
    if (!include_king && is_king(board, sq)) {
      continue;
    }
    out.push_back(sq);
  }
  std::stable_sort(out.begin(), out.end(), [&](Square a, Square b) {
    return piece_value(board.piece_on(a)) > piece_value(board.piece_on(b));
  });
  return out;
}

bool mover_is_safe(const TacticInput& in, const AnalysisContext& ctx) {
  return capture_gain(in.after, in.move.to, flip(in.color), &ctx) <= 0;
}

// SEE for the mover capturing on `target` once `removed` has stepped away.
int exchange_without(const TacticInput& in, Square removed, Square target,
                     const AnalysisContext& ctx) {
  ScratchLease lease = rent_scratch(ctx.pool, in.after);
  Board& scratch = lease.board();
  scratch.set_piece(removed, Piece::None);
  return evaluate_exchange(scratch, target, in.piece, in.move.to, &ctx);
}

// Squares holding exactly one defender of `owner`, which is `defender`.
bool sole_defender(const Board& board, Square sq, Color owner, Square defender) {
  const auto defenders = attackers_of(board, sq, owner);
  return defenders.size() == 1 && defenders.front() == defender;
}

bool covers(PieceType type, Direction dir) {
  const bool diag = dir.dr != 0 && dir.dc != 0;
  if (type == PieceType::Queen) {
    return true;
  }
  return diag ? type == PieceType::Bishop : type == PieceType::Rook;
}

int promotion_row(Color c) {
  return c == Color::White ? 0 : kBoardSize - 1;
}

int back_row(Color c) {
  return c == Color::White ? kBoardSize - 1 : 0;
}

}  // namespace

Detection detect_threat(const TacticInput& in, const AnalysisContext& ctx) {
  return guarded("threat", in, [&]() {
    if (in_check(in.after, flip(in.color))) {
      return Detection::none();
    }
    const int mover_value = piece_value(in.piece);
    std::vector<Square> threatened;
    for (const Square sq : targets_by_value(in.after, in.move.to, kMinorValue, false)) {
      if (piece_value(in.after.piece_on(sq)) > mover_value) {
        threatened.push_back(sq);
      }
    }
    if (threatened.size() != 1) {
      return Detection::none();
    }
    const Square target = threatened.front();
    if (is_attacked_by(in.before, target, in.color) || !mover_is_safe(in, ctx)) {
      return Detection::none();
    }
    return Detection::hit("creates threat on " + name_on(in.after, target), 6,
                          FindingCategory::Tactic);
  });
}

Detection detect_double_check(const TacticInput& in, const AnalysisContext&) {
  return guarded("double-check", in, [&]() {
    const auto king = in.after.king_square(flip(in.color));
    if (!king) {
      return Detection::failure(DetectError::KingMissing, "opponent king missing");
    }
    if (!gives_check(in.after, in.move.to)) {
      return Detection::none();
    }
    const auto before_checkers = attackers_of(in.before, *king, in.color);
    for (const Square sq : attackers_of(in.after, *king, in.color)) {
      if (sq == in.move.to) {
        continue;
      }
      if (std::find(before_checkers.begin(), before_checkers.end(), sq) == before_checkers.end()) {
        return Detection::hit("double check!", 10, FindingCategory::Check);
      }
    }
    return Detection::none();
  });
}

Detection detect_discovered_attack(const TacticInput& in, const AnalysisContext& ctx) {
  return guarded("discovered", in, [&]() {
    std::optional<Square> heavy_target;
    for (int idx = 0; idx < kSquareCount; ++idx) {
      const Square slider = square_at(idx);
      const Piece pc = in.after.piece_on(slider);
      if (slider == in.move.to || pc == Piece::None || color_of(pc) != in.color ||
          !is_slider(type_of(pc))) {
        continue;
      }
      for (const Square target : attacked_enemies(in.after, slider)) {
        if (!is_between(slider, target, in.move.from) ||
            can_attack(in.before, slider, pc, target)) {
          continue;
        }
        if (is_king(in.after, target)) {
          // The moved piece checks too: reported as a double check.
          if (gives_check(in.after, in.move.to)) {
            continue;
          }
          for (const Square hit : attacked_enemies(in.after, in.move.to)) {
            if (!is_king(in.after, hit) && piece_value(in.after.piece_on(hit)) >= kMajorValue) {
              return Detection::hit("discovered check, wins " + name_on(in.after, hit), 9,
                                    FindingCategory::Tactic);
            }
          }
          return Detection::hit("discovered check", 8, FindingCategory::Check);
        }
        const PieceType type = type_of(in.after.piece_on(target));
        if ((type == PieceType::Queen || type == PieceType::Rook) && !heavy_target &&
            is_winnable(in.after, target, in.color, &ctx)) {
          heavy_target = target;
        }
      }
    }
    if (heavy_target) {
      return Detection::hit("discovered attack on " + name_on(in.after, *heavy_target), 7,
                            FindingCategory::Tactic);
    }
    return Detection::none();
  });
}

Detection detect_pin(const TacticInput& in, const AnalysisContext& ctx) {
  return guarded("pin", in, [&]() {
    const PieceType type = type_of(in.piece);
    if (!is_slider(type)) {
      return Detection::none();
    }
    const Color them = flip(in.color);
    for (const Direction dir : slider_directions(type)) {
      const RayHit hit = ray_scan(in.after, in.move.to, dir);
      if (!holds(in.after, hit.first, them) || !holds(in.after, hit.second, them) ||
          is_king(in.after, *hit.first)) {
        continue;
      }
      const Square pinned = *hit.first;
      const Square behind = *hit.second;
      if (is_king(in.after, behind)) {
        return Detection::hit("pins " + name_on(in.after, pinned) + " to king (absolute)", 8,
                              FindingCategory::Tactic);
      }
      if (piece_value(in.after.piece_on(behind)) <= piece_value(in.after.piece_on(pinned))) {
        continue;
      }
      const bool undefended = count_defenders(in.after, behind, them) == 0;
      if (undefended || exchange_without(in, pinned, behind, ctx) >= ctx.params.pin_min_gain) {
        return Detection::hit(
            "pins " + name_on(in.after, pinned) + " to " + name_on(in.after, behind), 7,
            FindingCategory::Tactic);
      }
    }
    return Detection::none();
  });
}

Detection detect_skewer(const TacticInput& in, const AnalysisContext& ctx) {
  return guarded("skewer", in, [&]() {
    const PieceType type = type_of(in.piece);
    if (!is_slider(type)) {
      return Detection::none();
    }
    const Color them = flip(in.color);
    for (const Direction dir : slider_directions(type)) {
      const RayHit hit = ray_scan(in.after, in.move.to, dir);
      if (!holds(in.after, hit.first, them) || !holds(in.after, hit.second, them)) {
        continue;
      }
      const Square front = *hit.first;
      const Square behind = *hit.second;
      if (is_king(in.after, behind)) {
        continue;
      }
      if (is_king(in.after, front)) {
        return Detection::hit("skewers king, winning " + name_on(in.after, behind), 9,
                              FindingCategory::Tactic);
      }
      if (piece_value(in.after.piece_on(front)) <= piece_value(in.after.piece_on(behind))) {
        continue;
      }
      if (!is_winnable(in.after, front, in.color, &ctx)) {
        continue;
      }
      const bool undefended = count_defenders(in.after, behind, them) == 0;
      if (undefended || exchange_without(in, front, behind, ctx) > 0) {
        return Detection::hit(
            "skewers " + name_on(in.after, front) + ", winning " + name_on(in.after, behind), 8,
            FindingCategory::Tactic);
      }
    }
    return Detection::none();
  });
}

Detection detect_fork(const TacticInput& in, const AnalysisContext& ctx) {
  return guarded("fork", in, [&]() {
    const auto targets = targets_by_value(in.after, in.move.to, kMinorValue, true);
    if (targets.size() < 2) {
      return Detection::none();
    }
    bool king = false;
    bool queen = false;
    bool rook = false;
    std::vector<Square> others;
    for (const Square sq : targets) {
      switch (type_of(in.after.piece_on(sq))) {
        case PieceType::King:
          king = true;
          continue;
        case PieceType::Queen:
          queen = true;
          break;
        case PieceType::Rook:
          rook = true;
          break;
        default:
          break;
      }
      others.push_back(sq);
    }

    if (type_of(in.piece) == PieceType::Knight && king && queen) {
      return Detection::hit("royal fork (king and queen)", 10, FindingCategory::Tactic);
    }
    if (!mover_is_safe(in, ctx)) {
      return Detection::none();
    }
    const auto winnable = [&](Square sq) { return is_winnable(in.after, sq, in.color, &ctx); };
    if (king && queen && rook &&
        std::any_of(others.begin(), others.end(), winnable)) {
      return Detection::hit("family fork (king, queen, and rook)", 10, FindingCategory::Tactic);
    }
    if (king) {
      if (!others.empty() && winnable(others.front())) {
        return Detection::hit("forks king and " + name_on(in.after, others.front()), 9,
                              FindingCategory::Tactic);
      }
      return Detection::none();
    }
    if (std::any_of(others.begin(), others.end(), winnable)) {
      return Detection::hit("forks " + name_on(in.after, others[0]) + " and " +
                                name_on(in.after, others[1]),
                            8, FindingCategory::Tactic);
    }
    return Detection::none();
  });
}

Detection detect_removal_of_defender(const TacticInput& in, const AnalysisContext&) {
  return guarded("removal", in, [&]() {
    const Color them = flip(in.color);
    const Piece captured = in.before.piece_on(in.move.to);
    if (captured == Piece::None || color_of(captured) != them) {
      return Detection::none();
    }
    std::optional<Square> best;
    for (int idx = 0; idx < kSquareCount; ++idx) {
      const Square sq = square_at(idx);
      const Piece pc = in.after.piece_on(sq);
      if (sq == in.move.to || pc == Piece::None || color_of(pc) != them ||
          type_of(pc) == PieceType::King || piece_value(pc) < kMinorValue) {
        continue;
      }
      if (!sole_defender(in.before, sq, them, in.move.to)) {
        continue;
      }
      if (count_defenders(in.after, sq, them) != 0 || !is_attacked_by(in.after, sq, in.color)) {
        continue;
      }
      if (!best || piece_value(pc) > piece_value(in.after.piece_on(*best))) {
        best = sq;
      }
    }
    if (best) {
      return Detection::hit("removes defender of " + name_on(in.after, *best), 7,
                            FindingCategory::Tactic);
    }
    return Detection::none();
  });
}

Detection detect_overloading(const TacticInput& in, const AnalysisContext&) {
  return guarded("overloading", in, [&]() {
    const Color them = flip(in.color);
    for (int d = 0; d < kSquareCount; ++d) {
      const Square defender = square_at(d);
      const Piece dp = in.after.piece_on(defender);
      if (dp == Piece::None || color_of(dp) != them || type_of(dp) == PieceType::King) {
        continue;
      }
      std::vector<Square> duties;
      bool mover_involved = false;
      for (int idx = 0; idx < kSquareCount; ++idx) {
        const Square sq = square_at(idx);
        const Piece pc = in.after.piece_on(sq);
        if (sq == defender || pc == Piece::None || color_of(pc) != them ||
            type_of(pc) == PieceType::King || piece_value(pc) < kMinorValue) {
          continue;
        }
        if (!sole_defender(in.after, sq, them, defender) || !is_attacked_by(in.after, sq, in.color)) {
          continue;
        }
        duties.push_back(sq);
        if (can_attack(in.after, in.move.to, in.piece, sq)) {
          mover_involved = true;
        }
      }
      if (duties.size() >= 2 && mover_involved) {
        std::stable_sort(duties.begin(), duties.end(), [&](Square a, Square b) {
          return piece_value(in.after.piece_on(a)) > piece_value(in.after.piece_on(b));
        });
        return Detection::hit("overloads defender of " + name_on(in.after, duties[0]) + " and " +
                                  name_on(in.after, duties[1]),
                              7, FindingCategory::Tactic);
      }
    }
    return Detection::none();
  });
}

Detection detect_deflection(const TacticInput& in, const AnalysisContext&) {
  return guarded("deflection", in, [&]() {
    const Color them = flip(in.color);
    const auto king = in.after.king_square(them);
    if (!king) {
      return Detection::failure(DetectError::KingMissing, "opponent king missing");
    }
    for (const Square lure : attackers_of(in.after, in.move.to, them)) {
      if (is_king(in.after, lure)) {
        continue;
      }
      for (int dr = -1; dr <= 1; ++dr) {
        for (int dc = -1; dc <= 1; ++dc) {
          const Square zone = offset(*king, dr, dc);
          if ((dr == 0 && dc == 0) || !is_valid(zone) || holds(in.after, zone, them)) {
            continue;
          }
          std::vector<Square> guards;
          for (const Square sq : attackers_of(in.after, zone, them)) {
            if (sq != *king) {
              guards.push_back(sq);
            }
          }
          if (guards.size() == 1 && guards.front() == lure &&
              is_attacked_by(in.after, zone, in.color)) {
            return Detection::hit("deflects key defender", 6, FindingCategory::Tactic);
          }
        }
      }
    }
    return Detection::none();
  });
}

Detection detect_trapped_piece(const TacticInput& in, const AnalysisContext& ctx) {
  return guarded("trapped", in, [&]() {
    for (const Square target : targets_by_value(in.after, in.move.to, kMinorValue, false)) {
      const Piece victim = in.after.piece_on(target);
      int escapes = 0;
      for (int idx = 0; idx < kSquareCount && escapes == 0; ++idx) {
        const Square dest = square_at(idx);
        if (!can_move_to(in.after, target, dest)) {
          continue;
        }
        const Piece there = in.after.piece_on(dest);
        if (there != Piece::None && piece_value(there) >= piece_value(victim)) {
          ++escapes;
          continue;
        }
        const Board next = in.after.after(Move{target, dest, PieceType::None});
        if (!is_attacked_by(next, dest, in.color)) {
          ++escapes;
        }
      }
      if (escapes == 0 && capture_gain(in.after, target, in.color, &ctx) > 0) {
        return Detection::hit("traps " + name_on(in.after, target), 7, FindingCategory::Tactic);
      }
    }
    return Detection::none();
  });
}

Detection detect_hanging_piece(const TacticInput& in, const AnalysisContext& ctx) {
  return guarded("hanging", in, [&]() {
    const Color them = flip(in.color);
    const int mover_value = piece_value(in.piece);
    const bool recapturable = !mover_is_safe(in, ctx);
    for (const Square target : targets_by_value(in.after, in.move.to, 1, false)) {
      const int value = piece_value(in.after.piece_on(target));
      if (value < kMinorValue && value < mover_value) {
        continue;
      }
      if (count_defenders(in.after, target, them) != 0 ||
          safe_squares_for_piece(in.after, target) != 0) {
        continue;
      }
      if (recapturable && value <= mover_value) {
        continue;
      }
      return Detection::hit("wins undefended " + name_on(in.after, target), 7,
                            FindingCategory::Tactic);
    }
    return Detection::none();
  });
}

Detection detect_back_rank(const TacticInput& in, const AnalysisContext&) {
  return guarded("back-rank", in, [&]() {
    const PieceType type = type_of(in.piece);
    if (type != PieceType::Rook && type != PieceType::Queen) {
      return Detection::none();
    }
    const Color them = flip(in.color);
    const auto king = in.after.king_square(them);
    if (!king) {
      return Detection::failure(DetectError::KingMissing, "opponent king missing");
    }
    const int rank = back_row(them);
    if (in.move.to.row != rank || king->row != rank) {
      return Detection::none();
    }
    if (gives_check(in.after, in.move.to)) {
      if (king_safe_squares(in.after, them) != 0) {
        return Detection::none();
      }
      return Detection::hit("back rank mate threat", 9, FindingCategory::Tactic);
    }
    const int second = rank == 0 ? 1 : kBoardSize - 2;
    const Piece king_piece = in.after.piece_on(*king);
    for (int dc = -1; dc <= 1; ++dc) {
      const Square escape = make_square(second, king->col + dc);
      if (!is_valid(escape) || holds(in.after, escape, them)) {
        continue;
      }
      Board probe = in.after;
      probe.set_piece(*king, Piece::None);
      probe.set_piece(escape, king_piece);
      if (!is_attacked_by(probe, escape, in.color)) {
        return Detection::none();
      }
    }
    if (has_mate_in_one(in.after, in.color)) {
      return Detection::hit("threatens back rank", 7, FindingCategory::Tactic);
    }
    return Detection::none();
  });
}

Detection detect_promotion_threat(const TacticInput& in, const AnalysisContext&) {
  return guarded("promotion", in, [&]() {
    if (type_of(in.piece) != PieceType::Pawn) {
      return Detection::none();
    }
    const Color them = flip(in.color);
    const int goal = promotion_row(in.color);
    const int step = in.color == Color::White ? -1 : 1;
    const int distance = std::abs(goal - in.move.to.row);
    const Square ahead = offset(in.move.to, step, 0);
    if (distance == 1) {
      if (!in.after.empty(ahead)) {
        return Detection::none();
      }
      if (is_attacked_by(in.after, ahead, them) && !is_attacked_by(in.after, ahead, in.color)) {
        return Detection::none();
      }
      return Detection::hit("threatens promotion", 7, FindingCategory::Tactic);
    }
    if (distance != 2 || !in.after.empty(ahead) || !in.after.empty(offset(ahead, step, 0))) {
      return Detection::none();
    }
    const Piece enemy_pawn = make_piece(them, PieceType::Pawn);
    for (int row = in.move.to.row + step; row != goal + step; row += step) {
      for (int dc = -1; dc <= 1; ++dc) {
        const Square sq = make_square(row, in.move.to.col + dc);
        if (is_valid(sq) && in.after.piece_on(sq) == enemy_pawn) {
          return Detection::none();
        }
      }
    }
    return Detection::hit("advances passed pawn", 5, FindingCategory::Positional);
  });
}

Detection detect_smothered_mate(const TacticInput& in, const AnalysisContext&) {
  return guarded("smothered", in, [&]() {
    if (type_of(in.piece) != PieceType::Knight) {
      return Detection::none();
    }
    const Color them = flip(in.color);
    const auto king = in.after.king_square(them);
    if (!king) {
      return Detection::failure(DetectError::KingMissing, "opponent king missing");
    }
    if (!gives_check(in.after, in.move.to)) {
      return Detection::none();
    }
    for (int dr = -1; dr <= 1; ++dr) {
      for (int dc = -1; dc <= 1; ++dc) {
        const Square sq = offset(*king, dr, dc);
        if ((dr == 0 && dc == 0) || !is_valid(sq)) {
          continue;
        }
        if (!holds(in.after, sq, them)) {
          return Detection::none();
        }
      }
    }
    if (!is_checkmated(in.after, them)) {
      return Detection::none();
    }
    return Detection::hit("smothered mate", 10, FindingCategory::Tactic);
  });
}

Detection detect_xray(const TacticInput& in, const AnalysisContext& ctx) {
  return guarded("xray", in, [&]() {
    const PieceType type = type_of(in.piece);
    if (!is_slider(type)) {
      return Detection::none();
    }
    const Color them = flip(in.color);
    for (const Direction dir : slider_directions(type)) {
      const RayHit hit = ray_scan(in.after, in.move.to, dir);
      if (!holds(in.after, hit.first, in.color) || !holds(in.after, hit.second, them)) {
        continue;
      }
      const Square front = *hit.first;
      const Square target = *hit.second;
      const Piece front_piece = in.after.piece_on(front);
      if (!is_slider(type_of(front_piece)) || !covers(type_of(front_piece), dir) ||
          is_king(in.after, target) || piece_value(in.after.piece_on(target)) < kMinorValue) {
        continue;
      }
      const int gain_after = evaluate_exchange(in.after, target, front_piece, front, &ctx);
      const int gain_before =
          in.before.piece_on(front) == front_piece && in.before.piece_on(target) != Piece::None &&
                  can_attack(in.before, front, front_piece, target)
              ? evaluate_exchange(in.before, target, front_piece, front, &ctx)
              : 0;
      if (gain_after > 0 && gain_before <= 0) {
        return Detection::hit("x-ray attack", 6, FindingCategory::Tactic);
      }
    }
    return Detection::none();
  });
}

Detection detect_decoy(const TacticInput& in, const AnalysisContext&) {
  return guarded("decoy", in, [&]() {
    if (in.pv == nullptr || in.pv->empty() || piece_value(in.piece) < kMinorValue) {
      return Detection::none();
    }
    const auto king = in.after.king_square(flip(in.color));
    if (!king || !gives_check(in.after, in.move.to) ||
        !can_attack(in.after, *king, in.after.piece_on(*king), in.move.to)) {
      return Detection::none();
    }
    const PvLine& line = in.pv->front();
    if (line.moves.size() < 2) {
      return Detection::none();
    }
    const auto& first = line.moves[0].uci;
    if (first && (first->from != in.move.from || first->to != in.move.to)) {
      return Detection::none();
    }
    const auto& reply = line.moves[1].uci;
    if (reply && reply->from == *king && reply->to == in.move.to) {
      return Detection::hit("decoy sacrifice", 8, FindingCategory::Sacrifice);
    }
    return Detection::none();
  });
}

Detection detect_double_attack(const TacticInput& in, const AnalysisContext& ctx) {
  return guarded("double-attack", in, [&]() {
    const auto targets = targets_by_value(in.after, in.move.to, kMinorValue, false);
    const auto winnable = [&](Square sq) { return is_winnable(in.after, sq, in.color, &ctx); };
    if (gives_check(in.after, in.move.to)) {
      if (std::any_of(targets.begin(), targets.end(), winnable)) {
        return Detection::hit("double attack: check and wins material", 8,
                              FindingCategory::Tactic);
      }
      return Detection::none();
    }
    if (targets.size() >= 2 && std::any_of(targets.begin(), targets.end(), winnable)) {
      return Detection::hit("double attack on multiple pieces", 6, FindingCategory::Tactic);
    }
    return Detection::none();
  });
}

Detection detect_perpetual_check(const TacticInput& in, const AnalysisContext& ctx) {
  return guarded("perpetual", in, [&]() {
    if (in.pv == nullptr || in.pv->empty()) {
      return Detection::none();
    }
    const auto& moves = in.pv->front().moves;
    const auto plies = static_cast<int>(moves.size());
    if (plies < ctx.params.perpetual_min_plies) {
      return Detection::none();
    }
    const auto checks = std::count_if(moves.begin(), moves.end(),
                                      [](const PvMove& m) { return m.check; });
    if (static_cast<double>(checks) < plies * ctx.params.perpetual_check_ratio) {
      return Detection::none();
    }
    std::set<std::pair<std::string, std::string>> seen;
    const int window = std::min(plies, ctx.params.perpetual_window);
    for (int i = 0; i < window && i + 1 < plies; i += 2) {
      const auto pair = std::make_pair(moves[static_cast<std::size_t>(i)].text,
                                       moves[static_cast<std::size_t>(i + 1)].text);
      if (!seen.insert(pair).second) {
        return Detection::hit("perpetual check", 8, FindingCategory::Check);
      }
    }
    return Detection::none();
  });
}

Detection detect_check(const TacticInput& in, const AnalysisContext&) {
  return guarded("check", in, [&]() {
    if (!in_check(in.after, flip(in.color))) {
      return Detection::none();
    }
    for (const Square sq : attacked_enemies(in.after, in.move.to)) {
      if (!is_king(in.after, sq) && piece_value(in.after.piece_on(sq)) >= kMinorValue) {
        return Detection::hit("check with attack", 4, FindingCategory::Check);
      }
    }
    return Detection::hit("gives check", 3, FindingCategory::Check);
  });
}

std::span<const NamedDetector> tactic_battery() {
  static constexpr std::array<NamedDetector, 19> kBattery = {{
      {"threat", &detect_threat},
      {"double-check", &detect_double_check},
      {"discovered", &detect_discovered_attack},
      {"pin", &detect_pin},
      {"skewer", &detect_skewer},
      {"fork", &detect_fork},
      {"removal", &detect_removal_of_defender},
      {"overloading", &detect_overloading},
      {"deflection", &detect_deflection},
      {"trapped", &detect_trapped_piece},
      {"hanging", &detect_hanging_piece},
      {"back-rank", &detect_back_rank},
      {"promotion", &detect_promotion_threat},
      {"smothered", &detect_smothered_mate},
      {"xray", &detect_xray},
      {"decoy", &detect_decoy},
      {"double-attack", &detect_double_attack},
      {"perpetual", &detect_perpetual_check},
      {"check", &detect_check},
  }};
  return kBattery;
}

}  // namespace motif
