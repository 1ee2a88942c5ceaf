#include "see.h"

#include <algorithm>
#include <exception>
#include <limits>
#include <sstream>
#include <vector>

#include "attacks.h"
#include "debug.h"
#include "scratch_pool.h"

namespace motif {
namespace {

struct ExchangeStep {
  Square square{};
  Piece piece{Piece::None};
  int gain{0};
};

// Least valuable recapture that does not leave the capturer's own king attacked.
std::optional<Square> cheapest_legal_attacker(const Board& board, Square target, Color side) {
  std::optional<Square> best;
  int best_value = std::numeric_limits<int>::max();
  for (const Square from : attackers_of(board, target, side)) {
    const int value = piece_value(board.piece_on(from));
    if (value >= best_value) {
      continue;
    }
    if (!leaves_king_safe(board, Move{from, target, PieceType::None})) {
      continue;
    }
    best = from;
    best_value = value;
  }
  return best;
}

void trace_sequence(Square target, const std::vector<ExchangeStep>& steps, int result) {
  std::ostringstream oss;
  oss << "exchange on " << square_to_string(target) << ':';
  for (const ExchangeStep& step : steps) {
    oss << ' ' << piece_to_char(step.piece) << square_to_string(step.square) << '(' << step.gain
        << ')';
  }
  oss << " => " << result;
  trace_emit(TraceTopic::See, oss.str());
}

int run_exchange(const Board& board, Square target, Piece attacker, Square source,
                 const AnalysisContext* ctx) {
  ScratchLease lease = rent_scratch(ctx != nullptr ? ctx->pool : nullptr, board);
  Board& scratch = lease.board();

  const Color us = color_of(attacker);
  const Piece victim = scratch.piece_on(target);

  std::array<int, kMaxExchangeDepth> gains{};
  std::vector<ExchangeStep> steps;
  steps.reserve(8);

  scratch.set_piece(source, attacker);
  scratch.apply(Move{source, target, PieceType::None});
  int depth = 0;
  gains[depth] = piece_value(victim);
  steps.push_back(ExchangeStep{source, attacker, gains[depth]});

  // Window over the stand-pat balances, seen from the first capturer.
  int lo = std::numeric_limits<int>::min();
  int hi = std::numeric_limits<int>::max();
  Color side = flip(us);

  while (depth + 1 < kMaxExchangeDepth) {
    const int balance = (depth % 2 == 0) ? gains[depth] : -gains[depth];
    if (side == us) {
      lo = std::max(lo, balance);
    } else {
      hi = std::min(hi, balance);
    }
    if (lo >= hi) {
      break;
    }

    const auto from = cheapest_legal_attacker(scratch, target, side);
    if (!from) {
      break;
    }
    const Piece capturer = scratch.piece_on(*from);
    ++depth;
    MOTIF_INVARIANT(depth < kMaxExchangeDepth);
    gains[depth] = piece_value(scratch.piece_on(target)) - gains[depth - 1];
    steps.push_back(ExchangeStep{*from, capturer, gains[depth]});
    scratch.apply(Move{*from, target, PieceType::None});
    side = flip(side);
  }

  for (int idx = depth; idx > 0; --idx) {
    gains[idx - 1] = -std::max(-gains[idx - 1], gains[idx]);
  }

  if (trace_enabled(TraceTopic::See)) {
    trace_sequence(target, steps, gains[0]);
  }
  return gains[0];
}

}  // namespace

void SeeCache::clear() {
  for (auto& entry : entries_) {
    entry.valid = false;
  }
}

bool SeeCache::probe(std::uint64_t key, Piece attacker, Square source, Square target,
                     int& out) const {
  const std::uint32_t t = tag(attacker, source, target);
  const Entry& entry = entries_[index(key, t)];
  if (entry.valid && entry.key == key && entry.tag == t) {
    out = entry.value;
    return true;
  }
  return false;
}

void SeeCache::store(std::uint64_t key, Piece attacker, Square source, Square target, int value) {
  const std::uint32_t t = tag(attacker, source, target);
  entries_[index(key, t)] = Entry{key, t, value, true};
}

std::uint32_t SeeCache::tag(Piece attacker, Square source, Square target) {
  return (static_cast<std::uint32_t>(attacker) << 12) |
         (static_cast<std::uint32_t>(square_index(source)) << 6) |
         static_cast<std::uint32_t>(square_index(target));
}

std::size_t SeeCache::index(std::uint64_t key, std::uint32_t tag) {
  const std::uint64_t mixed =
      key ^ (key >> 17) ^ (key << 13) ^ (static_cast<std::uint64_t>(tag) << 1);
  return static_cast<std::size_t>(mixed) & (kSize - 1);
}

int evaluate_exchange(const Board& board, Square target, Piece attacker, Square source,
                      const AnalysisContext* ctx) {
  if (!is_valid(target) || !is_valid(source) || target == source || attacker == Piece::None) {
    return 0;
  }
  const Piece victim = board.piece_on(target);
  if (victim == Piece::None || color_of(victim) == color_of(attacker)) {
    return 0;
  }

  SeeCache* cache = ctx != nullptr ? ctx->see_cache : nullptr;
  const std::uint64_t key = cache != nullptr ? board.key() : 0ULL;
  if (cache != nullptr) {
    int cached_value = 0;
    if (cache->probe(key, attacker, source, target, cached_value)) {
      return cached_value;
    }
  }

  int value = 0;
  try {
    value = run_exchange(board, target, attacker, source, ctx);
  } catch (const std::exception& ex) {
    trace_emit(TraceTopic::See, std::string("exchange failed: ") + ex.what());
    return 0;
  }
  if (cache != nullptr) {
    cache->store(key, attacker, source, target, value);
  }
  return value;
}

int capture_gain(const Board& board, Square sq, Color by, const AnalysisContext* ctx) {
  if (!is_valid(sq)) {
    return 0;
  }
  const Piece victim = board.piece_on(sq);
  if (victim == Piece::None || color_of(victim) == by) {
    return 0;
  }
  const auto from = cheapest_legal_attacker(board, sq, by);
  if (!from) {
    return 0;
  }
  return evaluate_exchange(board, sq, board.piece_on(*from), *from, ctx);
}

bool is_winnable(const Board& board, Square sq, Color by, const AnalysisContext* ctx) {
  if (!is_valid(sq) || board.empty(sq) || color_of(board.piece_on(sq)) == by) {
    return false;
  }
  if (!is_attacked_by(board, sq, by)) {
    return false;
  }
  return count_defenders(board, sq, color_of(board.piece_on(sq))) == 0 ||
         capture_gain(board, sq, by, ctx) > 0;
}

}  // namespace motif
