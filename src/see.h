#pragma once
// see.h -- Static exchange evaluation on a single square.
// Recaptures are filtered for legality: a piece pinned to its king, or a
// recapture that leaves its own king in check, is never credited.

#include <array>
#include <cstdint>

#include "board.h"
#include "context.h"

namespace motif {

/**
 * @brief Small direct-mapped cache for per-position SEE results.
 *
 * Entries are keyed by (board key, attacker, source, target). Collisions
 * simply overwrite. The owner clears it whenever it likes; entries never go stale
 * because the key covers the whole board.
 */
struct SeeCache {
  void clear();
  bool probe(std::uint64_t key, Piece attacker, Square source, Square target, int& out) const;
  void store(std::uint64_t key, Piece attacker, Square source, Square target, int value);

private:
  struct Entry {
    std::uint64_t key{0};
    std::uint32_t tag{0};
    int value{0};
    bool valid{false};
  };
  static constexpr std::size_t kSize = 128;
  static_assert((kSize & (kSize - 1)) == 0, "SeeCache size must be power of two");

  [[nodiscard]] static std::uint32_t tag(Piece attacker, Square source, Square target);
  [[nodiscard]] static std::size_t index(std::uint64_t key, std::uint32_t tag);

  std::array<Entry, kSize> entries_{};
};

inline constexpr int kMaxExchangeDepth = 32;

// Net material for the side owning `attacker` after `attacker` on `source`
// captures on `target` and both sides continue rationally. The attacker is
// placed on `source` for the simulation, so hypothetical placements work.
// Returns 0 for invalid squares, an empty target or a friendly victim.
int evaluate_exchange(const Board& board, Square target, Piece attacker, Square source,
                      const AnalysisContext* ctx = nullptr);

// SEE of the cheapest legal capture of the piece on `sq` by `by`; 0 when none exists.
int capture_gain(const Board& board, Square sq, Color by, const AnalysisContext* ctx = nullptr);

// The piece on `sq` is attacked by `by` and is either undefended or wins on exchange.
bool is_winnable(const Board& board, Square sq, Color by, const AnalysisContext* ctx = nullptr);

}  // namespace motif
