#pragma once
// scratch_pool.h -- Thread-safe pool of temporary boards handed out as RAII leases.
// A lease clears its board and hands it back on every exit path.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "board.h"

namespace motif {

class ScratchPool;

class ScratchLease {
public:
  ScratchLease() = default;
  ScratchLease(ScratchPool* owner, std::unique_ptr<Board> board);
  ~ScratchLease();

  ScratchLease(const ScratchLease&) = delete;
  ScratchLease& operator=(const ScratchLease&) = delete;
  ScratchLease(ScratchLease&& other) noexcept;
  ScratchLease& operator=(ScratchLease&& other) noexcept;

  Board& operator*() { return *board_; }
  Board* operator->() { return board_.get(); }
  [[nodiscard]] Board& board() { return *board_; }
  [[nodiscard]] bool valid() const { return board_ != nullptr; }

private:
  void release();

  ScratchPool* owner_{nullptr};
  std::unique_ptr<Board> board_{};
};

struct PoolStats {
  std::uint64_t rented{0};
  std::uint64_t returned{0};
  std::uint64_t created{0};
  std::uint64_t dropped{0};
};

class ScratchPool {
public:
  static constexpr std::size_t kDefaultCapacity = 50;

  explicit ScratchPool(std::size_t capacity = kDefaultCapacity);

  ScratchPool(const ScratchPool&) = delete;
  ScratchPool& operator=(const ScratchPool&) = delete;

  // Hands out a board holding a copy of `source`.
  ScratchLease rent(const Board& source);

  [[nodiscard]] std::size_t idle() const;
  [[nodiscard]] std::size_t capacity() const { return capacity_; }
  [[nodiscard]] PoolStats stats() const;

private:
  friend class ScratchLease;
  void give_back(std::unique_ptr<Board> board);

  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<Board>> idle_;
  std::size_t capacity_;
  PoolStats stats_{};
};

// Rents from `pool` when one is supplied, otherwise allocates a private board.
ScratchLease rent_scratch(ScratchPool* pool, const Board& source);

}  // namespace motif
