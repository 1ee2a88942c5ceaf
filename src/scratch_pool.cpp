#include "scratch_pool.h"

#include <utility>

#include "debug.h"

namespace motif {

ScratchLease::ScratchLease(ScratchPool* owner, std::unique_ptr<Board> board)
    : owner_(owner), board_(std::move(board)) {}

ScratchLease::~ScratchLease() {
  release();
}

ScratchLease::ScratchLease(ScratchLease&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)), board_(std::move(other.board_)) {}

ScratchLease& ScratchLease::operator=(ScratchLease&& other) noexcept {
  if (this != &other) {
    release();
    owner_ = std::exchange(other.owner_, nullptr);
    board_ = std::move(other.board_);
  }
  return *this;
}

void ScratchLease::release() {
  if (!board_) {
    return;
  }
  board_->clear();
  if (owner_ != nullptr) {
    owner_->give_back(std::move(board_));
  }
  board_.reset();
  owner_ = nullptr;
}

ScratchPool::ScratchPool(std::size_t capacity) : capacity_(capacity) {
  idle_.reserve(capacity_);
}

ScratchLease ScratchPool::rent(const Board& source) {
  std::unique_ptr<Board> board;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.rented;
    if (!idle_.empty()) {
      board = std::move(idle_.back());
      idle_.pop_back();
    } else {
      ++stats_.created;
    }
  }
  if (!board) {
    board = std::make_unique<Board>();
  }
  board->copy_from(source);
  return ScratchLease{this, std::move(board)};
}

void ScratchPool::give_back(std::unique_ptr<Board> board) {
  bool dropped = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.returned;
    if (idle_.size() < capacity_) {
      idle_.push_back(std::move(board));
    } else {
      ++stats_.dropped;
      dropped = true;
    }
  }
  if (dropped && trace_enabled(TraceTopic::Pool)) {
    trace_emit(TraceTopic::Pool, "pool full, dropping scratch board");
  }
}

std::size_t ScratchPool::idle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

PoolStats ScratchPool::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

ScratchLease rent_scratch(ScratchPool* pool, const Board& source) {
  if (pool != nullptr) {
    return pool->rent(source);
  }
  return ScratchLease{nullptr, std::make_unique<Board>(source)};
}

}  // namespace motif
