#include "scratch_pool.h"

#include <catch2/catch_test_macros.hpp>
#include <thread>
#include <utility>
#include <vector>

namespace motif::test {

namespace {

constexpr const char* kStartFen = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

}  // namespace

TEST_CASE("Leases copy the source and return on scope exit", "[pool]") {
  ScratchPool pool(4);
  const Board source = Board::from_fen(kStartFen);
  {
    ScratchLease lease = pool.rent(source);
    REQUIRE(lease.valid());
    REQUIRE(lease->to_fen() == source.to_fen());
    lease->clear();
    REQUIRE(pool.idle() == 0);
  }
  REQUIRE(pool.idle() == 1);
  const PoolStats stats = pool.stats();
  REQUIRE(stats.rented == 1);
  REQUIRE(stats.returned == 1);
  REQUIRE(stats.created == 1);

  ScratchLease again = pool.rent(source);
  REQUIRE(again->to_fen() == source.to_fen());
  REQUIRE(pool.stats().created == 1);
}

TEST_CASE("Moved leases return exactly once", "[pool]") {
  ScratchPool pool(4);
  const Board source = Board::from_fen(kStartFen);
  {
    ScratchLease first = pool.rent(source);
    ScratchLease second = std::move(first);
    REQUIRE_FALSE(first.valid());
    REQUIRE(second.valid());
  }
  REQUIRE(pool.stats().returned == 1);
  REQUIRE(pool.idle() == 1);
}

TEST_CASE("Returns beyond capacity are dropped", "[pool]") {
  ScratchPool pool(1);
  const Board source = Board::from_fen(kStartFen);
  {
    ScratchLease a = pool.rent(source);
    ScratchLease b = pool.rent(source);
  }
  const PoolStats stats = pool.stats();
  REQUIRE(pool.idle() == 1);
  REQUIRE(stats.returned == 2);
  REQUIRE(stats.dropped == 1);
}

TEST_CASE("Poolless rental allocates a private board", "[pool]") {
  const Board source = Board::from_fen(kStartFen);
  ScratchLease lease = rent_scratch(nullptr, source);
  REQUIRE(lease.valid());
  REQUIRE(lease.board().to_fen() == source.to_fen());
}

TEST_CASE("Concurrent rentals keep the counters balanced", "[pool]") {
  ScratchPool pool(8);
  const Board source = Board::from_fen(kStartFen);
  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&pool, &source] {
      for (int i = 0; i < 200; ++i) {
        ScratchLease lease = pool.rent(source);
        lease->clear();
      }
    });
  }
  for (std::thread& worker : workers) {
    worker.join();
  }
  const PoolStats stats = pool.stats();
  REQUIRE(stats.rented == 800);
  REQUIRE(stats.returned == 800);
  REQUIRE(pool.idle() <= pool.capacity());
  REQUIRE(stats.created <= 4);
}

}  // namespace motif::test
