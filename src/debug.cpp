#include "debug.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace motif {
namespace {

std::array<std::atomic<bool>, static_cast<std::size_t>(TraceTopic::Count)>& trace_flags() {
  static std::array<std::atomic<bool>, static_cast<std::size_t>(TraceTopic::Count)> flags{};
  return flags;
}

std::mutex& trace_mutex() {
  static std::mutex mutex;
  return mutex;
}

TraceWriter& trace_writer() {
  static TraceWriter writer = nullptr;
  return writer;
}

std::string lowercase(std::string_view sv) {
  std::string out(sv.begin(), sv.end());
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

}  // namespace

void set_trace_topic(TraceTopic topic, bool enabled) {
  trace_flags()[static_cast<std::size_t>(topic)].store(enabled, std::memory_order_relaxed);
}

bool trace_enabled(TraceTopic topic) {
  return trace_flags()[static_cast<std::size_t>(topic)].load(std::memory_order_relaxed);
}

void set_trace_writer(TraceWriter writer) {
  std::lock_guard<std::mutex> lock(trace_mutex());
  trace_writer() = writer;
}

std::optional<TraceTopic> trace_topic_from_string(std::string_view token) {
  const std::string norm = lowercase(token);
  for (std::size_t i = 0; i < static_cast<std::size_t>(TraceTopic::Count); ++i) {
    const auto topic = static_cast<TraceTopic>(i);
    if (norm == trace_topic_name(topic)) {
      return topic;
    }
  }
  return std::nullopt;
}

std::string_view trace_topic_name(TraceTopic topic) {
  switch (topic) {
    case TraceTopic::See:
      return "see";
    case TraceTopic::Tactics:
      return "tactics";
    case TraceTopic::Defense:
      return "defense";
    case TraceTopic::Sacrifice:
      return "sacrifice";
    case TraceTopic::Compose:
      return "compose";
    case TraceTopic::Pool:
      return "pool";
    case TraceTopic::Protocol:
      return "protocol";
    case TraceTopic::Count:
      break;
  }
  return "unknown";
}

void trace_emit(TraceTopic topic, std::string_view message) {
  if (!trace_enabled(topic)) {
    return;
  }
  std::ostringstream oss;
  oss << "trace " << trace_topic_name(topic) << ' ' << message;
  const std::string payload = oss.str();
  std::lock_guard<std::mutex> lock(trace_mutex());
  if (const TraceWriter writer = trace_writer()) {
    writer(topic, payload);
  } else {
    std::cout << "info string " << payload << '\n';
    std::cout.flush();
  }
}

InvariantStatus validate_board(const Board& board) {
  InvariantStatus status;
  std::ostringstream problems;
  for (const Color c : {Color::White, Color::Black}) {
    int kings = 0;
    for (int idx = 0; idx < kSquareCount; ++idx) {
      if (board.piece_on(square_at(idx)) == make_piece(c, PieceType::King)) {
        ++kings;
      }
    }
    if (kings != 1) {
      problems << (c == Color::White ? "white" : "black") << " has " << kings << " kings; ";
    }
  }
  for (const int row : {0, kBoardSize - 1}) {
    for (int col = 0; col < kBoardSize; ++col) {
      if (type_of(board.piece_on(make_square(row, col))) == PieceType::Pawn) {
        problems << "pawn on " << square_to_string(make_square(row, col)) << "; ";
      }
    }
  }
  const std::string text = problems.str();
  if (!text.empty()) {
    status.ok = false;
    status.message = text.substr(0, text.size() - 2);
  } else {
    status.message = "board ok";
  }
  return status;
}

}  // namespace motif
