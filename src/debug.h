#pragma once
// debug.h -- Trace toggles, trace output hook and board validation helpers.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "board.h"

namespace motif {

enum class TraceTopic : std::uint8_t {
  See = 0,
  Tactics,
  Defense,
  Sacrifice,
  Compose,
  Pool,
  Protocol,
  Count
};

void set_trace_topic(TraceTopic topic, bool enabled);
bool trace_enabled(TraceTopic topic);
std::optional<TraceTopic> trace_topic_from_string(std::string_view token);
std::string_view trace_topic_name(TraceTopic topic);

// Receives the full "trace <topic> <msg>" payload. A null writer restores stdout.
using TraceWriter = void (*)(TraceTopic, std::string_view);
void set_trace_writer(TraceWriter writer);
void trace_emit(TraceTopic topic, std::string_view message);

struct InvariantStatus {
  bool ok{true};
  std::string message{"ok"};
};

// Flags boards the detectors cannot reason about (missing kings, pawns on the
// back ranks). Analysis still runs; the status is only reported.
InvariantStatus validate_board(const Board& board);

}  // namespace motif
