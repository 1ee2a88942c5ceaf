#include "protocol.h"

#include <cstdint>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "analysisparams.h"
#include "attacks.h"
#include "board.h"
#include "context.h"
#include "debug.h"
#include "evaluation.h"
#include "explain.h"
#include "explain_format.h"
#include "sacrifice.h"
#include "scratch_pool.h"
#include "see.h"

namespace motif {
namespace {

constexpr std::string_view kEngineName = "motif";
constexpr std::string_view kEngineAuthor = "the motif developers";

enum class ForcedMode : std::uint8_t { Auto = 0, On, Off };

struct ProtocolIo {
  std::mutex mutex;
  ProtocolWriter writer{nullptr};
};

void write_line(ProtocolIo& io, const std::string& text) {
  std::lock_guard<std::mutex> lock(io.mutex);
  if (const ProtocolWriter writer = io.writer) {
    writer(text);
  } else {
    std::cout << text << '\n';
    std::cout.flush();
  }
}

ProtocolWriter& thread_local_writer() {
  thread_local ProtocolWriter writer = nullptr;
  return writer;
}

std::string consume_token(std::string_view& view) {
  const auto first = view.find_first_not_of(' ');
  if (first == std::string_view::npos) {
    view = std::string_view{};
    return {};
  }
  view.remove_prefix(first);
  const auto end = view.find(' ');
  const auto token = view.substr(0, end);
  if (end == std::string_view::npos) {
    view = std::string_view{};
  } else {
    view.remove_prefix(end + 1);
  }
  return std::string(token);
}

std::string trimmed(std::string_view view) {
  const auto first = view.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = view.find_last_not_of(" \t\r");
  return std::string(view.substr(first, last - first + 1));
}

// Space-joins tokens up to `stop` (consumed) or the end of the line.
std::string join_tokens(std::string_view& view, std::string_view stop, bool* stopped) {
  std::string joined;
  if (stopped != nullptr) {
    *stopped = false;
  }
  for (std::string token = consume_token(view); !token.empty(); token = consume_token(view)) {
    if (!stop.empty() && token == stop) {
      if (stopped != nullptr) {
        *stopped = true;
      }
      break;
    }
    if (!joined.empty()) {
      joined.push_back(' ');
    }
    joined += token;
  }
  return joined;
}

struct ProtocolState {
  mutable ProtocolIo io{};
  Board board{Board::startpos()};
  ScratchPool pool{};
  SeeCache see_cache{};
  AnalysisContext ctx{};
  std::string evaluation{};
  std::string previous_evaluation{};
  std::vector<PvLine> pv_lines{};
  ForcedMode forced{ForcedMode::Auto};

  ProtocolState() {
    io.writer = thread_local_writer();
    ctx.pool = &pool;
    ctx.see_cache = &see_cache;
  }
};

void send_readyok(ProtocolIo& io) {
  write_line(io, "readyok");
}

void send_info(ProtocolIo& io, const std::string& msg) {
  write_line(io, "info string " + msg);
}

// Plain move-shape legality: right colour, reachable, king not left in check.
bool is_playable(const Board& board, const Move& move) {
  if (move.is_null() || board.empty(move.from)) {
    return false;
  }
  if (color_of(board.piece_on(move.from)) != board.side_to_move()) {
    return false;
  }
  const Piece pc = board.piece_on(move.from);
  const bool castle = type_of(pc) == PieceType::King && move.from.row == move.to.row &&
                      (move.to.col - move.from.col == 2 || move.from.col - move.to.col == 2);
  return (castle || can_move_to(board, move.from, move.to)) && leaves_king_safe(board, move);
}

// Number of legal replies for the side in check, stopping once it exceeds two.
int count_check_evasions(const Board& board) {
  const Color us = board.side_to_move();
  int count = 0;
  for (int from_idx = 0; from_idx < kSquareCount; ++from_idx) {
    const Square from = square_at(from_idx);
    const Piece pc = board.piece_on(from);
    if (pc == Piece::None || color_of(pc) != us) {
      continue;
    }
    for (int to_idx = 0; to_idx < kSquareCount; ++to_idx) {
      const Square to = square_at(to_idx);
      if (!can_move_to(board, from, to)) {
        continue;
      }
      if (leaves_king_safe(board, Move{from, to, PieceType::None}) && ++count > 1) {
        return count;
      }
    }
  }
  return count;
}

bool forced_reply(const ProtocolState& state) {
  switch (state.forced) {
    case ForcedMode::On:
      return true;
    case ForcedMode::Off:
      return false;
    case ForcedMode::Auto:
      break;
  }
  return in_check(state.board, state.board.side_to_move()) &&
         count_check_evasions(state.board) == 1;
}

void reset_session(ProtocolState& state) {
  state.evaluation.clear();
  state.previous_evaluation.clear();
  state.pv_lines.clear();
  state.forced = ForcedMode::Auto;
  state.see_cache.clear();
}

void handle_position(ProtocolState& state, std::string_view args) {
  std::string_view view = args;
  const std::string source = consume_token(view);
  Board next;
  bool has_moves = false;
  if (source == "startpos" || source.empty()) {
    next = Board::startpos();
    has_moves = consume_token(view) == "moves";
  } else if (source == "fen") {
    const std::string fen = join_tokens(view, "moves", &has_moves);
    if (fen.empty()) {
      send_info(state.io, "position fen needs a board description");
      return;
    }
    try {
      next = Board::from_fen(fen, false);
    } catch (const std::exception& ex) {
      send_info(state.io, std::string("FEN error: ") + ex.what());
      return;
    }
  } else {
    send_info(state.io, "position expects startpos or fen, got '" + source + "'");
    return;
  }

  for (std::string move_token = has_moves ? consume_token(view) : std::string{};
       !move_token.empty(); move_token = consume_token(view)) {
    const auto move = parse_move(move_token);
    if (!move || !is_playable(next, *move)) {
      send_info(state.io, "illegal move '" + move_token + "'");
      break;
    }
    next.apply(*move);
  }

  state.board = next;
  reset_session(state);
  const InvariantStatus status = validate_board(state.board);
  if (!status.ok) {
    send_info(state.io, "warning: " + status.message);
  }
  if (trace_enabled(TraceTopic::Protocol)) {
    trace_emit(TraceTopic::Protocol, "position " + state.board.to_fen());
  }
}

void handle_eval(ProtocolState& state, std::string_view args, std::string& slot) {
  const std::string text = trimmed(args);
  if (!text.empty() && !parse_evaluation(text)) {
    send_info(state.io, "unreadable evaluation '" + text + "'");
    return;
  }
  slot = text;
}

void handle_pv(ProtocolState& state, std::string_view args) {
  const std::string text = trimmed(args);
  PvLine line = parse_pv_line(text);
  if (line.empty()) {
    send_info(state.io, "empty pv line ignored");
    return;
  }
  state.pv_lines.push_back(std::move(line));
  if (trace_enabled(TraceTopic::Protocol)) {
    trace_emit(TraceTopic::Protocol,
               "pv " + std::to_string(state.pv_lines.size()) + ": " + text);
  }
}

void handle_forced(ProtocolState& state, std::string_view args) {
  const std::string token = consume_token(args);
  if (token == "on") {
    state.forced = ForcedMode::On;
  } else if (token == "off") {
    state.forced = ForcedMode::Off;
  } else if (token == "auto") {
    state.forced = ForcedMode::Auto;
  } else {
    send_info(state.io, "forced usage: forced on|off|auto");
    return;
  }
  send_info(state.io, "forced " + token);
}

void handle_setoption(ProtocolState& state, std::string_view args) {
  std::string_view view = args;
  if (consume_token(view) != "name") {
    send_info(state.io, "setoption usage: setoption name <option> value <value>");
    return;
  }
  bool has_value = false;
  const std::string name = join_tokens(view, "value", &has_value);
  const std::string value = has_value ? join_tokens(view, {}, nullptr) : std::string{};
  std::string error;
  if (!set_param(state.ctx.params, name, value, error)) {
    send_info(state.io, "setoption: " + error);
    return;
  }
  if (trace_enabled(TraceTopic::Protocol)) {
    trace_emit(TraceTopic::Protocol, "option " + name + " = " + value);
  }
}

std::string topic_state(TraceTopic topic) {
  return std::string(trace_topic_name(topic)) + (trace_enabled(topic) ? "=on" : "=off");
}

void handle_trace(ProtocolState& state, std::string_view args) {
  const std::string first = consume_token(args);
  if (first.empty() || first == "status") {
    std::string message = "trace:";
    for (std::size_t i = 0; i < static_cast<std::size_t>(TraceTopic::Count); ++i) {
      message += ' ' + topic_state(static_cast<TraceTopic>(i));
    }
    send_info(state.io, message);
    return;
  }

  // Both "trace on see" and "trace see on" are accepted.
  const std::string second = consume_token(args);
  const bool switch_first = first == "on" || first == "off";
  const std::string& name = switch_first ? second : first;
  const std::string& setting = switch_first ? first : second;
  if (setting != "on" && setting != "off") {
    send_info(state.io, "trace usage: trace <topic> on|off");
    return;
  }
  if (name.empty()) {
    send_info(state.io,
              "trace needs a topic (see|tactics|defense|sacrifice|compose|pool|protocol|all)");
    return;
  }
  const bool enable = setting == "on";
  if (name == "all") {
    for (std::size_t i = 0; i < static_cast<std::size_t>(TraceTopic::Count); ++i) {
      set_trace_topic(static_cast<TraceTopic>(i), enable);
    }
    send_info(state.io, std::string("trace all=") + setting);
    return;
  }
  const auto topic = trace_topic_from_string(name);
  if (!topic) {
    send_info(state.io, "unknown trace topic '" + name + "'");
    return;
  }
  set_trace_topic(*topic, enable);
  send_info(state.io, "trace " + topic_state(*topic));
}

void handle_explain(ProtocolState& state, std::string_view args) {
  const std::string token = consume_token(args);
  const auto move = parse_move(token);
  if (!move) {
    send_info(state.io, "invalid move '" + token + "'");
    return;
  }
  if (state.board.empty(move->from)) {
    send_info(state.io, "no piece on " + square_to_string(move->from));
    return;
  }

  ExplainRequest request;
  request.move = *move;
  request.evaluation = state.evaluation;
  request.previous_evaluation = state.previous_evaluation;
  request.pv_lines = state.pv_lines;
  request.forced_reply = forced_reply(state);

  const Explanation explanation = explain_move(state.board, request, state.ctx);
  const std::string text = format_explanation(explanation.text(), state.ctx.params.complexity);

  send_info(state.io, "reasons " + (text.empty() ? std::string(kEngineFallback) : text));
  if (explanation.see) {
    send_info(state.io, "see " + std::to_string(*explanation.see));
  }
  const SacrificeReport& sac = explanation.sacrifice;
  if (sac.is_capture()) {
    send_info(state.io, "capture " + std::string(verdict_name(sac.verdict)));
  }
  if (sac.is_sacrifice()) {
    std::ostringstream oss;
    oss << "sacrifice " << (sac.sacrifice_text.empty() ? "yes" : sac.sacrifice_text);
    if (sac.brilliant) {
      oss << " brilliant";
    }
    send_info(state.io, oss.str());
  }
  send_info(state.io, "category " + std::string(explanation.move_category) + " " +
                          std::string(explanation_category_name(categorize_explanation(text))));
  if (explanation.drop != EvalDrop::None) {
    send_info(state.io, "drop " + std::string(eval_drop_name(explanation.drop)));
  }
}

void handle_uci(ProtocolState& state) {
  write_line(state.io, std::string("id name ") + std::string(kEngineName));
  write_line(state.io, std::string("id author ") + std::string(kEngineAuthor));
  const AnalysisParams& p = state.ctx.params;
  std::ostringstream oss;
  oss << "options decisive=" << p.decisive_advantage << " bad=" << p.bad_position
      << " min_material=" << p.sacrifice_min_material << " pin_gain=" << p.pin_min_gain
      << " singular=" << p.singular_gap << " show_see=" << (p.show_see_values ? "true" : "false")
      << " complexity=" << complexity_name(p.complexity);
  send_info(state.io, oss.str());
  write_line(state.io, "uciok");
}

void handle_assert(const ProtocolState& state) {
  const InvariantStatus status = validate_board(state.board);
  if (status.ok) {
    send_info(state.io, "assert: board ok");
  } else {
    send_info(state.io, "assert failed: " + status.message);
  }
}

void handle_pool(const ProtocolState& state) {
  const PoolStats stats = state.pool.stats();
  std::ostringstream oss;
  oss << "pool idle=" << state.pool.idle() << " rented=" << stats.rented
      << " returned=" << stats.returned << " created=" << stats.created
      << " dropped=" << stats.dropped;
  send_info(state.io, oss.str());
}

bool dispatch_command(ProtocolState& state, std::string_view line) {
  std::string_view view = line;
  if (!view.empty() && view.back() == '\r') {
    view.remove_suffix(1);
  }
  const std::string command = consume_token(view);

  if (command.empty()) {
    return true;
  }

  if (command == "uci") {
    handle_uci(state);
  } else if (command == "isready") {
    send_readyok(state.io);
  } else if (command == "position") {
    handle_position(state, view);
  } else if (command == "eval") {
    handle_eval(state, view, state.evaluation);
  } else if (command == "preveval") {
    handle_eval(state, view, state.previous_evaluation);
  } else if (command == "pv") {
    handle_pv(state, view);
  } else if (command == "clearpv") {
    state.pv_lines.clear();
  } else if (command == "forced") {
    handle_forced(state, view);
  } else if (command == "setoption") {
    handle_setoption(state, view);
  } else if (command == "trace") {
    handle_trace(state, view);
  } else if (command == "explain") {
    handle_explain(state, view);
  } else if (command == "assert") {
    handle_assert(state);
  } else if (command == "pool") {
    handle_pool(state);
  } else if (command == "quit") {
    return false;
  } else {
    send_info(state.io, "unknown command '" + command + "'");
  }

  return true;
}

}  // namespace

std::string_view engine_name() {
  return kEngineName;
}

std::string_view engine_author() {
  return kEngineAuthor;
}

void set_protocol_writer(ProtocolWriter writer) {
  thread_local_writer() = writer;
}

int protocol_main() {
  ProtocolState state;
  std::string line;

  while (std::getline(std::cin, line)) {
    if (!dispatch_command(state, line)) {
      break;
    }
  }

  return 0;
}

void protocol_feed(std::string_view payload) {
  ProtocolState state;
  std::string_view remaining = payload;
  while (!remaining.empty()) {
    const auto newline = remaining.find('\n');
    const std::string_view line =
        (newline == std::string_view::npos) ? remaining : remaining.substr(0, newline);
    if (!dispatch_command(state, line)) {
      break;
    }
    if (newline == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(newline + 1);
  }
}

}  // namespace motif
