#pragma once
// protocol.h -- Line-oriented command loop around the move explainer.
// Exposes a single entry point used by main() plus a feed hook for fuzzing.

#include <string_view>

namespace motif {

using ProtocolWriter = void (*)(std::string_view line);

std::string_view engine_name();
std::string_view engine_author();

int protocol_main();
// Runs every newline-separated command in `payload` against a fresh session.
void protocol_feed(std::string_view payload);
void set_protocol_writer(ProtocolWriter writer);

}  // namespace motif
