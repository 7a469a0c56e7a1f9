#pragma once

#include "message.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace tether::ipc
{

// ─── Host side ───────────────────────────────────────────────────────────────

// Serialize a command as one JSON document without the trailing newline.
// Deterministic (object keys are emitted in sorted order) and total: invalid
// UTF-8 in string fields is replaced rather than rejected.
std::string encode_command(const OutboundCommand& cmd);

// Parse one line of worker stdout.  A trailing '\r' is ignored.
// Returns std::nullopt for anything that is not {"type": <string>, ...};
// the reason is written to `error` when provided.  "data": null is treated
// the same as an absent "data".
std::optional<InboundEvent> decode_event(std::string_view line, std::string* error = nullptr);

// Build a command from a caller-supplied JSON object such as
// {"cmd": "pause", "minutes": 30}.
std::optional<OutboundCommand> command_from_json(const Json& value, std::string* error = nullptr);

// {"type": ..., "data": ...} with "data" null when absent.  Used as the
// payload of forwarded events.
Json event_to_json(const InboundEvent& event);

// ─── Worker side ─────────────────────────────────────────────────────────────
// The mirror operations, used by worker stubs and tests.

std::string encode_event(const InboundEvent& event);

std::optional<OutboundCommand> decode_command(std::string_view line, std::string* error = nullptr);

}   // namespace tether::ipc
