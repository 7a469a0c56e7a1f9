#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tether::ipc
{

using Json = nlohmann::json;

// ─── Status ──────────────────────────────────────────────────────────────────

enum class ErrorCode : uint8_t
{
    Ok             = 0,
    SpawnFailed    = 1,   // worker binary missing or unlaunchable
    WriteFailed    = 2,   // stale handle, closed pipe, or write timeout
    DecodeFailed   = 3,   // malformed output line
    NotRunning     = 4,   // submit while the supervisor is not Running
    InvalidCommand = 5,   // caller-supplied command object is not {cmd: string, ...}
    SurfaceMissing = 6,   // named surface does not exist
    Io             = 7,   // local filesystem error (config, autostart)
};

const char* error_code_name(ErrorCode code);

// Outcome of an operation.  Default-constructed means success.
class IpcStatus
{
   public:
    IpcStatus() = default;
    IpcStatus(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    static IpcStatus success() { return {}; }

    bool               ok() const { return code_ == ErrorCode::Ok; }
    ErrorCode          code() const { return code_; }
    const std::string& message() const { return message_; }

    // "<CodeName>: <message>", or "Ok".
    std::string to_string() const;

   private:
    ErrorCode   code_ = ErrorCode::Ok;
    std::string message_;
};

// ─── Outbound command ────────────────────────────────────────────────────────
// Wire shape: {"cmd": <string>, ...fields}.  Fire-and-forget; replies arrive
// later as independent events.  Optional fields are stored as explicit nulls
// so every command of a given name serializes with the same key set.

class OutboundCommand
{
   public:
    explicit OutboundCommand(std::string cmd, Json fields = Json::object());

    const std::string& cmd() const { return cmd_; }
    const Json&        fields() const { return fields_; }

    // Returns the field value or a null Json if absent.
    const Json& field(std::string_view key) const;

    bool operator==(const OutboundCommand& other) const = default;

   private:
    std::string cmd_;
    Json        fields_;
};

// ─── Inbound event ───────────────────────────────────────────────────────────
// Wire shape: {"type": <string>, "data": <optional JSON>}.

struct InboundEvent
{
    std::string         event_type;
    std::optional<Json> data;

    bool operator==(const InboundEvent& other) const = default;
};

// ─── Event types ─────────────────────────────────────────────────────────────
// Only BREAK_DUE and SCHEDULE_WARNING carry routing rules; the rest are
// listed for readability of call sites and tests.

inline constexpr std::string_view EVT_READY             = "ready";
inline constexpr std::string_view EVT_METRICS           = "metrics";
inline constexpr std::string_view EVT_STATUS            = "status";
inline constexpr std::string_view EVT_STATE_CHANGE      = "state_change";
inline constexpr std::string_view EVT_BREAK_DUE         = "break_due";
inline constexpr std::string_view EVT_SCHEDULE_WARNING  = "schedule_warning";
inline constexpr std::string_view EVT_SCHEDULE_ACTION   = "schedule_action_executed";
inline constexpr std::string_view EVT_ERROR             = "error";
inline constexpr std::string_view EVT_FATAL_ERROR       = "fatal_error";
inline constexpr std::string_view EVT_SHUTDOWN_ACK      = "shutdown_ack";

// Push events delivered to surfaces.
inline constexpr std::string_view PUSH_SHOW_BREAK            = "show-break";
inline constexpr std::string_view PUSH_SHOW_SCHEDULE_WARNING = "show-schedule-warning";

// Longest stdout/stderr line the transport accepts (1 MiB).
static constexpr size_t MAX_LINE_SIZE = 1024 * 1024;

}   // namespace tether::ipc
