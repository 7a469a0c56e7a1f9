#pragma once

#include "../daemon/event_router.hpp"
#include "../daemon/supervisor.hpp"

#include <tether/logger.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tether::app
{

// Everything the host needs at boot.  Built from defaults, then a JSON file,
// then command-line flags (later sources win).
struct HostConfig
{
    // Worker
    std::string              worker_path;   // empty = resolve at boot
    std::vector<std::string> worker_args;

    // Restart policy
    std::chrono::milliseconds restart_backoff{2000};
    uint32_t                  max_consecutive_restarts = 0;
    std::chrono::milliseconds healthy_uptime{30000};

    // Router
    std::chrono::milliseconds break_push_delay{300};
    std::chrono::milliseconds warning_push_delay{800};
    std::chrono::milliseconds debug_notification_delay{500};
    int                       notification_width   = 280;
    int                       notification_height  = 320;
    int                       notification_padding = 20;
    int                       fallback_display_width  = 1920;
    int                       fallback_display_height = 1080;
    std::string               channel_prefix = "worker-";

    // Host
    std::chrono::milliseconds shutdown_grace{500};
    std::chrono::milliseconds write_timeout{2000};
    bool                      minimized = false;

    // Logging
    LogLevel    log_level = LogLevel::Info;
    std::string log_file;

    // Where settings were loaded from; empty if only defaults/flags apply.
    std::string source_path;

    daemon::RouterConfig     router_config() const;
    daemon::SupervisorConfig supervisor_config(const std::string& resolved_worker) const;

    // Overlays keys present in `doc` onto this config.  Unknown keys are
    // ignored.  Returns false and fills `error` on a key of the wrong type.
    bool apply_json(const ipc::Json& doc, std::string* error = nullptr);

    // Reads and applies a JSON file.  A missing file fails unless
    // `missing_ok` is set.
    bool load(const std::string& path, bool missing_ok, std::string* error = nullptr);

    // Default config file path (~/.config/tether/host.json).
    static std::string default_path();
};

struct CliOptions
{
    std::optional<std::string>               config_path;
    std::optional<std::string>               worker_path;
    std::vector<std::string>                 worker_args;
    std::optional<std::string>               log_level;
    std::optional<std::string>               log_file;
    std::optional<std::chrono::milliseconds> restart_backoff;
    std::optional<uint32_t>                  max_restarts;
    bool                                     minimized = false;
    bool                                     help      = false;
};

// Parses argv[1..].  Returns std::nullopt and fills `error` on an unknown
// flag, a missing value, or a malformed number.
std::optional<CliOptions> parse_cli(int argc, const char* const* argv, std::string* error = nullptr);

// Defaults, then the config file, then `cli`.  Returns std::nullopt and
// fills `error` if the config file is unreadable or invalid.
std::optional<HostConfig> build_config(const CliOptions& cli, std::string* error = nullptr);

const char* usage();

// Worker lookup: explicit path, then "tether-worker" next to the host
// binary (`argv0`), then "tether-worker" on PATH.
std::optional<std::string> resolve_worker_path(const std::string& explicit_path, const char* argv0);

static constexpr const char* WORKER_BINARY_NAME = "tether-worker";

}   // namespace tether::app
