#include "host_config.hpp"

#include "../ipc/transport.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace tether::app
{

namespace
{

void set_error(std::string* error, std::string message)
{
    if (error)
        *error = std::move(message);
}

// Each reader leaves `out` untouched when the key is absent and fails when
// the key is present with the wrong type.

bool read_int(const ipc::Json& doc, const char* key, int64_t min_value, int64_t& out, std::string* error)
{
    auto it = doc.find(key);
    if (it == doc.end())
        return true;
    if (!it->is_number_integer() || it->get<int64_t>() < min_value)
    {
        set_error(error, std::string("config key '") + key + "' must be an integer >= " + std::to_string(min_value));
        return false;
    }
    out = it->get<int64_t>();
    return true;
}

bool read_ms(const ipc::Json& doc, const char* key, std::chrono::milliseconds& out, std::string* error)
{
    int64_t value = out.count();
    if (!read_int(doc, key, 0, value, error))
        return false;
    out = std::chrono::milliseconds(value);
    return true;
}

bool read_dimension(const ipc::Json& doc, const char* key, int& out, std::string* error)
{
    int64_t value = out;
    if (!read_int(doc, key, 0, value, error))
        return false;
    out = static_cast<int>(value);
    return true;
}

bool read_string(const ipc::Json& doc, const char* key, std::string& out, std::string* error)
{
    auto it = doc.find(key);
    if (it == doc.end())
        return true;
    if (!it->is_string())
    {
        set_error(error, std::string("config key '") + key + "' must be a string");
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool read_bool(const ipc::Json& doc, const char* key, bool& out, std::string* error)
{
    auto it = doc.find(key);
    if (it == doc.end())
        return true;
    if (!it->is_boolean())
    {
        set_error(error, std::string("config key '") + key + "' must be a boolean");
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool read_string_list(const ipc::Json& doc, const char* key, std::vector<std::string>& out, std::string* error)
{
    auto it = doc.find(key);
    if (it == doc.end())
        return true;

    std::vector<std::string> values;
    bool                     valid = it->is_array();
    if (valid)
    {
        for (const auto& item : *it)
        {
            if (!item.is_string())
            {
                valid = false;
                break;
            }
            values.push_back(item.get<std::string>());
        }
    }
    if (!valid)
    {
        set_error(error, std::string("config key '") + key + "' must be an array of strings");
        return false;
    }
    out = std::move(values);
    return true;
}

bool parse_number(const std::string& text, int64_t& out)
{
    if (text.empty())
        return false;
    errno     = 0;
    char* end = nullptr;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size() || v < 0)
        return false;
    out = v;
    return true;
}

}   // namespace

// ─── HostConfig ──────────────────────────────────────────────────────────────

daemon::RouterConfig HostConfig::router_config() const
{
    daemon::RouterConfig rc;
    rc.break_push_delay     = break_push_delay;
    rc.warning_push_delay   = warning_push_delay;
    rc.notification_size    = {notification_width, notification_height};
    rc.notification_padding = notification_padding;
    rc.fallback_display     = {fallback_display_width, fallback_display_height};
    rc.channel_prefix       = channel_prefix;
    return rc;
}

daemon::SupervisorConfig HostConfig::supervisor_config(const std::string& resolved_worker) const
{
    daemon::SupervisorConfig sc;
    sc.launch.executable         = resolved_worker;
    sc.launch.args               = worker_args;
    sc.restart_backoff           = restart_backoff;
    sc.max_consecutive_restarts  = max_consecutive_restarts;
    sc.healthy_uptime            = healthy_uptime;
    return sc;
}

bool HostConfig::apply_json(const ipc::Json& doc, std::string* error)
{
    if (!doc.is_object())
    {
        set_error(error, "config root must be a JSON object");
        return false;
    }

    int64_t max_restarts = max_consecutive_restarts;
    std::string level_name;

    bool ok = read_string(doc, "worker_path", worker_path, error)
              && read_string_list(doc, "worker_args", worker_args, error)
              && read_ms(doc, "restart_backoff_ms", restart_backoff, error)
              && read_int(doc, "max_consecutive_restarts", 0, max_restarts, error)
              && read_ms(doc, "healthy_uptime_ms", healthy_uptime, error)
              && read_ms(doc, "break_push_delay_ms", break_push_delay, error)
              && read_ms(doc, "warning_push_delay_ms", warning_push_delay, error)
              && read_ms(doc, "debug_notification_delay_ms", debug_notification_delay, error)
              && read_dimension(doc, "notification_width", notification_width, error)
              && read_dimension(doc, "notification_height", notification_height, error)
              && read_dimension(doc, "notification_padding", notification_padding, error)
              && read_dimension(doc, "fallback_display_width", fallback_display_width, error)
              && read_dimension(doc, "fallback_display_height", fallback_display_height, error)
              && read_string(doc, "channel_prefix", channel_prefix, error)
              && read_ms(doc, "shutdown_grace_ms", shutdown_grace, error)
              && read_ms(doc, "write_timeout_ms", write_timeout, error)
              && read_bool(doc, "minimized", minimized, error)
              && read_string(doc, "log_level", level_name, error)
              && read_string(doc, "log_file", log_file, error);
    if (!ok)
        return false;

    max_consecutive_restarts = static_cast<uint32_t>(max_restarts);

    if (!level_name.empty() && !Logger::parse_level(level_name, log_level))
    {
        set_error(error, "config key 'log_level' has unknown level '" + level_name + "'");
        return false;
    }
    return true;
}

bool HostConfig::load(const std::string& path, bool missing_ok, std::string* error)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        if (missing_ok)
            return true;
        set_error(error, "config file not found: " + path);
        return false;
    }

    std::ifstream f(path);
    if (!f.is_open())
    {
        set_error(error, "cannot open config file: " + path);
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    auto doc = ipc::Json::parse(text, nullptr, false);
    if (doc.is_discarded())
    {
        set_error(error, "config file is not valid JSON: " + path);
        return false;
    }

    std::string reason;
    if (!apply_json(doc, &reason))
    {
        set_error(error, path + ": " + reason);
        return false;
    }
    source_path = path;
    TETHER_LOG_DEBUG("config", "Loaded {}", path);
    return true;
}

std::string HostConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        return "host.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "tether";
    return (dir / "host.json").string();
}

// ─── Command line ────────────────────────────────────────────────────────────

const char* usage()
{
    return "Usage: tether-host [options]\n"
           "  --minimized               start without showing the main surface\n"
           "  --worker <path>           worker executable\n"
           "  --worker-arg <arg>        extra worker argument (repeatable)\n"
           "  --config <path>           JSON config file (default ~/.config/tether/host.json)\n"
           "  --log-level <level>       trace|debug|info|warn|error|critical\n"
           "  --log-file <path>         also log to a file\n"
           "  --restart-backoff-ms <n>  delay before restarting a crashed worker\n"
           "  --max-restarts <n>        give up after n consecutive crashes (0 = never)\n"
           "  --help                    show this text\n";
}

std::optional<CliOptions> parse_cli(int argc, const char* const* argv, std::string* error)
{
    CliOptions opts;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg(argv[i]);

        auto value = [&](std::string& out) -> bool
        {
            if (i + 1 >= argc)
            {
                set_error(error, arg + " requires a value");
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string v;
        if (arg == "--minimized")
            opts.minimized = true;
        else if (arg == "--help" || arg == "-h")
            opts.help = true;
        else if (arg == "--worker")
        {
            if (!value(v))
                return std::nullopt;
            opts.worker_path = v;
        }
        else if (arg == "--worker-arg")
        {
            if (!value(v))
                return std::nullopt;
            opts.worker_args.push_back(v);
        }
        else if (arg == "--config")
        {
            if (!value(v))
                return std::nullopt;
            opts.config_path = v;
        }
        else if (arg == "--log-level")
        {
            if (!value(v))
                return std::nullopt;
            opts.log_level = v;
        }
        else if (arg == "--log-file")
        {
            if (!value(v))
                return std::nullopt;
            opts.log_file = v;
        }
        else if (arg == "--restart-backoff-ms" || arg == "--max-restarts")
        {
            int64_t n = 0;
            if (!value(v))
                return std::nullopt;
            if (!parse_number(v, n))
            {
                set_error(error, arg + " expects a non-negative integer, got '" + v + "'");
                return std::nullopt;
            }
            if (arg == "--max-restarts")
                opts.max_restarts = static_cast<uint32_t>(n);
            else
                opts.restart_backoff = std::chrono::milliseconds(n);
        }
        else
        {
            set_error(error, "unknown option: " + arg);
            return std::nullopt;
        }
    }
    return opts;
}

std::optional<HostConfig> build_config(const CliOptions& cli, std::string* error)
{
    HostConfig config;

    bool        explicit_file = cli.config_path.has_value();
    std::string path          = explicit_file ? *cli.config_path : HostConfig::default_path();
    if (!config.load(path, !explicit_file, error))
        return std::nullopt;

    if (cli.worker_path)
        config.worker_path = *cli.worker_path;
    if (!cli.worker_args.empty())
        config.worker_args = cli.worker_args;
    if (cli.log_file)
        config.log_file = *cli.log_file;
    if (cli.restart_backoff)
        config.restart_backoff = *cli.restart_backoff;
    if (cli.max_restarts)
        config.max_consecutive_restarts = *cli.max_restarts;
    if (cli.minimized)
        config.minimized = true;
    if (cli.log_level && !Logger::parse_level(*cli.log_level, config.log_level))
    {
        set_error(error, "unknown log level: " + *cli.log_level);
        return std::nullopt;
    }
    return config;
}

std::optional<std::string> resolve_worker_path(const std::string& explicit_path, const char* argv0)
{
    if (!explicit_path.empty())
        return ipc::SubprocessTransport::resolve_executable(explicit_path);

    // Sibling of the host binary
    if (argv0)
    {
        std::string self(argv0);
        auto        slash = self.rfind('/');
        if (slash != std::string::npos)
        {
            std::string candidate = self.substr(0, slash + 1) + WORKER_BINARY_NAME;
            if (::access(candidate.c_str(), X_OK) == 0)
                return candidate;
        }
    }
    return ipc::SubprocessTransport::resolve_executable(WORKER_BINARY_NAME);
}

}   // namespace tether::app
