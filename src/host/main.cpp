#include "../app/autostart.hpp"
#include "../app/console_surface_host.hpp"
#include "../app/host_commands.hpp"
#include "../app/host_config.hpp"
#include "../app/invoke_dispatcher.hpp"
#include "../app/register_invokes.hpp"
#include "../app/tray_actions.hpp"
#include "../core/task_scheduler.hpp"
#include "../daemon/event_router.hpp"
#include "../daemon/handoff_store.hpp"
#include "../daemon/supervisor.hpp"
#include "../ipc/transport.hpp"

#include <tether/logger.hpp>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <iostream>
#include <limits.h>
#include <poll.h>
#include <string>
#include <unistd.h>

namespace
{

std::atomic<bool> g_running{true};

void signal_handler(int /*sig*/)
{
    g_running.store(false, std::memory_order_relaxed);
}

// Absolute path of this binary for the autostart entry.
std::string self_executable(const char* argv0)
{
    char    buf[PATH_MAX];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n > 0)
        return std::string(buf, static_cast<size_t>(n));
    return argv0;
}

// Splits stdin into invoke request lines.
class RequestReader
{
   public:
    explicit RequestReader(const tether::app::InvokeDispatcher& dispatcher, tether::app::ConsoleSurfaceHost& host)
        : dispatcher_(dispatcher), host_(host)
    {
    }

    void feed(const char* data, size_t len)
    {
        for (size_t i = 0; i < len; ++i)
        {
            if (data[i] == '\n')
            {
                if (!overflow_)
                    handle_line(buf_);
                buf_.clear();
                overflow_ = false;
            }
            else if (!overflow_)
            {
                buf_.push_back(data[i]);
                if (buf_.size() > tether::ipc::MAX_LINE_SIZE)
                {
                    TETHER_LOG_WARN("host", "Dropping oversized request line");
                    buf_.clear();
                    overflow_ = true;
                }
            }
        }
    }

    void finish()
    {
        if (!buf_.empty() && !overflow_)
            handle_line(buf_);
        buf_.clear();
    }

   private:
    void handle_line(std::string line)
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos)
            return;

        auto request = tether::ipc::Json::parse(line, nullptr, false);
        tether::ipc::Json response;
        if (request.is_discarded())
            response = tether::app::InvokeResult::failure("request is not valid JSON").to_json();
        else
            response = dispatcher_.handle_request(request);

        response["kind"] = "response";
        host_.write_line(response);
    }

    const tether::app::InvokeDispatcher& dispatcher_;
    tether::app::ConsoleSurfaceHost&     host_;
    std::string                          buf_;
    bool                                 overflow_ = false;
};

}   // namespace

int main(int argc, char* argv[])
{
    using namespace tether;

    std::string error;
    auto        cli = app::parse_cli(argc, argv, &error);
    if (!cli)
    {
        std::cerr << "tether-host: " << error << "\n" << app::usage();
        return 2;
    }
    if (cli->help)
    {
        std::cout << app::usage();
        return 0;
    }

    auto& logger = Logger::instance();
    logger.add_sink(sinks::console_sink());

    auto config = app::build_config(*cli, &error);
    if (!config)
    {
        TETHER_LOG_CRITICAL("config", "{}", error);
        return 1;
    }

    logger.set_level(config->log_level);
    if (!config->log_file.empty())
        logger.add_sink(sinks::file_sink(config->log_file));

    std::string worker = app::resolve_worker_path(config->worker_path, argv[0])
                             .value_or(config->worker_path.empty() ? app::WORKER_BINARY_NAME : config->worker_path);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    TETHER_LOG_INFO("host", "Starting host, worker: {}", worker);
    if (!config->source_path.empty())
        TETHER_LOG_INFO("config", "Using {}", config->source_path);

    // Declaration order is teardown order in reverse: the supervisor stops
    // the worker before the router and scheduler go away.
    TaskScheduler                scheduler;
    daemon::HandoffState         handoff;
    app::ConsoleSurfaceHost      surfaces(std::cout);
    daemon::EventRouter          router(surfaces, handoff, scheduler, config->router_config());
    ipc::SubprocessTransport     transport(config->write_timeout);
    daemon::Supervisor           supervisor(transport, scheduler, config->supervisor_config(worker));
    app::Autostart               autostart(self_executable(argv[0]));
    app::HostCommands            commands(supervisor, router, handoff, surfaces, autostart,
                                          config->debug_notification_delay);

    bool               quit_done = false;
    app::TrayController tray(supervisor,
                             surfaces,
                             config->channel_prefix,
                             config->shutdown_grace,
                             [&quit_done]
                             {
                                 quit_done = true;
                                 g_running.store(false, std::memory_order_relaxed);
                             });

    app::InvokeDispatcher dispatcher;
    app::register_host_invokes(dispatcher, {&commands, &router, &surfaces, &tray});

    supervisor.set_event_callback([&router](const ipc::InboundEvent& ev) { router.dispatch(ev); });

    if (config->minimized)
        TETHER_LOG_INFO("host", "Started minimized; main surface stays hidden");
    else
        surfaces.show(daemon::SURFACE_MAIN);

    // The worker runs either way.
    auto status = supervisor.start();
    if (!status.ok())
        TETHER_LOG_ERROR("host", "Worker not started: {}", status.to_string());

    RequestReader reader(dispatcher, surfaces);
    bool          stdin_open = true;
    char          buf[4096];

    while (g_running.load(std::memory_order_relaxed))
    {
        if (!stdin_open)
        {
            ::usleep(100 * 1000);
            continue;
        }

        struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
        int           ret = ::poll(&pfd, 1, 100);
        if (ret < 0)
        {
            if (errno == EINTR)
                continue;
            TETHER_LOG_ERROR("host", "poll() on stdin failed");
            break;
        }
        if (ret == 0)
            continue;

        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n > 0)
        {
            reader.feed(buf, static_cast<size_t>(n));
        }
        else if (n == 0 || (errno != EINTR && errno != EAGAIN))
        {
            reader.finish();
            stdin_open = false;
            TETHER_LOG_DEBUG("host", "stdin closed; waiting for a signal to exit");
        }
    }

    if (!quit_done)
    {
        if (supervisor.is_running())
            supervisor.shutdown(config->shutdown_grace);
        else
            supervisor.stop();
    }
    scheduler.shutdown();

    TETHER_LOG_INFO("host", "Host stopped");
    return 0;
}
