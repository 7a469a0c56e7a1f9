#include "supervisor.hpp"

#include "../ipc/codec.hpp"
#include "../ipc/commands.hpp"

#include <exception>
#include <string>

#include <tether/logger.hpp>

namespace tether::daemon
{

const char* supervisor_state_name(SupervisorState state)
{
    switch (state)
    {
        case SupervisorState::Stopped:
            return "Stopped";
        case SupervisorState::Starting:
            return "Starting";
        case SupervisorState::Running:
            return "Running";
        case SupervisorState::Terminated:
            return "Terminated";
        case SupervisorState::Restarting:
            return "Restarting";
    }
    return "Unknown";
}

Supervisor::Supervisor(ipc::Transport& transport, TaskScheduler& scheduler, SupervisorConfig config)
    : transport_(transport), scheduler_(scheduler), config_(std::move(config))
{
}

Supervisor::~Supervisor()
{
    {
        // Waits for an in-flight restart to finish.
        std::lock_guard life(lifetime_->mu);
        lifetime_->alive = false;
    }
    stop();
}

void Supervisor::set_event_callback(EventCallback cb)
{
    std::lock_guard lock(cb_mu_);
    on_event_ = std::move(cb);
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

ipc::IpcStatus Supervisor::start()
{
    std::lock_guard lifecycle(lifecycle_mu_);
    {
        std::lock_guard lock(state_mu_);
        if (state_ == SupervisorState::Running)
            return ipc::IpcStatus::success();

        if (restart_task_ != INVALID_TASK)
        {
            scheduler_.cancel(restart_task_);
            restart_task_ = INVALID_TASK;
        }
        // A manual start begins a fresh crash-loop budget.
        consecutive_ = 0;
        state_       = SupervisorState::Starting;
    }
    return launch_locked();
}

// Caller holds lifecycle_mu_ and has moved the state to Starting.
ipc::IpcStatus Supervisor::launch_locked()
{
    release_run_locked();

    TETHER_LOG_INFO("supervisor", "Starting worker {}", config_.launch.executable);
    ipc::StartResult result = transport_.start(config_.launch);
    if (!result.ok())
    {
        auto status = result.status.ok() ? ipc::IpcStatus(ipc::ErrorCode::SpawnFailed, "transport returned no stream")
                                         : result.status;
        TETHER_LOG_ERROR("supervisor", "Worker launch failed: {}", status.to_string());
        std::lock_guard lock(state_mu_);
        state_ = SupervisorState::Stopped;
        return status;
    }

    pid_t pid = result.handle->pid();
    {
        std::lock_guard lock(handle_mu_);
        handle_ = std::move(result.handle);
    }
    events_ = std::move(result.events);

    uint64_t generation = 0;
    {
        std::lock_guard lock(state_mu_);
        generation  = ++generation_;
        state_      = SupervisorState::Running;
        started_at_ = std::chrono::steady_clock::now();
        ++spawn_count_;
        running_.store(true, std::memory_order_release);
    }

    reader_ = std::thread(&Supervisor::reader_loop, this, generation, events_.get());
    TETHER_LOG_INFO("supervisor", "Worker running (pid {}, generation {})", pid, generation);
    return ipc::IpcStatus::success();
}

// Joins the previous reader and drops the previous run's stream.
// Caller holds lifecycle_mu_.
void Supervisor::release_run_locked()
{
    if (events_)
        events_->close();
    if (reader_.joinable())
        reader_.join();
    events_.reset();
}

void Supervisor::stop()
{
    std::lock_guard lifecycle(lifecycle_mu_);
    bool            was_active = false;
    {
        std::lock_guard lock(state_mu_);
        if (restart_task_ != INVALID_TASK)
        {
            scheduler_.cancel(restart_task_);
            restart_task_ = INVALID_TASK;
        }
        was_active = state_ != SupervisorState::Stopped;
        state_     = SupervisorState::Stopped;
        ++generation_;   // the reader ignores the Terminated this causes
        running_.store(false, std::memory_order_release);
    }
    {
        std::lock_guard lock(handle_mu_);
        if (handle_)
            handle_->terminate();
        handle_.reset();
    }
    release_run_locked();

    if (was_active)
        TETHER_LOG_INFO("supervisor", "Supervisor stopped");
}

ipc::IpcStatus Supervisor::shutdown(std::chrono::milliseconds grace)
{
    auto status = submit(ipc::make_shutdown());
    if (status.ok())
        std::this_thread::sleep_for(grace);
    else
        TETHER_LOG_WARN("supervisor", "Shutdown command not delivered: {}", status.to_string());
    stop();
    return status;
}

// ─── Commands ────────────────────────────────────────────────────────────────

ipc::IpcStatus Supervisor::submit(const ipc::OutboundCommand& cmd)
{
    std::lock_guard lock(handle_mu_);
    if (!running_.load(std::memory_order_acquire) || !handle_)
        return {ipc::ErrorCode::NotRunning, "worker is not running"};

    auto status = handle_->write_line(ipc::encode_command(cmd));
    if (!status.ok())
        TETHER_LOG_WARN("supervisor", "Failed to send {}: {}", cmd.cmd(), status.to_string());
    else
        TETHER_LOG_TRACE("supervisor", "Sent {}", cmd.cmd());
    return status;
}

// ─── Reader ──────────────────────────────────────────────────────────────────

void Supervisor::reader_loop(uint64_t generation, ipc::EventStream* events)
{
    while (auto ev = events->next_event())
    {
        switch (ev->kind)
        {
            case ipc::TransportEvent::Kind::StdoutLine:
                handle_stdout(ev->text);
                break;
            case ipc::TransportEvent::Kind::StderrLine:
                TETHER_LOG_WARN("worker", "{}", ev->text);
                break;
            case ipc::TransportEvent::Kind::ProcessError:
                TETHER_LOG_WARN("transport", "{}", ev->text);
                break;
            case ipc::TransportEvent::Kind::Terminated:
                on_terminated(generation, *ev);
                break;
        }
    }
    TETHER_LOG_DEBUG("supervisor", "Reader for generation {} finished", generation);
}

void Supervisor::handle_stdout(const std::string& line)
{
    std::string error;
    auto        event = ipc::decode_event(line, &error);
    if (!event)
    {
        TETHER_LOG_WARN("codec", "Dropping malformed worker line ({}): {}", error, line);
        return;
    }

    EventCallback cb;
    {
        std::lock_guard lock(cb_mu_);
        cb = on_event_;
    }
    if (!cb)
        return;

    try
    {
        cb(*event);
    }
    catch (const std::exception& e)
    {
        TETHER_LOG_ERROR("supervisor", "Event handler failed on {}: {}", event->event_type, e.what());
    }
}

void Supervisor::on_terminated(uint64_t generation, const ipc::TransportEvent& ev)
{
    std::lock_guard lock(state_mu_);
    if (generation != generation_ || state_ != SupervisorState::Running)
        return;   // stop() in progress, or a newer run

    running_.store(false, std::memory_order_release);
    {
        std::lock_guard handle_lock(handle_mu_);
        handle_.reset();
    }
    state_ = SupervisorState::Terminated;

    if (ev.signal != 0)
        TETHER_LOG_WARN("supervisor", "Worker killed by signal {}", ev.signal);
    else
        TETHER_LOG_WARN("supervisor", "Worker exited with status {}", ev.exit_code);

    auto uptime = std::chrono::steady_clock::now() - started_at_;
    if (uptime >= config_.healthy_uptime)
        consecutive_ = 0;

    if (config_.max_consecutive_restarts > 0 && consecutive_ >= config_.max_consecutive_restarts)
    {
        TETHER_LOG_ERROR("supervisor",
                         "Worker failed {} times in a row; giving up",
                         consecutive_);
        state_ = SupervisorState::Stopped;
        return;
    }

    ++consecutive_;
    ++restart_count_;

    std::weak_ptr<Lifetime> weak_life = lifetime_;
    restart_task_ = scheduler_.schedule_after(config_.restart_backoff,
                                              [this, weak_life, generation]
                                              {
                                                  auto life = weak_life.lock();
                                                  if (!life)
                                                      return;
                                                  std::lock_guard guard(life->mu);
                                                  if (life->alive)
                                                      restart(generation);
                                              });
    if (restart_task_ == INVALID_TASK)
    {
        TETHER_LOG_WARN("supervisor", "Scheduler stopped; worker will not be restarted");
        state_ = SupervisorState::Stopped;
        return;
    }
    TETHER_LOG_INFO("supervisor", "Restarting worker in {} ms", config_.restart_backoff.count());
}

void Supervisor::restart(uint64_t generation)
{
    std::lock_guard lifecycle(lifecycle_mu_);
    {
        std::lock_guard lock(state_mu_);
        if (state_ != SupervisorState::Terminated || generation != generation_)
        {
            TETHER_LOG_DEBUG("supervisor", "Ignoring stale restart for generation {}", generation);
            return;
        }
        restart_task_ = INVALID_TASK;
        state_        = SupervisorState::Restarting;
        TETHER_LOG_INFO("supervisor", "Restart attempt {} after generation {}", consecutive_, generation);
        state_ = SupervisorState::Starting;
    }
    auto status = launch_locked();
    if (!status.ok())
        TETHER_LOG_ERROR("supervisor", "Restart failed; worker stays stopped");
}

// ─── Queries ─────────────────────────────────────────────────────────────────

SupervisorState Supervisor::state() const
{
    std::lock_guard lock(state_mu_);
    return state_;
}

uint64_t Supervisor::spawn_count() const
{
    std::lock_guard lock(state_mu_);
    return spawn_count_;
}

uint64_t Supervisor::restart_count() const
{
    std::lock_guard lock(state_mu_);
    return restart_count_;
}

uint32_t Supervisor::consecutive_restarts() const
{
    std::lock_guard lock(state_mu_);
    return consecutive_;
}

bool Supervisor::restart_pending() const
{
    std::lock_guard lock(state_mu_);
    return restart_task_ != INVALID_TASK;
}

}   // namespace tether::daemon
