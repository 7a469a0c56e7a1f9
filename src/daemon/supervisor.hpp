#pragma once

#include "../core/task_scheduler.hpp"
#include "../ipc/message.hpp"
#include "../ipc/transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace tether::daemon
{

enum class SupervisorState : uint8_t
{
    Stopped,
    Starting,
    Running,
    Terminated,   // worker exited unexpectedly, restart scheduled
    Restarting,
};

const char* supervisor_state_name(SupervisorState state);

struct SupervisorConfig
{
    ipc::LaunchSpec           launch;
    std::chrono::milliseconds restart_backoff{2000};
    uint32_t                  max_consecutive_restarts = 0;   // 0 = restart forever
    std::chrono::milliseconds healthy_uptime{30000};          // resets the restart counter
};

// Owns the lifecycle of the single worker process.
//
//   Stopped -> Starting -> Running -> Terminated -> Restarting -> Starting
//                                  \-> Stopped (stop(), or restart cap hit)
//
// A failed launch leaves the supervisor Stopped and is never retried; only an
// unexpected termination of a running worker schedules a restart.  Each run
// gets a generation number; a restart attempt carries the generation of the
// termination that caused it, so duplicate or stale attempts are no-ops.
//
// Decoded events are delivered to the event callback on the reader thread,
// one at a time, in arrival order.
class Supervisor
{
   public:
    using EventCallback = std::function<void(const ipc::InboundEvent&)>;

    Supervisor(ipc::Transport& transport, TaskScheduler& scheduler, SupervisorConfig config);
    ~Supervisor();

    Supervisor(const Supervisor&)            = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Takes effect for events read after the call.
    void set_event_callback(EventCallback cb);

    // Stopped/Terminated -> Running.  Success if already running.
    // Cancels a pending restart.
    ipc::IpcStatus start();

    // Terminates the worker and cancels any pending restart.  Idempotent.
    void stop();

    // Encodes and writes one command.  Concurrent submissions are serialized.
    // NotRunning unless the supervisor is Running; the transport is not touched.
    ipc::IpcStatus submit(const ipc::OutboundCommand& cmd);

    // Best-effort flush: submit "shutdown", wait `grace`, then stop().
    // Returns the status of the shutdown submission.
    ipc::IpcStatus shutdown(std::chrono::milliseconds grace);

    bool            is_running() const { return running_.load(std::memory_order_acquire); }
    SupervisorState state() const;

    uint64_t spawn_count() const;
    uint64_t restart_count() const;     // restarts scheduled so far
    uint32_t consecutive_restarts() const;
    bool     restart_pending() const;

    const SupervisorConfig& config() const { return config_; }

   private:
    struct Lifetime
    {
        std::mutex mu;
        bool       alive = true;
    };

    ipc::IpcStatus launch_locked();
    void           reader_loop(uint64_t generation, ipc::EventStream* events);
    void           handle_stdout(const std::string& line);
    void           on_terminated(uint64_t generation, const ipc::TransportEvent& ev);
    void           restart(uint64_t generation);
    void           release_run_locked();

    ipc::Transport&  transport_;
    TaskScheduler&   scheduler_;
    SupervisorConfig config_;

    // Serializes start/stop/restart sequences.
    std::mutex lifecycle_mu_;

    mutable std::mutex                    state_mu_;
    SupervisorState                       state_      = SupervisorState::Stopped;
    uint64_t                              generation_ = 0;
    TaskId                                restart_task_ = INVALID_TASK;
    std::chrono::steady_clock::time_point started_at_;
    uint64_t                              spawn_count_   = 0;
    uint64_t                              restart_count_ = 0;
    uint32_t                              consecutive_   = 0;

    // Single-writer access to the worker.
    std::mutex                         handle_mu_;
    std::unique_ptr<ipc::WorkerHandle> handle_;

    std::atomic<bool> running_{false};

    std::unique_ptr<ipc::EventStream> events_;
    std::thread                       reader_;

    std::mutex    cb_mu_;
    EventCallback on_event_;

    std::shared_ptr<Lifetime> lifetime_ = std::make_shared<Lifetime>();
};

}   // namespace tether::daemon
