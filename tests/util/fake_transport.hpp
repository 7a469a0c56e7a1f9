#pragma once

// In-memory Transport for supervisor tests.  Each start() creates a FakeRun
// that the test drives by hand: emit stdout/stderr lines, end the run, and
// inspect what the supervisor wrote.

#include "ipc/transport.hpp"

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tether::test
{

class FakeRun
{
   public:
    explicit FakeRun(pid_t pid) : pid_(pid) {}

    void emit_stdout(std::string line) { push(ipc::TransportEvent::stdout_line(std::move(line))); }
    void emit_stderr(std::string line) { push(ipc::TransportEvent::stderr_line(std::move(line))); }
    void emit_error(std::string what) { push(ipc::TransportEvent::process_error(std::move(what))); }

    // Simulates the worker exiting on its own.
    void exit_with(int code)
    {
        {
            std::lock_guard lock(mu_);
            exited_ = true;
        }
        push(ipc::TransportEvent::terminated(code, 0));
    }

    void fail_writes(bool fail)
    {
        std::lock_guard lock(mu_);
        fail_writes_ = fail;
    }

    std::vector<std::string> written() const
    {
        std::lock_guard lock(mu_);
        return written_;
    }

    bool terminate_called() const
    {
        std::lock_guard lock(mu_);
        return terminate_called_;
    }

    pid_t pid() const { return pid_; }

    // ─── Stream side ─────────────────────────────────────────────────────
    std::optional<ipc::TransportEvent> next_event()
    {
        std::unique_lock lock(mu_);
        cv_.wait(lock, [&] { return closed_ || done_ || !queue_.empty(); });
        if (closed_ || done_ || queue_.empty())
            return std::nullopt;
        auto ev = std::move(queue_.front());
        queue_.pop_front();
        if (ev.kind == ipc::TransportEvent::Kind::Terminated)
            done_ = true;
        return ev;
    }

    void close()
    {
        {
            std::lock_guard lock(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // ─── Handle side ─────────────────────────────────────────────────────
    ipc::IpcStatus write_line(std::string_view bytes)
    {
        std::lock_guard lock(mu_);
        if (fail_writes_ || exited_ || terminate_called_)
            return {ipc::ErrorCode::WriteFailed, "worker stdin is closed"};
        written_.emplace_back(bytes);
        return {};
    }

    void terminate()
    {
        bool first = false;
        {
            std::lock_guard lock(mu_);
            first             = !terminate_called_ && !exited_;
            terminate_called_ = true;
        }
        if (first)
            push(ipc::TransportEvent::terminated(-1, SIGTERM));
    }

    bool is_valid() const
    {
        std::lock_guard lock(mu_);
        return !exited_ && !terminate_called_;
    }

   private:
    void push(ipc::TransportEvent ev)
    {
        {
            std::lock_guard lock(mu_);
            queue_.push_back(std::move(ev));
        }
        cv_.notify_all();
    }

    mutable std::mutex                  mu_;
    std::condition_variable             cv_;
    std::deque<ipc::TransportEvent>     queue_;
    std::vector<std::string>            written_;
    pid_t                               pid_;
    bool                                closed_           = false;
    bool                                done_             = false;
    bool                                exited_           = false;
    bool                                terminate_called_ = false;
    bool                                fail_writes_      = false;
};

class FakeTransport : public ipc::Transport
{
   public:
    ipc::StartResult start(const ipc::LaunchSpec& spec) override
    {
        std::shared_ptr<FakeRun> run;
        {
            std::lock_guard lock(mu_);
            specs_.push_back(spec);
            if (fail_starts_ > 0)
            {
                --fail_starts_;
                cv_.notify_all();
                return {ipc::IpcStatus(ipc::ErrorCode::SpawnFailed, "no such file: " + spec.executable), nullptr, nullptr};
            }
            run = std::make_shared<FakeRun>(static_cast<pid_t>(1000 + runs_.size()));
            runs_.push_back(run);
        }
        cv_.notify_all();
        return {{}, std::make_unique<Stream>(run), std::make_unique<Handle>(run)};
    }

    // The next `n` start() calls fail with SpawnFailed.
    void fail_next_starts(int n)
    {
        std::lock_guard lock(mu_);
        fail_starts_ = n;
    }

    size_t start_calls() const
    {
        std::lock_guard lock(mu_);
        return specs_.size();
    }

    size_t run_count() const
    {
        std::lock_guard lock(mu_);
        return runs_.size();
    }

    std::shared_ptr<FakeRun> run(size_t index) const
    {
        std::lock_guard lock(mu_);
        return index < runs_.size() ? runs_[index] : nullptr;
    }

    std::shared_ptr<FakeRun> last_run() const
    {
        std::lock_guard lock(mu_);
        return runs_.empty() ? nullptr : runs_.back();
    }

    ipc::LaunchSpec last_spec() const
    {
        std::lock_guard lock(mu_);
        return specs_.empty() ? ipc::LaunchSpec{} : specs_.back();
    }

    bool wait_for_runs(size_t n, std::chrono::milliseconds timeout) const
    {
        std::unique_lock lock(mu_);
        return cv_.wait_for(lock, timeout, [&] { return runs_.size() >= n; });
    }

   private:
    class Stream : public ipc::EventStream
    {
       public:
        explicit Stream(std::shared_ptr<FakeRun> run) : run_(std::move(run)) {}
        std::optional<ipc::TransportEvent> next_event() override { return run_->next_event(); }
        void                               close() override { run_->close(); }

       private:
        std::shared_ptr<FakeRun> run_;
    };

    class Handle : public ipc::WorkerHandle
    {
       public:
        explicit Handle(std::shared_ptr<FakeRun> run) : run_(std::move(run)) {}
        ipc::IpcStatus write_line(std::string_view bytes) override { return run_->write_line(bytes); }
        void           terminate() override { run_->terminate(); }
        bool           is_valid() const override { return run_->is_valid(); }
        pid_t          pid() const override { return run_->pid(); }

       private:
        std::shared_ptr<FakeRun> run_;
    };

    mutable std::mutex                    mu_;
    mutable std::condition_variable       cv_;
    std::vector<ipc::LaunchSpec>          specs_;
    std::vector<std::shared_ptr<FakeRun>> runs_;
    int                                   fail_starts_ = 0;
};

}   // namespace tether::test
