#pragma once

#include "message.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace tether::ipc
{

// ─── Transport events ────────────────────────────────────────────────────────

struct TransportEvent
{
    enum class Kind : uint8_t
    {
        StdoutLine,
        StderrLine,
        ProcessError,   // I/O failure or oversized line; the stream continues
        Terminated,     // always the last event of a stream
    };

    Kind        kind = Kind::StdoutLine;
    std::string text;             // line without terminator, or error description
    int         exit_code = -1;   // Terminated: exit status, -1 if killed by a signal
    int         signal    = 0;    // Terminated: terminating signal, 0 if exited normally

    static TransportEvent stdout_line(std::string line) { return {Kind::StdoutLine, std::move(line)}; }
    static TransportEvent stderr_line(std::string line) { return {Kind::StderrLine, std::move(line)}; }
    static TransportEvent process_error(std::string what) { return {Kind::ProcessError, std::move(what)}; }
    static TransportEvent terminated(int exit_code, int signal)
    {
        return {Kind::Terminated, {}, exit_code, signal};
    }
};

// Pull-based, non-restartable sequence of output events for one worker run.
class EventStream
{
   public:
    virtual ~EventStream() = default;

    // Blocks until the next event.  Returns std::nullopt once the Terminated
    // event has been delivered, or after close().
    virtual std::optional<TransportEvent> next_event() = 0;

    // Unblocks next_event() permanently and drops undelivered events.  Does
    // not stop the worker.
    virtual void close() = 0;
};

// Write side of one worker run.  Exclusively owned by the supervisor.
class WorkerHandle
{
   public:
    virtual ~WorkerHandle() = default;

    // Appends '\n' and writes the whole line.  Concurrent calls are
    // serialized so lines never interleave.  Fails with WriteFailed if the
    // worker already exited, the pipe is closed, or no progress is possible
    // within the write timeout.
    virtual IpcStatus write_line(std::string_view bytes) = 0;

    // Best-effort SIGTERM plus closing the worker's stdin.  Idempotent.
    virtual void terminate() = 0;

    // False once the worker has exited or terminate() was called.
    virtual bool is_valid() const = 0;

    virtual pid_t pid() const = 0;
};

struct LaunchSpec
{
    std::string              executable;
    std::vector<std::string> args;
};

struct StartResult
{
    IpcStatus                     status;
    std::unique_ptr<EventStream>  events;
    std::unique_ptr<WorkerHandle> handle;

    bool ok() const { return status.ok() && events && handle; }
};

// Spawns workers.  Abstract so the supervisor can be driven by a fake in tests.
class Transport
{
   public:
    virtual ~Transport() = default;

    // On failure the result carries SpawnFailed and no stream or handle.
    virtual StartResult start(const LaunchSpec& spec) = 0;
};

// ─── SubprocessTransport ─────────────────────────────────────────────────────
// posix_spawn with stdin/stdout/stderr pipes.  One pump thread per run polls
// stdout and stderr together so events keep the order the kernel delivers
// them.  The run ends when the worker process exits, even if a descendant
// still holds its pipes: buffered output is drained, the worker is reaped
// and Terminated is emitted.

class SubprocessTransport : public Transport
{
   public:
    static constexpr std::chrono::milliseconds DEFAULT_WRITE_TIMEOUT{2000};

    explicit SubprocessTransport(std::chrono::milliseconds write_timeout = DEFAULT_WRITE_TIMEOUT);

    StartResult start(const LaunchSpec& spec) override;

    // Resolves a bare name against $PATH.  Names containing '/' are checked
    // in place.  Returns std::nullopt if nothing executable is found.
    static std::optional<std::string> resolve_executable(const std::string& name);

   private:
    std::chrono::milliseconds write_timeout_;
};

}   // namespace tether::ipc
