#include "transport.hpp"

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <tether/logger.hpp>

extern char** environ;

namespace tether::ipc
{

namespace
{

std::string errno_string(int err)
{
    return std::strerror(err);
}

void close_fd(int& fd)
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

bool is_executable_file(const std::string& path)
{
    struct stat st
    {
    };
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
        return false;
    return ::access(path.c_str(), X_OK) == 0;
}

// ─── RunState ────────────────────────────────────────────────────────────────
// Shared between the pump thread, the event stream and the write handle of
// one worker run.

struct RunState
{
    pid_t pid = -1;

    // Event queue (guarded by mu).
    std::mutex                 mu;
    std::condition_variable    cv;
    std::deque<TransportEvent> events;
    bool                       terminated_delivered = false;
    bool                       closed               = false;

    // Set under `mu` right after the child is reaped.  While false the pid
    // still belongs to our child (possibly a zombie), so kill() is safe.
    std::atomic<bool> reaped{false};
    std::atomic<bool> terminate_requested{false};

    // Write side (guarded by write_mu).
    std::mutex write_mu;
    int        stdin_fd = -1;

    // Events nobody will read are dropped once the stream is closed.
    void push(TransportEvent ev)
    {
        {
            std::lock_guard lock(mu);
            if (closed)
                return;
            events.push_back(std::move(ev));
        }
        cv.notify_all();
    }

    void signal_child(int sig)
    {
        std::lock_guard lock(mu);
        if (!reaped.load() && pid > 0)
            ::kill(pid, sig);
    }
};

// Splits a byte stream into lines, enforcing MAX_LINE_SIZE.
class LineSplitter
{
   public:
    explicit LineSplitter(TransportEvent::Kind kind) : kind_(kind) {}

    void feed(const char* data, size_t len, RunState& state)
    {
        for (size_t i = 0; i < len; ++i)
        {
            char c = data[i];
            if (c == '\n')
            {
                if (!discarding_)
                    emit(state);
                buf_.clear();
                discarding_ = false;
                continue;
            }
            if (discarding_)
                continue;
            buf_.push_back(c);
            if (buf_.size() > MAX_LINE_SIZE)
            {
                state.push(TransportEvent::process_error(
                    std::string(stream_name()) + " line exceeds " + std::to_string(MAX_LINE_SIZE)
                    + " bytes; discarded"));
                buf_.clear();
                discarding_ = true;
            }
        }
    }

    // EOF: a final unterminated line is still a line.
    void flush(RunState& state)
    {
        if (!discarding_ && !buf_.empty())
            emit(state);
        buf_.clear();
        discarding_ = false;
    }

   private:
    void emit(RunState& state)
    {
        if (!buf_.empty() && buf_.back() == '\r')
            buf_.pop_back();
        state.push(TransportEvent{kind_, buf_});
    }

    const char* stream_name() const { return kind_ == TransportEvent::Kind::StdoutLine ? "stdout" : "stderr"; }

    TransportEvent::Kind kind_;
    std::string          buf_;
    bool                 discarding_ = false;
};

void set_nonblocking(int fd)
{
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0)
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Exit notification without reaping.  -1 when the kernel has no pidfd
// support; the pump then falls back to polling waitid().
int open_pidfd(pid_t pid)
{
#ifdef SYS_pidfd_open
    int fd = static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
    if (fd >= 0)
    {
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);
        return fd;
    }
#else
    (void)pid;
#endif
    return -1;
}

bool child_exited(pid_t pid)
{
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) < 0)
    {
        if (errno != EINTR)
            return true;   // ECHILD: nothing left to wait for
    }
    return info.si_pid == pid;
}

constexpr int    EXIT_POLL_INTERVAL_MS = 50;
constexpr size_t MAX_DRAIN_READS       = 16;

// Reads whatever one fd has right now.  Returns false once the fd is done.
bool read_available(int fd, LineSplitter& splitter, RunState& state, char* buf, size_t len)
{
    while (true)
    {
        auto n = ::read(fd, buf, len);
        if (n > 0)
        {
            splitter.feed(buf, static_cast<size_t>(n), state);
            return true;
        }
        if (n == 0)
        {
            splitter.flush(state);
            return false;
        }
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return true;
        state.push(TransportEvent::process_error("read failed: " + errno_string(errno)));
        splitter.flush(state);
        return false;
    }
}

// The worker's exit ends the run, not EOF: a child it leaves behind may keep
// the pipes open indefinitely.  Output already buffered when the worker
// exits is still delivered.
void pump(std::shared_ptr<RunState> state, int stdout_fd, int stderr_fd, int wake_fd)
{
    LineSplitter splitters[2] = {LineSplitter(TransportEvent::Kind::StdoutLine),
                                 LineSplitter(TransportEvent::Kind::StderrLine)};
    int          fds[2]       = {stdout_fd, stderr_fd};
    char         buf[64 * 1024];

    set_nonblocking(fds[0]);
    set_nonblocking(fds[1]);
    int pid_fd = open_pidfd(state->pid);

    bool exited   = false;
    bool stopping = false;
    while (!exited && !stopping)
    {
        pollfd pfds[4] = {{fds[0], POLLIN, 0}, {fds[1], POLLIN, 0}, {wake_fd, POLLIN, 0}, {pid_fd, POLLIN, 0}};
        int    ready   = ::poll(pfds, 4, pid_fd >= 0 ? -1 : EXIT_POLL_INTERVAL_MS);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            state->push(TransportEvent::process_error("poll failed: " + errno_string(errno)));
            break;
        }

        if (pfds[2].revents != 0)
        {
            stopping = true;
            break;
        }

        for (int i = 0; i < 2; ++i)
        {
            if (fds[i] < 0 || pfds[i].revents == 0)
                continue;
            if (!read_available(fds[i], splitters[i], *state, buf, sizeof(buf)))
                close_fd(fds[i]);
        }

        exited = pid_fd >= 0 ? pfds[3].revents != 0 : child_exited(state->pid);
    }

    if (exited)
    {
        // Bounded, so a descendant that keeps writing cannot hold the run open.
        for (int i = 0; i < 2; ++i)
        {
            for (size_t reads = 0; fds[i] >= 0 && reads < MAX_DRAIN_READS; ++reads)
            {
                pollfd pfd{fds[i], POLLIN, 0};
                if (::poll(&pfd, 1, 0) <= 0)
                    break;
                if (!read_available(fds[i], splitters[i], *state, buf, sizeof(buf)))
                    close_fd(fds[i]);
            }
            splitters[i].flush(*state);
        }
    }
    close_fd(fds[0]);
    close_fd(fds[1]);
    close_fd(pid_fd);

    // Wait without reaping first, so the pid stays ours until `reaped` flips
    // under the lock.  When stopping, the stream has already sent SIGKILL.
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(state->pid), &info, WEXITED | WNOWAIT) < 0 && errno == EINTR)
    {
    }

    int status = 0;
    {
        std::lock_guard lock(state->mu);
        while (::waitpid(state->pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        state->reaped.store(true);
    }

    int exit_code = -1;
    int sig       = 0;
    if (WIFEXITED(status))
        exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        sig = WTERMSIG(status);

    TETHER_LOG_DEBUG("transport", "Worker pid={} reaped exit_code={} signal={}", state->pid, exit_code, sig);
    state->push(TransportEvent::terminated(exit_code, sig));
}

// ─── PipeEventStream ─────────────────────────────────────────────────────────

class PipeEventStream : public EventStream
{
   public:
    PipeEventStream(std::shared_ptr<RunState> state, int stdout_fd, int stderr_fd, int wake_pipe[2])
        : state_(std::move(state)),
          wake_read_(wake_pipe[0]),
          wake_write_(wake_pipe[1]),
          pump_(pump, state_, stdout_fd, stderr_fd, wake_read_)
    {
    }

    ~PipeEventStream() override
    {
        close();
        // Dropping the stream of a live worker kills it.  The wake byte stops
        // the pump even while a leftover descendant holds the pipes open.
        state_->signal_child(SIGKILL);
        char byte = 1;
        while (::write(wake_write_, &byte, 1) < 0 && errno == EINTR)
        {
        }
        if (pump_.joinable())
            pump_.join();
        close_fd(wake_read_);
        close_fd(wake_write_);
    }

    std::optional<TransportEvent> next_event() override
    {
        std::unique_lock lock(state_->mu);
        state_->cv.wait(lock,
                        [this] {
                            return state_->closed || state_->terminated_delivered
                                   || !state_->events.empty();
                        });
        if (state_->closed || state_->terminated_delivered)
            return std::nullopt;

        TransportEvent ev = std::move(state_->events.front());
        state_->events.pop_front();
        if (ev.kind == TransportEvent::Kind::Terminated)
            state_->terminated_delivered = true;
        return ev;
    }

    void close() override
    {
        {
            std::lock_guard lock(state_->mu);
            state_->closed = true;
            state_->events.clear();
        }
        state_->cv.notify_all();
    }

   private:
    std::shared_ptr<RunState> state_;
    int                       wake_read_;
    int                       wake_write_;
    std::thread               pump_;
};

// ─── PipeWorkerHandle ────────────────────────────────────────────────────────

class PipeWorkerHandle : public WorkerHandle
{
   public:
    PipeWorkerHandle(std::shared_ptr<RunState> state, std::chrono::milliseconds write_timeout)
        : state_(std::move(state)), write_timeout_(write_timeout)
    {
    }

    ~PipeWorkerHandle() override
    {
        std::lock_guard lock(state_->write_mu);
        close_fd(state_->stdin_fd);
    }

    IpcStatus write_line(std::string_view bytes) override
    {
        std::string line(bytes);
        line.push_back('\n');

        std::lock_guard lock(state_->write_mu);
        if (state_->reaped.load() || state_->terminate_requested.load() || state_->stdin_fd < 0)
            return {ErrorCode::WriteFailed, "worker is not running"};

        using Clock   = std::chrono::steady_clock;
        auto   deadline = Clock::now() + write_timeout_;
        size_t total    = 0;
        while (total < line.size())
        {
            auto n = ::write(state_->stdin_fd, line.data() + total, line.size() - total);
            if (n > 0)
            {
                total += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;
            if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)
            {
                int err = errno;
                return {ErrorCode::WriteFailed,
                        err == EPIPE ? std::string("worker stdin is closed") : "write failed: " + errno_string(err)};
            }

            // Pipe full: wait for room, but never past the deadline.
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() <= 0 || !wait_writable(static_cast<int>(remaining.count())))
            {
                if (total > 0)
                {
                    // A half-written line would corrupt the next one.
                    TETHER_LOG_ERROR("transport", "Partial write to pid={}; closing worker stdin", state_->pid);
                    close_fd(state_->stdin_fd);
                }
                return {ErrorCode::WriteFailed,
                        "write timed out after " + std::to_string(write_timeout_.count()) + " ms"};
            }
        }
        return IpcStatus::success();
    }

    void terminate() override
    {
        if (state_->terminate_requested.exchange(true))
            return;
        state_->signal_child(SIGTERM);
        std::lock_guard lock(state_->write_mu);
        close_fd(state_->stdin_fd);
    }

    bool is_valid() const override { return !state_->reaped.load() && !state_->terminate_requested.load(); }

    pid_t pid() const override { return state_->pid; }

   private:
    bool wait_writable(int timeout_ms)
    {
        pollfd pfd{state_->stdin_fd, POLLOUT, 0};
        while (true)
        {
            int r = ::poll(&pfd, 1, timeout_ms);
            if (r < 0 && errno == EINTR)
                continue;
            // POLLERR/POLLHUP count as "writable": the next write() reports EPIPE.
            return r > 0;
        }
    }

    std::shared_ptr<RunState> state_;
    std::chrono::milliseconds write_timeout_;
};

void ignore_sigpipe_once()
{
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

}   // namespace

// ─── SubprocessTransport ─────────────────────────────────────────────────────

SubprocessTransport::SubprocessTransport(std::chrono::milliseconds write_timeout)
    : write_timeout_(write_timeout)
{
    ignore_sigpipe_once();
}

std::optional<std::string> SubprocessTransport::resolve_executable(const std::string& name)
{
    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string::npos)
    {
        if (is_executable_file(name))
            return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path     = (path_env && path_env[0] != '\0') ? path_env : "/usr/local/bin:/usr/bin:/bin";
    size_t      start    = 0;
    while (start <= path.size())
    {
        size_t      end = path.find(':', start);
        std::string dir = path.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (dir.empty())
            dir = ".";
        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate))
            return candidate;
        if (end == std::string::npos)
            break;
        start = end + 1;
    }
    return std::nullopt;
}

StartResult SubprocessTransport::start(const LaunchSpec& spec)
{
    StartResult result;

    auto resolved = resolve_executable(spec.executable);
    if (!resolved)
    {
        result.status = {ErrorCode::SpawnFailed, "worker executable not found: " + spec.executable};
        return result;
    }

    int in_pipe[2]  = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2]  = {-1, -1};
    int wake_pipe[2] = {-1, -1};
    auto close_all   = [&]
    {
        for (int* p : {in_pipe, out_pipe, err_pipe, wake_pipe})
        {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (::pipe2(in_pipe, O_CLOEXEC) < 0 || ::pipe2(out_pipe, O_CLOEXEC) < 0
        || ::pipe2(err_pipe, O_CLOEXEC) < 0 || ::pipe2(wake_pipe, O_CLOEXEC | O_NONBLOCK) < 0)
    {
        int err = errno;
        close_all();
        result.status = {ErrorCode::SpawnFailed, "pipe creation failed: " + errno_string(err)};
        return result;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, in_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);

    // The host ignores SIGPIPE; the worker gets default dispositions back.
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGPIPE);
    posix_spawnattr_setsigdefault(&attr, &defaults);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    posix_spawnattr_setsigmask(&attr, &empty_mask);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);

    std::vector<char*> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(const_cast<char*>(resolved->c_str()));
    for (const auto& arg : spec.args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = 0;
    int   ret = ::posix_spawn(&pid, resolved->c_str(), &actions, &attr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    if (ret != 0)
    {
        close_all();
        result.status = {ErrorCode::SpawnFailed, "posix_spawn " + *resolved + " failed: " + errno_string(ret)};
        return result;
    }

    // Child-side ends belong to the worker now.
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    set_nonblocking(in_pipe[1]);

    auto state      = std::make_shared<RunState>();
    state->pid      = pid;
    state->stdin_fd = in_pipe[1];

    TETHER_LOG_INFO("transport", "Spawned worker {} pid={}", *resolved, pid);

    result.events = std::make_unique<PipeEventStream>(state, out_pipe[0], err_pipe[0], wake_pipe);
    result.handle = std::make_unique<PipeWorkerHandle>(state, write_timeout_);
    return result;
}

}   // namespace tether::ipc
