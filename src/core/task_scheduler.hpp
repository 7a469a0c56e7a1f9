#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace tether
{

using TaskId = uint64_t;

static constexpr TaskId INVALID_TASK = 0;

// Runs deferred closures on a single background thread in due-time order.
// Tasks with the same due time run in scheduling order.  A task is never
// run twice; cancel() after it started running returns false.
// Thread-safe: all public methods may be called from any thread, including
// from inside a running task.
class TaskScheduler
{
   public:
    using Clock = std::chrono::steady_clock;
    using Task  = std::function<void()>;

    TaskScheduler();
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&)            = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    // Returns INVALID_TASK if the scheduler has been shut down.
    TaskId schedule_after(std::chrono::milliseconds delay, Task task);

    bool cancel(TaskId id);

    // Number of tasks waiting to run.
    size_t pending() const;

    // Drops every pending task and joins the worker thread.  Idempotent.
    // Must not be called from inside a task.
    void shutdown();

    bool is_shut_down() const;

   private:
    using Key = std::pair<Clock::time_point, TaskId>;

    void run();

    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::map<Key, Task>     queue_;
    std::unordered_map<TaskId, Clock::time_point> due_by_id_;
    TaskId                  next_id_  = 1;
    bool                    stopping_ = false;
    std::thread             worker_;
};

}   // namespace tether
