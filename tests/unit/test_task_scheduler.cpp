#include <gtest/gtest.h>

#include "core/task_scheduler.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

using namespace tether;
using namespace std::chrono_literals;

namespace
{

// Collects task ids in run order and lets the test wait for a count.
class RunLog
{
   public:
    void record(int id)
    {
        {
            std::lock_guard lock(mu_);
            order_.push_back(id);
        }
        cv_.notify_all();
    }

    bool wait_for(size_t n, std::chrono::milliseconds timeout)
    {
        std::unique_lock lock(mu_);
        return cv_.wait_for(lock, timeout, [&] { return order_.size() >= n; });
    }

    std::vector<int> order()
    {
        std::lock_guard lock(mu_);
        return order_;
    }

   private:
    std::mutex              mu_;
    std::condition_variable cv_;
    std::vector<int>        order_;
};

}   // namespace

TEST(TaskScheduler, RunsInDueOrder)
{
    TaskScheduler scheduler;
    RunLog        log;

    scheduler.schedule_after(60ms, [&] { log.record(3); });
    scheduler.schedule_after(10ms, [&] { log.record(1); });
    scheduler.schedule_after(30ms, [&] { log.record(2); });

    ASSERT_TRUE(log.wait_for(3, 2s));
    EXPECT_EQ(log.order(), (std::vector<int>{1, 2, 3}));
}

TEST(TaskScheduler, SameDueTimeKeepsSchedulingOrder)
{
    TaskScheduler scheduler;
    RunLog        log;

    // Zero delay on a blocked worker: all three share a due time bucket.
    std::mutex gate;
    gate.lock();
    scheduler.schedule_after(0ms, [&] { std::lock_guard l(gate); });
    for (int i = 1; i <= 3; ++i)
        scheduler.schedule_after(0ms, [&, i] { log.record(i); });
    gate.unlock();

    ASSERT_TRUE(log.wait_for(3, 2s));
    EXPECT_EQ(log.order(), (std::vector<int>{1, 2, 3}));
}

TEST(TaskScheduler, CancelledTaskNeverRuns)
{
    TaskScheduler     scheduler;
    std::atomic<bool> ran{false};
    RunLog            log;

    TaskId id = scheduler.schedule_after(50ms, [&] { ran = true; });
    EXPECT_NE(id, INVALID_TASK);
    EXPECT_TRUE(scheduler.cancel(id));
    EXPECT_FALSE(scheduler.cancel(id));

    scheduler.schedule_after(100ms, [&] { log.record(1); });
    ASSERT_TRUE(log.wait_for(1, 2s));
    EXPECT_FALSE(ran.load());
}

TEST(TaskScheduler, CancelAfterRunReturnsFalse)
{
    TaskScheduler scheduler;
    RunLog        log;

    TaskId id = scheduler.schedule_after(0ms, [&] { log.record(1); });
    ASSERT_TRUE(log.wait_for(1, 2s));
    EXPECT_FALSE(scheduler.cancel(id));
    EXPECT_FALSE(scheduler.cancel(INVALID_TASK));
}

TEST(TaskScheduler, TaskMayScheduleAnother)
{
    TaskScheduler scheduler;
    RunLog        log;

    scheduler.schedule_after(0ms,
                             [&]
                             {
                                 log.record(1);
                                 scheduler.schedule_after(5ms, [&] { log.record(2); });
                             });

    ASSERT_TRUE(log.wait_for(2, 2s));
    EXPECT_EQ(log.order(), (std::vector<int>{1, 2}));
}

TEST(TaskScheduler, PendingCount)
{
    TaskScheduler scheduler;
    scheduler.schedule_after(10s, [] {});
    scheduler.schedule_after(10s, [] {});
    EXPECT_EQ(scheduler.pending(), 2u);
}

TEST(TaskScheduler, ShutdownDropsPendingTasks)
{
    std::atomic<bool> ran{false};
    TaskScheduler     scheduler;
    scheduler.schedule_after(10s, [&] { ran = true; });

    scheduler.shutdown();
    EXPECT_TRUE(scheduler.is_shut_down());
    EXPECT_EQ(scheduler.pending(), 0u);
    EXPECT_FALSE(ran.load());

    EXPECT_EQ(scheduler.schedule_after(0ms, [] {}), INVALID_TASK);
    scheduler.shutdown();
}
