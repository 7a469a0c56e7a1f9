#include "task_scheduler.hpp"

#include <exception>

#include <tether/logger.hpp>

namespace tether
{

TaskScheduler::TaskScheduler() : worker_([this] { run(); }) {}

TaskScheduler::~TaskScheduler()
{
    shutdown();
}

TaskId TaskScheduler::schedule_after(std::chrono::milliseconds delay, Task task)
{
    std::lock_guard lock(mu_);
    if (stopping_)
        return INVALID_TASK;

    TaskId id  = next_id_++;
    auto   due = Clock::now() + delay;
    queue_.emplace(Key{due, id}, std::move(task));
    due_by_id_[id] = due;
    cv_.notify_one();
    return id;
}

bool TaskScheduler::cancel(TaskId id)
{
    std::lock_guard lock(mu_);
    auto            it = due_by_id_.find(id);
    if (it == due_by_id_.end())
        return false;

    queue_.erase(Key{it->second, id});
    due_by_id_.erase(it);
    return true;
}

size_t TaskScheduler::pending() const
{
    std::lock_guard lock(mu_);
    return queue_.size();
}

void TaskScheduler::shutdown()
{
    {
        std::lock_guard lock(mu_);
        if (stopping_ && !worker_.joinable())
            return;
        stopping_ = true;
        if (!queue_.empty())
            TETHER_LOG_DEBUG("scheduler", "Dropping {} pending task(s) on shutdown", queue_.size());
        queue_.clear();
        due_by_id_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
}

bool TaskScheduler::is_shut_down() const
{
    std::lock_guard lock(mu_);
    return stopping_;
}

void TaskScheduler::run()
{
    std::unique_lock lock(mu_);
    while (!stopping_)
    {
        if (queue_.empty())
        {
            cv_.wait(lock);
            continue;
        }

        auto first = queue_.begin();
        auto due   = first->first.first;
        if (Clock::now() < due)
        {
            cv_.wait_until(lock, due);
            continue;
        }

        Task task = std::move(first->second);
        due_by_id_.erase(first->first.second);
        queue_.erase(first);

        lock.unlock();
        try
        {
            if (task)
                task();
        }
        catch (const std::exception& e)
        {
            TETHER_LOG_ERROR("scheduler", "Deferred task threw: {}", e.what());
        }
        // Captures are released outside the lock; their destructors may reschedule.
        task = nullptr;
        lock.lock();
    }
}

}   // namespace tether
