#pragma once

#include <chrono>
#include <functional>
#include <queue>
#include <unordered_set>
#include <vector>

namespace tb::engine
{

// Fixed-period task runner driven by the daemon loop. Not thread-safe; all
// calls come from the thread that owns the loop.
class SchedulerService
{
  public:
    using Clock = std::chrono::steady_clock;
    using TaskId = size_t;
    using Callback = std::function<void()>;

    // The first run is due `interval` after `now`, or immediately when
    // `run_immediately` is set.
    TaskId schedule(std::chrono::milliseconds interval, Callback callback,
                    Clock::time_point now = Clock::now(),
                    bool run_immediately = false);
    bool cancel(TaskId id);

    // Runs due tasks. A callback that throws is logged and stays scheduled.
    // Returns how many were executed.
    size_t tick(Clock::time_point now);

    std::chrono::milliseconds time_until_next_task(Clock::time_point now) const;
    size_t size() const noexcept
    {
        return tasks_.size() > cancelled_.size()
                   ? tasks_.size() - cancelled_.size()
                   : 0;
    }

  private:
    struct Task
    {
        TaskId id;
        std::chrono::milliseconds interval;
        Clock::time_point next_run;
        Callback callback;

        // Min-heap priority queue needs > operator for smallest-first
        bool operator>(const Task &other) const
        {
            return next_run > other.next_run;
        }
    };

    void drop_cancelled_top();

    std::priority_queue<Task, std::vector<Task>, std::greater<Task>> tasks_;
    std::unordered_set<TaskId> cancelled_;
    TaskId next_id_ = 1;
};

} // namespace tb::engine
