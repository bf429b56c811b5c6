#include "engine/SchedulerService.hpp"

#include "utils/Log.hpp"

#include <exception>

namespace tb::engine
{

auto SchedulerService::schedule(std::chrono::milliseconds interval,
                                Callback callback, Clock::time_point now,
                                bool run_immediately) -> TaskId
{
    TaskId id = next_id_++;
    auto next = run_immediately ? now : now + interval;
    tasks_.push({id, interval, next, std::move(callback)});
    return id;
}

bool SchedulerService::cancel(TaskId id)
{
    if (id == 0 || id >= next_id_)
    {
        return false;
    }
    return cancelled_.insert(id).second;
}

void SchedulerService::drop_cancelled_top()
{
    while (!tasks_.empty())
    {
        auto it = cancelled_.find(tasks_.top().id);
        if (it == cancelled_.end())
        {
            return;
        }
        cancelled_.erase(it);
        tasks_.pop();
    }
}

size_t SchedulerService::tick(Clock::time_point now)
{
    size_t executed = 0;
    drop_cancelled_top();
    while (!tasks_.empty() && tasks_.top().next_run <= now)
    {
        Task task = tasks_.top();
        tasks_.pop();

        if (task.callback)
        {
            try
            {
                task.callback();
            }
            catch (std::exception const &ex)
            {
                TB_LOG_ERROR("scheduled task {} failed: {}", task.id,
                             ex.what());
            }
            executed++;
        }

        // A task may cancel itself from inside its callback.
        if (auto it = cancelled_.find(task.id); it != cancelled_.end())
        {
            cancelled_.erase(it);
        }
        else
        {
            task.next_run = now + task.interval;
            tasks_.push(std::move(task));
        }
        drop_cancelled_top();
    }
    return executed;
}

std::chrono::milliseconds
SchedulerService::time_until_next_task(Clock::time_point now) const
{
    if (tasks_.empty())
    {
        return std::chrono::hours(24);
    }
    auto next = tasks_.top().next_run;
    if (now >= next)
        return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
}

} // namespace tb::engine
