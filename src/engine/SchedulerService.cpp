#include "engine/SchedulerService.hpp"

#include <algorithm>
#include <utility>

namespace hm::engine
{

auto SchedulerService::schedule(std::chrono::milliseconds interval,
                                Callback callback,
                                std::chrono::milliseconds initial_delay)
    -> TaskId
{
    TaskId id = next_id_++;
    auto next = Clock::now() + initial_delay;
    tasks_.push_back({id, interval, next, std::move(callback)});
    return id;
}

auto SchedulerService::find(TaskId id) -> std::vector<Task>::iterator
{
    return std::find_if(tasks_.begin(), tasks_.end(),
                        [id](Task const &task) { return task.id == id; });
}

bool SchedulerService::cancel(TaskId id)
{
    auto it = find(id);
    if (it == tasks_.end())
    {
        return false;
    }
    tasks_.erase(it);
    return true;
}

bool SchedulerService::postpone(TaskId id, Clock::time_point now)
{
    auto it = find(id);
    if (it == tasks_.end())
    {
        return false;
    }
    it->next_run = now + it->interval;
    return true;
}

std::size_t SchedulerService::tick(Clock::time_point now)
{
    std::size_t executed = 0;

    // Collect first: a callback may cancel or schedule tasks.
    std::vector<TaskId> due;
    for (auto const &task : tasks_)
    {
        if (task.next_run <= now)
        {
            due.push_back(task.id);
        }
    }
    for (auto id : due)
    {
        auto it = find(id);
        if (it == tasks_.end())
        {
            continue;
        }
        it->next_run = now + it->interval;
        auto callback = it->callback;
        if (callback)
        {
            callback();
            executed++;
        }
    }
    return executed;
}

std::chrono::milliseconds
SchedulerService::time_until_next_task(Clock::time_point now) const
{
    if (tasks_.empty())
    {
        return std::chrono::hours(24); // Infinite sleep essentially
    }
    auto next = std::min_element(tasks_.begin(), tasks_.end(),
                                 [](Task const &a, Task const &b) {
                                     return a.next_run < b.next_run;
                                 })->next_run;
    if (now >= next)
        return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
}

} // namespace hm::engine
