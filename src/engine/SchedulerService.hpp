#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace hm::engine
{

// Interval timer driven by an external loop. Not thread-safe; the owning
// worker thread is the only caller.
class SchedulerService
{
  public:
    using Clock = std::chrono::steady_clock;
    using TaskId = std::size_t;
    using Callback = std::function<void()>;

    // First run happens `initial_delay` from now, then every `interval`.
    TaskId schedule(std::chrono::milliseconds interval, Callback callback,
                    std::chrono::milliseconds initial_delay);
    TaskId schedule(std::chrono::milliseconds interval, Callback callback)
    {
        return schedule(interval, std::move(callback), interval);
    }

    // Returns false if the id is unknown.
    bool cancel(TaskId id);

    // Pushes the next run of `id` to one interval after `now`. Used after a
    // task was run out of band.
    bool postpone(TaskId id, Clock::time_point now);

    // Run pending tasks. Returns how many were executed.
    std::size_t tick(Clock::time_point now);

    // Helper for the main loop: "How long can I sleep before work is due?"
    std::chrono::milliseconds time_until_next_task(Clock::time_point now) const;

    std::size_t size() const noexcept { return tasks_.size(); }

  private:
    struct Task
    {
        TaskId id;
        std::chrono::milliseconds interval;
        Clock::time_point next_run;
        Callback callback;
    };

    std::vector<Task>::iterator find(TaskId id);

    std::vector<Task> tasks_;
    TaskId next_id_ = 1;
};

} // namespace hm::engine
