#pragma once

#include "engine/ArchiveFetcher.hpp"
#include "engine/SchedulerService.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace hm::engine
{

// Runs fetch cycles on a worker thread, every `interval` and on request.
// Cycles never overlap, whether scheduled or triggered through fetch_now().
class FetchService
{
  public:
    FetchService(ArchiveFetcher &fetcher, std::chrono::milliseconds interval);
    FetchService(FetchService const &) = delete;
    FetchService &operator=(FetchService const &) = delete;
    ~FetchService();

    // Starts the worker; the first cycle runs right away.
    void start();
    // Waits for a running cycle, then joins the worker.
    void stop();

    // Asks the worker for an extra cycle. Requests made while a cycle is
    // running collapse into one follow-up cycle.
    void request_fetch();

    // Runs a cycle on the calling thread, after any cycle in progress.
    FetchReport fetch_now();

    std::uint64_t completed_cycles() const noexcept
    {
        return completed_cycles_.load(std::memory_order_acquire);
    }
    bool running() const noexcept
    {
        return worker_running_.load(std::memory_order_acquire);
    }

  private:
    void worker_loop();
    FetchReport run_cycle();

    ArchiveFetcher &fetcher_;
    std::chrono::milliseconds interval_;
    SchedulerService scheduler_;
    SchedulerService::TaskId fetch_task_ = 0;

    std::mutex cycle_mutex_;
    std::atomic<std::uint64_t> completed_cycles_{0};

    std::atomic<bool> worker_running_{false};
    std::atomic<bool> exit_requested_{false};
    std::atomic<bool> fetch_requested_{false};
    std::thread worker_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

} // namespace hm::engine
