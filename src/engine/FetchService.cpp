#include "engine/FetchService.hpp"

#include "utils/Log.hpp"

#include <exception>

namespace hm::engine
{

FetchService::FetchService(ArchiveFetcher &fetcher,
                           std::chrono::milliseconds interval)
    : fetcher_(fetcher), interval_(interval)
{
}

FetchService::~FetchService()
{
    stop();
}

void FetchService::start()
{
    if (worker_running_.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    exit_requested_.store(false, std::memory_order_release);
    if (fetch_task_ != 0)
    {
        scheduler_.cancel(fetch_task_);
    }
    fetch_task_ = scheduler_.schedule(
        interval_, [this] { run_cycle(); }, std::chrono::milliseconds(0));
    HM_LOG_DEBUG("fetch service started, refresh interval {} ms",
                 interval_.count());
    worker_thread_ = std::thread([this] { worker_loop(); });
}

void FetchService::stop()
{
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        exit_requested_.store(true, std::memory_order_release);
    }
    wake_cv_.notify_all();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
        HM_LOG_DEBUG("fetch service stopped after {} cycles",
                     completed_cycles());
    }
    worker_running_.store(false, std::memory_order_release);
}

void FetchService::request_fetch()
{
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        fetch_requested_.store(true, std::memory_order_release);
    }
    wake_cv_.notify_one();
}

FetchReport FetchService::fetch_now()
{
    return run_cycle();
}

FetchReport FetchService::run_cycle()
{
    std::lock_guard<std::mutex> lock(cycle_mutex_);
    auto report = fetcher_.fetch_archives();
    completed_cycles_.fetch_add(1, std::memory_order_acq_rel);
    return report;
}

void FetchService::worker_loop()
{
    while (!exit_requested_.load(std::memory_order_acquire))
    {
        try
        {
            if (fetch_requested_.exchange(false, std::memory_order_acq_rel))
            {
                run_cycle();
                scheduler_.postpone(fetch_task_,
                                    SchedulerService::Clock::now());
            }
            else
            {
                scheduler_.tick(SchedulerService::Clock::now());
            }
        }
        catch (std::exception const &ex)
        {
            HM_LOG_ERROR("fetch worker exception: {}", ex.what());
        }

        auto wait =
            scheduler_.time_until_next_task(SchedulerService::Clock::now());
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, wait,
                          [this]
                          {
                              return exit_requested_.load(
                                         std::memory_order_acquire) ||
                                     fetch_requested_.load(
                                         std::memory_order_acquire);
                          });
    }
}

} // namespace hm::engine
