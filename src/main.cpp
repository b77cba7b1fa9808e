#include "app/DaemonMain.hpp"

#include "engine/ArchiveFetcher.hpp"
#include "engine/FetchService.hpp"
#include "engine/JobStore.hpp"
#include "engine/Settings.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace
{

struct CommandLine
{
    bool once = false;
    int run_seconds = 0;
};

std::optional<int> parse_seconds(char const *value)
{
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    try
    {
        std::size_t consumed = 0;
        auto seconds = std::stoi(value, &consumed);
        if (consumed != std::char_traits<char>::length(value) || seconds < 0)
        {
            return std::nullopt;
        }
        return seconds;
    }
    catch (std::exception const &)
    {
        return std::nullopt;
    }
}

// Supports "--run-seconds=N" and "--run-seconds N". Without a number the
// daemon stops after 5s.
CommandLine parse_command_line(int argc, char *argv[])
{
    CommandLine options;
    for (int index = 1; index < argc; ++index)
    {
        if (argv[index] == nullptr)
            continue;
        std::string arg = argv[index];
        if (arg == "--once")
        {
            options.once = true;
        }
        else if (arg.rfind("--run-seconds=", 0) == 0)
        {
            options.run_seconds =
                parse_seconds(arg.c_str() + 14).value_or(5);
        }
        else if (arg == "--run-seconds")
        {
            if (index + 1 < argc && argv[index + 1] &&
                argv[index + 1][0] != '-')
            {
                options.run_seconds =
                    parse_seconds(argv[index + 1]).value_or(5);
                ++index;
            }
            else
            {
                options.run_seconds = 5;
            }
        }
        else
        {
            HM_LOG_WARN("ignoring unknown argument '{}'", arg);
        }
    }
    return options;
}

} // namespace

namespace hm::app
{

int daemon_main(int argc, char *argv[])
{
    try
    {
        std::signal(SIGINT, [](int) { hm::runtime::request_shutdown(); });
        std::signal(SIGTERM, [](int) { hm::runtime::request_shutdown(); });
#if defined(SIGHUP)
        std::signal(SIGHUP, [](int) { hm::runtime::request_refresh(); });
#endif

        auto read_env = [](char const *key) -> std::optional<std::string>
        {
            auto value = std::getenv(key);
            if (value == nullptr)
            {
                return std::nullopt;
            }
            return std::string(value);
        };

        auto const command_line = parse_command_line(argc, argv);

        engine::HistorySettings defaults;
        defaults.web_dir = hm::utils::data_root() / "web";
        auto loaded = engine::load_settings(read_env, defaults);
        if (loaded.status == engine::FetchStatus::Ok)
        {
            loaded = engine::validate_settings(std::move(loaded.settings));
        }
        if (loaded.status != engine::FetchStatus::Ok)
        {
            HM_LOG_ERROR("{}: {}", engine::to_string(loaded.status),
                         loaded.message);
            hm::log::print_status("HistoryMirror configuration error: {}",
                                  loaded.message);
            return 1;
        }
        auto const &settings = loaded.settings;
        if (!settings.log_file.empty())
        {
            hm::log::set_log_file(settings.log_file);
        }

        std::shared_ptr<engine::JobStore> store =
            engine::make_job_store(settings.backend, settings.web_dir);
        if (!store)
        {
            HM_LOG_ERROR("failed to open job store at {}",
                         settings.web_dir.string());
            return 1;
        }
        // Cached ids start empty, so the mirror has to as well.
        if (!store->clear())
        {
            HM_LOG_ERROR("failed to clear stale documents under {}",
                         settings.web_dir.string());
            return 1;
        }
        HM_LOG_INFO("Using {} as local cache directory.",
                    settings.web_dir.string());

        auto archive_fs = std::make_shared<engine::LocalArchiveFileSystem>();
        std::vector<engine::RefreshLocation> locations;
        for (auto const &dir : settings.archive_dirs)
        {
            locations.push_back({dir, archive_fs});
        }

        // Set once the fetcher exists; events only fire from its cycles.
        engine::ArchiveFetcher const *fetcher_view = nullptr;
        auto listener = [&fetcher_view](engine::ArchiveEvent const &event)
        {
            HM_LOG_INFO("job {} {}; {} archive entries cached", event.job_id,
                        engine::to_string(event.type),
                        fetcher_view != nullptr
                            ? fetcher_view->cache_state().size()
                            : std::size_t{0});
        };

        engine::FetcherOptions options;
        options.retained_jobs = settings.retained_jobs;
        options.cleanup_expired_jobs = settings.cleanup_expired_jobs;
        options.cleanup_beyond_limit = settings.cleanup_beyond_limit;
        auto status = engine::FetchStatus::Ok;
        auto fetcher = engine::ArchiveFetcher::create(
            std::move(locations), store, listener, options, &status);
        if (!fetcher)
        {
            hm::log::print_status("HistoryMirror configuration error: {}",
                                  engine::to_string(status));
            return 1;
        }
        fetcher_view = fetcher.get();

        engine::FetchService service(*fetcher, settings.refresh_interval);
        if (command_line.once)
        {
            auto report = service.fetch_now();
            hm::log::print_status(
                "Fetched archives: {} created, {} deleted, {} failed, {} "
                "unreachable directories.",
                report.created, report.deleted, report.failed_ingestions,
                report.unreachable_locations);
            return report.completed ? 0 : 1;
        }

        if (command_line.run_seconds > 0)
        {
            std::thread(
                [run_seconds = command_line.run_seconds]()
                {
                    std::this_thread::sleep_for(
                        std::chrono::seconds(run_seconds));
                    HM_LOG_INFO("Auto shutdown: run-seconds={} reached, "
                                "requesting shutdown",
                                run_seconds);
                    hm::runtime::request_shutdown();
                })
                .detach();
        }

        service.start();
        hm::log::print_status("HistoryMirror running; CTRL+C to stop.");

        while (!hm::runtime::should_shutdown())
        {
            if (hm::runtime::consume_refresh_request())
            {
                HM_LOG_INFO("Refresh requested");
                service.request_fetch();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        HM_LOG_INFO("Shutdown requested; waiting for the running fetch...");
        service.stop();

        hm::log::print_status("Shutdown complete.");
        HM_LOG_INFO("Shutdown complete.");
        return 0;
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "HistoryMirror daemon failed: %s\n", ex.what());
    }
    catch (...)
    {
        std::fprintf(stderr,
                     "HistoryMirror daemon failed: unknown exception\n");
    }
    return 1;
}

} // namespace hm::app

int main(int argc, char *argv[])
{
    return hm::app::daemon_main(argc, argv);
}
