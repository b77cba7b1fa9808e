#pragma once

#include "engine/ArchiveSource.hpp"
#include "engine/CacheState.hpp"
#include "engine/Events.hpp"
#include "engine/FetchStatus.hpp"
#include "engine/OverviewAggregator.hpp"
#include "engine/Settings.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace hm::engine
{

class JobStore;

struct FetcherOptions
{
    int retained_jobs = kUnlimitedRetainedJobs;
    bool cleanup_expired_jobs = false;
    bool cleanup_beyond_limit = true;
};

struct FetchReport
{
    // False when the cycle was aborted by an exception.
    bool completed = false;
    std::size_t created = 0;
    std::size_t deleted = 0;
    std::size_t failed_ingestions = 0;
    std::size_t unreachable_locations = 0;
    std::vector<ArchiveEvent> events;
};

// Keeps the job store in sync with the archive directories. One call to
// fetch_archives() is one reconciliation cycle; callers must not run two
// cycles concurrently (FetchService serializes them).
class ArchiveFetcher
{
  public:
    // Returns null, and sets `status` to InvalidConfiguration, if the
    // retention limit is 0 or below -1, no location is given, a location has
    // no filesystem, or the store is missing.
    static std::unique_ptr<ArchiveFetcher>
    create(std::vector<RefreshLocation> locations,
           std::shared_ptr<JobStore> store, ArchiveEventListener listener,
           FetcherOptions options, FetchStatus *status = nullptr);

  private:
    struct CreateKey
    {
        explicit CreateKey() = default;
    };

  public:
    ArchiveFetcher(CreateKey, std::vector<RefreshLocation> locations,
                   std::shared_ptr<JobStore> store,
                   ArchiveEventListener listener, FetcherOptions options);

    ArchiveFetcher(ArchiveFetcher const &) = delete;
    ArchiveFetcher &operator=(ArchiveFetcher const &) = delete;

    FetchReport fetch_archives();

    CacheState const &cache_state() const noexcept { return cache_; }
    std::vector<RefreshLocation> const &locations() const noexcept
    {
        return locations_;
    }

  private:
    struct SizeLimitEviction
    {
        RefreshLocation const *location = nullptr;
        ArchiveEntry entry;
    };

    void run_cycle(FetchReport &report);
    FetchStatus ingest(RefreshLocation const &location,
                       ArchiveEntry const &entry);
    void evict_beyond_limit(std::vector<SizeLimitEviction> const &evictions,
                            FetchReport &report);
    void evict_expired(std::map<std::filesystem::path, CacheState::JobIds> const
                           &to_remove,
                       FetchReport &report);
    void evict(std::filesystem::path const &location, std::string const &job_id,
               FetchReport &report);
    bool cached_elsewhere(std::filesystem::path const &location,
                          std::string const &job_id) const;
    void notify(std::vector<ArchiveEvent> const &events);

    std::vector<RefreshLocation> locations_;
    std::shared_ptr<JobStore> store_;
    ArchiveEventListener listener_;
    FetcherOptions options_;
    bool beyond_limit_enabled_ = false;
    CacheState cache_;
    OverviewAggregator aggregator_;
};

} // namespace hm::engine
