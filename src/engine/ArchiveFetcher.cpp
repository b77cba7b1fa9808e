#include "engine/ArchiveFetcher.hpp"

#include "engine/ArchiveBundle.hpp"
#include "engine/JobStore.hpp"
#include "engine/LegacyOverview.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <set>
#include <system_error>
#include <utility>

namespace hm::engine
{

namespace
{

std::string join_ids(std::vector<std::string> const &ids)
{
    std::string joined;
    for (auto const &id : ids)
    {
        if (!joined.empty())
        {
            joined.append(", ");
        }
        joined.append(id);
    }
    return joined;
}

} // namespace

std::unique_ptr<ArchiveFetcher>
ArchiveFetcher::create(std::vector<RefreshLocation> locations,
                       std::shared_ptr<JobStore> store,
                       ArchiveEventListener listener, FetcherOptions options,
                       FetchStatus *status)
{
    auto reject = [status](std::string_view reason) {
        HM_LOG_ERROR("Invalid archive fetcher configuration: {}", reason);
        if (status != nullptr)
        {
            *status = FetchStatus::InvalidConfiguration;
        }
        return std::unique_ptr<ArchiveFetcher>{};
    };
    if (!retained_jobs_valid(options.retained_jobs))
    {
        return reject(std::format(
            "retained jobs must be positive or -1 for unlimited, got {}",
            options.retained_jobs));
    }
    if (locations.empty())
    {
        return reject("no archive directories configured");
    }
    for (auto const &location : locations)
    {
        if (!location.fs)
        {
            return reject(std::format("no filesystem for archive directory {}",
                                      location.path.string()));
        }
    }
    if (!store)
    {
        return reject("no job store");
    }
    if (status != nullptr)
    {
        *status = FetchStatus::Ok;
    }
    return std::make_unique<ArchiveFetcher>(CreateKey{}, std::move(locations),
                                            std::move(store),
                                            std::move(listener), options);
}

ArchiveFetcher::ArchiveFetcher(CreateKey,
                               std::vector<RefreshLocation> locations,
                               std::shared_ptr<JobStore> store,
                               ArchiveEventListener listener,
                               FetcherOptions options)
    : locations_(std::move(locations)), store_(std::move(store)),
      listener_(std::move(listener)), options_(options),
      beyond_limit_enabled_(options.cleanup_beyond_limit &&
                            options.retained_jobs != kUnlimitedRetainedJobs),
      aggregator_(*store_)
{
    for (auto const &location : locations_)
    {
        cache_.track(location.path);
        HM_LOG_INFO("Monitoring directory {} for archived jobs.",
                    location.path.string());
    }
    // Readers may ask for the listing before the first cycle completes.
    aggregator_.rebuild();
}

FetchReport ArchiveFetcher::fetch_archives()
{
    FetchReport report;
    try
    {
        run_cycle(report);
        report.completed = true;
    }
    catch (std::exception const &ex)
    {
        HM_LOG_ERROR("Critical failure while fetching/processing job "
                     "archives: {}",
                     ex.what());
    }
    catch (...)
    {
        HM_LOG_ERROR("Critical failure while fetching/processing job "
                     "archives: unknown exception");
    }
    return report;
}

void ArchiveFetcher::run_cycle(FetchReport &report)
{
    HM_LOG_DEBUG("Starting archive fetching.");

    // Whatever remains in here after listing has disappeared from its
    // location.
    std::map<std::filesystem::path, CacheState::JobIds> to_remove;
    for (auto const &location : locations_)
    {
        to_remove.emplace(location.path, cache_.snapshot(location.path));
    }

    std::vector<SizeLimitEviction> beyond_limit;
    for (auto const &location : locations_)
    {
        HM_LOG_DEBUG("Checking archive directory {}.", location.path.string());
        auto entries = list_archives(location);
        if (!entries)
        {
            // Not reachable this cycle; keep everything it contributed.
            HM_LOG_WARN("{}: keeping cached jobs of {} until it is reachable",
                        to_string(FetchStatus::ListingFailed),
                        location.path.string());
            to_remove.erase(location.path);
            ++report.unreachable_locations;
            continue;
        }

        auto &missing = to_remove[location.path];
        int history_size = 0;
        for (auto const &entry : *entries)
        {
            missing.erase(entry.job_id);
            ++history_size;
            if (beyond_limit_enabled_ && history_size > options_.retained_jobs)
            {
                beyond_limit.push_back({&location, entry});
                continue;
            }
            if (cache_.contains(location.path, entry.job_id))
            {
                continue;
            }
            if (cached_elsewhere(location.path, entry.job_id))
            {
                HM_LOG_DEBUG("Job {} in {} is already mirrored from another "
                             "directory",
                             entry.job_id, location.path.string());
                cache_.mark_ingested(location.path, entry.job_id);
                continue;
            }

            HM_LOG_INFO("Processing archive {}.", entry.path.string());
            auto status = FetchStatus::IngestionFailed;
            try
            {
                status = ingest(location, entry);
            }
            catch (std::exception const &ex)
            {
                HM_LOG_ERROR("Unexpected error while processing archive {}: "
                             "{}",
                             entry.path.string(), ex.what());
            }
            if (status != FetchStatus::Ok)
            {
                HM_LOG_ERROR("Failure while fetching/processing job archive "
                             "for job {}: {}",
                             entry.job_id, to_string(status));
                if (!store_->remove(entry.job_id))
                {
                    HM_LOG_WARN("Could not clean up partial documents of "
                                "job {}",
                                entry.job_id);
                }
                ++report.failed_ingestions;
                continue;
            }
            cache_.mark_ingested(location.path, entry.job_id);
            report.events.push_back({entry.job_id, ArchiveEventType::Created});
            ++report.created;
            HM_LOG_INFO("Processing archive {} finished.",
                        entry.path.string());
        }
    }

    if (!beyond_limit.empty())
    {
        evict_beyond_limit(beyond_limit, report);
    }
    if (options_.cleanup_expired_jobs)
    {
        evict_expired(to_remove, report);
    }
    if (!report.events.empty())
    {
        aggregator_.rebuild();
    }
    notify(report.events);
    HM_LOG_DEBUG("Finished archive fetching.");
}

FetchStatus ArchiveFetcher::ingest(RefreshLocation const &location,
                                   ArchiveEntry const &entry)
{
    std::error_code ec;
    auto payload = location.fs->read(entry.path, ec);
    if (!payload || ec)
    {
        HM_LOG_ERROR("Could not read archive {}: {}", entry.path.string(),
                     ec ? ec.message() : std::string("no data"));
        return FetchStatus::IngestionFailed;
    }

    auto bundle = decode_archive_bundle(*payload);
    if (bundle.status != FetchStatus::Ok)
    {
        return bundle.status;
    }

    // Leftovers of an earlier failed attempt must not survive re-ingestion.
    if (store_->exists(entry.job_id) && !store_->remove(entry.job_id))
    {
        return FetchStatus::IngestionFailed;
    }

    for (auto &document : bundle.documents)
    {
        if (document.path == kLegacyJobOverviewPath)
        {
            HM_LOG_DEBUG("Migrating legacy overview of job {}", entry.job_id);
            auto converted = convert_legacy_overview(document.json);
            if (!converted)
            {
                return FetchStatus::MalformedArchive;
            }
            document.path = kJobsOverviewPath;
            document.json = std::move(*converted);
        }
        if (!is_safe_document_path(document.path))
        {
            HM_LOG_ERROR("Archive {} contains invalid document path '{}'",
                         entry.path.string(), document.path);
            return FetchStatus::MalformedArchive;
        }
        if (!belongs_to_job(document.path, entry.job_id))
        {
            HM_LOG_WARN("Ignoring document {} of archive {}: outside of job "
                        "{}",
                        document.path, entry.path.string(), entry.job_id);
            continue;
        }
        if (!store_->put(entry.job_id, document.path, document.json))
        {
            return FetchStatus::IngestionFailed;
        }
    }
    return FetchStatus::Ok;
}

void ArchiveFetcher::evict_beyond_limit(
    std::vector<SizeLimitEviction> const &evictions, FetchReport &report)
{
    for (auto const &eviction : evictions)
    {
        auto const &entry = eviction.entry;
        HM_LOG_INFO("Deleting archive {} beyond the retention limit of {}.",
                    entry.path.string(), options_.retained_jobs);
        std::error_code ec;
        eviction.location->fs->remove(entry.path, ec);
        if (ec)
        {
            HM_LOG_WARN("{}: failed to delete old archive {}: {}",
                        to_string(FetchStatus::HousekeepingFailed),
                        entry.path.string(), ec.message());
            // Still listed next cycle; only a mirrored job is evicted.
            if (!cache_.contains(eviction.location->path, entry.job_id))
            {
                continue;
            }
        }
        evict(eviction.location->path, entry.job_id, report);
    }
}

void ArchiveFetcher::evict_expired(
    std::map<std::filesystem::path, CacheState::JobIds> const &to_remove,
    FetchReport &report)
{
    // Locations in configuration order; ids within a location sorted.
    std::set<std::filesystem::path> visited;
    for (auto const &location : locations_)
    {
        auto it = to_remove.find(location.path);
        if (it == to_remove.end() || it->second.empty() ||
            !visited.insert(location.path).second)
        {
            continue;
        }
        std::vector<std::string> ids(it->second.begin(), it->second.end());
        std::sort(ids.begin(), ids.end());
        HM_LOG_INFO("Archives of jobs {} were deleted from {}.", join_ids(ids),
                    location.path.string());
        for (auto const &id : ids)
        {
            evict(location.path, id, report);
        }
    }
}

void ArchiveFetcher::evict(std::filesystem::path const &location,
                           std::string const &job_id, FetchReport &report)
{
    cache_.mark_evicted(location, job_id);
    if (cached_elsewhere(location, job_id))
    {
        HM_LOG_DEBUG("Keeping job {}: still mirrored from another directory",
                     job_id);
        return;
    }
    if (!store_->remove(job_id))
    {
        HM_LOG_WARN("{}: could not remove all documents of job {}",
                    to_string(FetchStatus::HousekeepingFailed), job_id);
    }
    report.events.push_back({job_id, ArchiveEventType::Deleted});
    ++report.deleted;
}

bool ArchiveFetcher::cached_elsewhere(std::filesystem::path const &location,
                                      std::string const &job_id) const
{
    for (auto const &other : locations_)
    {
        if (other.path != location && cache_.contains(other.path, job_id))
        {
            return true;
        }
    }
    return false;
}

void ArchiveFetcher::notify(std::vector<ArchiveEvent> const &events)
{
    if (!listener_)
    {
        return;
    }
    for (auto const &event : events)
    {
        try
        {
            listener_(event);
        }
        catch (std::exception const &ex)
        {
            HM_LOG_ERROR("Archive event listener failed on {} {}: {}",
                         to_string(event.type), event.job_id, ex.what());
        }
    }
}

} // namespace hm::engine
