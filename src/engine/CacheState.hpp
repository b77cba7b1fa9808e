#pragma once

#include <filesystem>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_set>

namespace hm::engine
{

// Which job ids have been ingested from which archive directory. The fetch
// cycle is the only writer; other threads may read through the shared lock.
class CacheState
{
  public:
    using JobIds = std::unordered_set<std::string>;

    // Registers a location with an empty set. Idempotent.
    void track(std::filesystem::path const &location);

    JobIds snapshot(std::filesystem::path const &location) const;
    bool contains(std::filesystem::path const &location,
                  std::string const &job_id) const;

    void mark_ingested(std::filesystem::path const &location,
                       std::string const &job_id);
    void mark_evicted(std::filesystem::path const &location,
                      std::string const &job_id);

    // Total number of cached ids across all locations.
    std::size_t size() const;

  private:
    mutable std::shared_mutex mutex_;
    std::map<std::filesystem::path, JobIds> ingested_;
};

} // namespace hm::engine
