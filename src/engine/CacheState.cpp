#include "engine/CacheState.hpp"

#include <mutex>

namespace hm::engine
{

void CacheState::track(std::filesystem::path const &location)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ingested_.try_emplace(location);
}

CacheState::JobIds
CacheState::snapshot(std::filesystem::path const &location) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = ingested_.find(location);
    if (it == ingested_.end())
    {
        return {};
    }
    return it->second;
}

bool CacheState::contains(std::filesystem::path const &location,
                          std::string const &job_id) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = ingested_.find(location);
    return it != ingested_.end() && it->second.contains(job_id);
}

void CacheState::mark_ingested(std::filesystem::path const &location,
                               std::string const &job_id)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ingested_[location].insert(job_id);
}

void CacheState::mark_evicted(std::filesystem::path const &location,
                              std::string const &job_id)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = ingested_.find(location);
    if (it != ingested_.end())
    {
        it->second.erase(job_id);
    }
}

std::size_t CacheState::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::size_t total = 0;
    for (auto const &[location, ids] : ingested_)
    {
        total += ids.size();
    }
    return total;
}

} // namespace hm::engine
