#pragma once

#include "engine/JobStore.hpp"

#include <filesystem>
#include <memory>
#include <mutex>

namespace hm::storage
{
class Database;
}

namespace hm::engine
{

// Keeps documents in the embedded SQLite key-value table. Keys are the REST
// paths; per-job overviews live under "/overviews/<id>" so that listing them
// is a single range scan.
class KvJobStore final : public JobStore
{
  public:
    explicit KvJobStore(std::filesystem::path db_path);
    ~KvJobStore() override;

    KvJobStore(KvJobStore const &) = delete;
    KvJobStore &operator=(KvJobStore const &) = delete;

    bool is_valid() const noexcept;

    bool put(std::string const &job_id, std::string const &path,
             std::string const &json) override;
    bool remove(std::string const &job_id) override;
    bool remove_overview(std::string const &job_id) override;
    std::vector<JobOverview> list_overviews() const override;
    bool exists(std::string const &job_id) const override;
    std::optional<std::string> get(std::string const &path) const override;
    bool publish_combined_overview(std::string const &json) override;
    bool clear() override;

  private:
    // The connection and its statement cache are shared by the fetch thread
    // and readers; every call goes through this mutex.
    mutable std::mutex mutex_;
    std::unique_ptr<storage::Database> database_;
};

} // namespace hm::engine
