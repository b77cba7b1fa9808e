#include "engine/KvJobStore.hpp"

#include "engine/ArchiveBundle.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

namespace hm::engine
{

namespace
{

constexpr std::string_view kOverviewKeyPrefix = "/overviews/";
// Owner column value of the combined listing; never a valid job id.
constexpr char const *kCombinedOwner = "";

std::string overview_key(std::string const &job_id)
{
    return std::string(kOverviewKeyPrefix) + job_id;
}

} // namespace

KvJobStore::KvJobStore(std::filesystem::path db_path)
    : database_(std::make_unique<storage::Database>(std::move(db_path)))
{
    if (!database_->is_valid())
    {
        HM_LOG_ERROR("job store database {} is unavailable",
                     database_->path().string());
    }
}

KvJobStore::~KvJobStore() = default;

bool KvJobStore::is_valid() const noexcept
{
    return database_ && database_->is_valid();
}

bool KvJobStore::put(std::string const &job_id, std::string const &path,
                     std::string const &json)
{
    if (!is_safe_document_path(path) || !belongs_to_job(path, job_id))
    {
        HM_LOG_ERROR("rejecting document {} for job {}", path, job_id);
        return false;
    }
    auto key = path == kJobsOverviewPath ? overview_key(job_id) : path;
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->put_document(key, job_id, json);
}

bool KvJobStore::remove(std::string const &job_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!database_->delete_job_documents(job_id))
    {
        HM_LOG_WARN("Could not delete documents of job {}", job_id);
        return false;
    }
    return true;
}

bool KvJobStore::remove_overview(std::string const &job_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!database_->delete_document(overview_key(job_id)))
    {
        HM_LOG_WARN("Could not delete overview of job {}", job_id);
        return false;
    }
    return true;
}

std::vector<JobOverview> KvJobStore::list_overviews() const
{
    std::vector<storage::StoredDocument> rows;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rows = database_->scan_prefix(std::string(kOverviewKeyPrefix));
    }
    std::vector<JobOverview> result;
    result.reserve(rows.size());
    for (auto &row : rows)
    {
        result.push_back(JobOverview{std::move(row.job_id), std::move(row.value)});
    }
    return result;
}

bool KvJobStore::exists(std::string const &job_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->has_job_documents(job_id).value_or(false);
}

std::optional<std::string> KvJobStore::get(std::string const &path) const
{
    if (!is_safe_document_path(path))
    {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->get_document(path);
}

bool KvJobStore::publish_combined_overview(std::string const &json)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!database_->put_document(std::string(kJobsOverviewPath), kCombinedOwner,
                                 json))
    {
        HM_LOG_ERROR("Failed to update job overview");
        return false;
    }
    return true;
}

bool KvJobStore::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return database_->delete_all_documents();
}

} // namespace hm::engine
