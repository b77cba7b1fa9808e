#include "engine/FileJobStore.hpp"

#include "engine/ArchiveBundle.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <system_error>

namespace hm::engine
{

namespace
{

constexpr char const *kJsonFileEnding = ".json";

} // namespace

FileJobStore::FileJobStore(std::filesystem::path root)
    : root_(std::move(root)), jobs_dir_(root_ / "jobs"),
      overviews_dir_(root_ / "overviews")
{
    valid_ = ensure_layout();
}

bool FileJobStore::ensure_layout()
{
    for (auto const *dir : {&jobs_dir_, &overviews_dir_})
    {
        std::error_code ec;
        std::filesystem::create_directories(*dir, ec);
        if (ec)
        {
            HM_LOG_ERROR("Failed to create {}: {}", dir->string(),
                         ec.message());
            return false;
        }
    }
    return true;
}

std::filesystem::path
FileJobStore::document_file(std::string const &path) const
{
    // path is "/jobs/...", which lands inside jobs_dir_.
    return root_ / (path.substr(1) + kJsonFileEnding);
}

std::filesystem::path
FileJobStore::overview_file(std::string const &job_id) const
{
    return overviews_dir_ / (job_id + kJsonFileEnding);
}

bool FileJobStore::put(std::string const &job_id, std::string const &path,
                       std::string const &json)
{
    if (!is_safe_document_path(path) || !belongs_to_job(path, job_id))
    {
        HM_LOG_ERROR("rejecting document {} for job {}", path, job_id);
        return false;
    }
    auto target =
        path == kJobsOverviewPath ? overview_file(job_id) : document_file(path);
    std::error_code ec;
    if (!utils::replace_file(target, json, ec))
    {
        HM_LOG_ERROR("Failed to write {}: {}", target.string(), ec.message());
        return false;
    }
    return true;
}

bool FileJobStore::remove(std::string const &job_id)
{
    bool complete = remove_overview(job_id);

    std::error_code ec;
    std::filesystem::remove_all(jobs_dir_ / job_id, ec);
    if (ec)
    {
        HM_LOG_WARN("Could not clean up job directory for {}: {}", job_id,
                    ec.message());
        complete = false;
    }

    ec.clear();
    std::filesystem::remove(document_file("/jobs/" + job_id), ec);
    if (ec)
    {
        HM_LOG_WARN("Could not delete job file for {}: {}", job_id,
                    ec.message());
        complete = false;
    }
    return complete;
}

bool FileJobStore::remove_overview(std::string const &job_id)
{
    std::error_code ec;
    std::filesystem::remove(overview_file(job_id), ec);
    if (ec)
    {
        HM_LOG_WARN("Could not delete overview of {}: {}", job_id,
                    ec.message());
        return false;
    }
    return true;
}

std::vector<JobOverview> FileJobStore::list_overviews() const
{
    std::vector<JobOverview> result;
    std::error_code ec;
    std::filesystem::directory_iterator it(overviews_dir_, ec);
    if (ec)
    {
        HM_LOG_ERROR("Failed to list overviews in {}: {}",
                     overviews_dir_.string(), ec.message());
        return result;
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec))
    {
        auto const &file = it->path();
        std::error_code entry_ec;
        if (file.extension() != kJsonFileEnding ||
            !it->is_regular_file(entry_ec))
        {
            continue;
        }
        auto content = utils::read_file(file, entry_ec);
        if (!content)
        {
            // Removed concurrently or unreadable; the next rebuild catches up.
            HM_LOG_WARN("Could not read overview {}: {}", file.string(),
                        entry_ec.message());
            continue;
        }
        result.push_back(JobOverview{file.stem().string(), std::move(*content)});
    }
    if (ec)
    {
        HM_LOG_ERROR("Listing overviews in {} stopped early: {}",
                     overviews_dir_.string(), ec.message());
    }
    return result;
}

bool FileJobStore::exists(std::string const &job_id) const
{
    std::error_code ec;
    return std::filesystem::exists(overview_file(job_id), ec) ||
           std::filesystem::exists(jobs_dir_ / job_id, ec) ||
           std::filesystem::exists(document_file("/jobs/" + job_id), ec);
}

std::optional<std::string> FileJobStore::get(std::string const &path) const
{
    if (!is_safe_document_path(path))
    {
        return std::nullopt;
    }
    std::error_code ec;
    return utils::read_file(document_file(path), ec);
}

bool FileJobStore::publish_combined_overview(std::string const &json)
{
    auto target = document_file(std::string(kJobsOverviewPath));
    std::error_code ec;
    if (!utils::replace_file(target, json, ec))
    {
        HM_LOG_ERROR("Failed to update job overview {}: {}", target.string(),
                     ec.message());
        return false;
    }
    return true;
}

bool FileJobStore::clear()
{
    bool complete = true;
    for (auto const *dir : {&jobs_dir_, &overviews_dir_})
    {
        std::error_code ec;
        std::filesystem::remove_all(*dir, ec);
        if (ec)
        {
            HM_LOG_WARN("Could not clear {}: {}", dir->string(), ec.message());
            complete = false;
        }
    }
    return ensure_layout() && complete;
}

} // namespace hm::engine
