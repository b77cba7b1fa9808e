#include "engine/JobStore.hpp"

#include "engine/ArchiveBundle.hpp"
#include "engine/FileJobStore.hpp"
#include "engine/KvJobStore.hpp"
#include "utils/Log.hpp"

namespace hm::engine
{

namespace
{

constexpr std::string_view kJobsPrefix = "/jobs/";
constexpr char const *kKvDatabaseName = "history.db";

} // namespace

bool is_safe_document_path(std::string_view path) noexcept
{
    if (path.size() < 2 || path.front() != '/')
    {
        return false;
    }
    path.remove_prefix(1);
    while (true)
    {
        auto slash = path.find('/');
        auto segment = path.substr(0, slash);
        if (segment.empty() || segment == "." || segment == ".." ||
            segment.find('\\') != std::string_view::npos ||
            segment.find('\0') != std::string_view::npos)
        {
            return false;
        }
        if (slash == std::string_view::npos)
        {
            return true;
        }
        path.remove_prefix(slash + 1);
    }
}

bool belongs_to_job(std::string_view path, std::string_view job_id) noexcept
{
    if (path == kJobsOverviewPath)
    {
        return true;
    }
    if (job_id.empty() || !path.starts_with(kJobsPrefix))
    {
        return false;
    }
    path.remove_prefix(kJobsPrefix.size());
    if (!path.starts_with(job_id))
    {
        return false;
    }
    path.remove_prefix(job_id.size());
    return path.empty() || path.front() == '/';
}

std::unique_ptr<JobStore> make_job_store(StoreBackend backend,
                                         std::filesystem::path const &root)
{
    switch (backend)
    {
    case StoreBackend::File:
    {
        auto store = std::make_unique<FileJobStore>(root);
        if (!store->is_valid())
        {
            return nullptr;
        }
        return store;
    }
    case StoreBackend::KvStore:
    {
        auto store = std::make_unique<KvJobStore>(root / kKvDatabaseName);
        if (!store->is_valid())
        {
            return nullptr;
        }
        return store;
    }
    }
    HM_LOG_ERROR("unknown store backend");
    return nullptr;
}

} // namespace hm::engine
