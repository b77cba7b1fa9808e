#pragma once

#include "engine/Settings.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hm::engine
{

struct JobOverview
{
    std::string job_id;
    std::string json;
};

// Local mirror of archived job documents, addressed by REST path. The fetch
// cycle is the single writer; readers (the HTTP layer) may call get() at any
// time and see every document either absent, fully old or fully new.
class JobStore
{
  public:
    virtual ~JobStore() = default;

    // Stores one document of a job. The per-job overview arrives under
    // kJobsOverviewPath and is kept apart from the combined listing.
    virtual bool put(std::string const &job_id, std::string const &path,
                     std::string const &json) = 0;

    // Removes every document of the job. Returns false if some part could not
    // be removed; the failure is already logged.
    virtual bool remove(std::string const &job_id) = 0;
    virtual bool remove_overview(std::string const &job_id) = 0;

    virtual std::vector<JobOverview> list_overviews() const = 0;
    virtual bool exists(std::string const &job_id) const = 0;

    // Read access by REST path; kJobsOverviewPath yields the combined
    // listing.
    virtual std::optional<std::string> get(std::string const &path) const = 0;

    // Replaces the combined listing in a single step.
    virtual bool publish_combined_overview(std::string const &json) = 0;

    // Drops every stored document.
    virtual bool clear() = 0;
};

// Accepts absolute paths without empty, "." or ".." segments, so a document
// path can never escape the job's namespace in the mirror.
bool is_safe_document_path(std::string_view path) noexcept;

// True for the per-job overview path, "/jobs/<job_id>" and anything below
// "/jobs/<job_id>/". Only such documents can be removed with the job.
bool belongs_to_job(std::string_view path, std::string_view job_id) noexcept;

std::unique_ptr<JobStore> make_job_store(StoreBackend backend,
                                         std::filesystem::path const &root);

} // namespace hm::engine
