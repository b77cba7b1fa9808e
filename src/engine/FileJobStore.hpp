#pragma once

#include "engine/JobStore.hpp"

#include <filesystem>

namespace hm::engine
{

// Mirrors documents as files under a web root:
//   <root>/jobs/<path>.json      job documents, e.g. jobs/<id>/vertices.json
//   <root>/overviews/<id>.json   per-job overviews
//   <root>/jobs/overview.json    combined listing
class FileJobStore final : public JobStore
{
  public:
    explicit FileJobStore(std::filesystem::path root);

    bool is_valid() const noexcept { return valid_; }
    std::filesystem::path const &root() const noexcept { return root_; }

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
    bool ensure_layout();
    std::filesystem::path document_file(std::string const &path) const;
    std::filesystem::path overview_file(std::string const &job_id) const;

    std::filesystem::path root_;
    std::filesystem::path jobs_dir_;
    std::filesystem::path overviews_dir_;
    bool valid_ = false;
};

} // namespace hm::engine
