#pragma once

#include "engine/FetchStatus.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace hm::engine
{

// REST path of the job listing. Inside a bundle it holds that job's own
// overview; in the mirror it is the combined listing of all jobs.
inline constexpr std::string_view kJobsOverviewPath = "/jobs/overview";
// Path under which producers before the overview format change stored the
// per-job overview.
inline constexpr std::string_view kLegacyJobOverviewPath = "/joboverview";

struct ArchivedJson
{
    std::string path;
    std::string json;
};

struct DecodedBundle
{
    FetchStatus status = FetchStatus::Ok;
    std::vector<ArchivedJson> documents;
};

// Decodes a bundle of the form {"archive":[{"path":..,"json":..}, ...]}.
DecodedBundle decode_archive_bundle(std::string_view payload);

} // namespace hm::engine
