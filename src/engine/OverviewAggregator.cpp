#include "engine/OverviewAggregator.hpp"

#include "engine/JobStore.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <yyjson.h>

namespace hm::engine
{

OverviewAggregator::OverviewAggregator(JobStore &store) : store_(store)
{
}

std::size_t OverviewAggregator::rebuild()
{
    json::MutableDocument combined;
    if (!combined.is_valid())
    {
        HM_LOG_ERROR("Failed to update job overview: out of memory");
        return 0;
    }
    auto *native = combined.doc();
    auto *root = yyjson_mut_obj(native);
    combined.set_root(root);
    auto *all_jobs = yyjson_mut_arr(native);
    yyjson_mut_obj_add_val(native, root, "jobs", all_jobs);

    std::size_t job_count = 0;
    for (auto const &overview : store_.list_overviews())
    {
        auto doc = json::Document::parse(overview.json);
        auto *jobs = yyjson_is_obj(doc.root())
                         ? yyjson_obj_get(doc.root(), "jobs")
                         : nullptr;
        if (jobs == nullptr || !yyjson_is_arr(jobs))
        {
            HM_LOG_ERROR("Skipping corrupt overview of job {}",
                         overview.job_id);
            continue;
        }
        size_t idx, limit;
        yyjson_val *job = nullptr;
        yyjson_arr_foreach(jobs, idx, limit, job)
        {
            auto *copy = yyjson_val_mut_copy(native, job);
            if (copy == nullptr || !yyjson_mut_arr_append(all_jobs, copy))
            {
                HM_LOG_ERROR("Failed to copy overview of job {}",
                             overview.job_id);
                continue;
            }
            ++job_count;
        }
    }

    auto payload = combined.write();
    if (!payload)
    {
        HM_LOG_ERROR("Failed to serialize job overview");
        return 0;
    }
    if (!store_.publish_combined_overview(*payload))
    {
        return 0;
    }
    return job_count;
}

} // namespace hm::engine
