#include "engine/LegacyOverview.hpp"

#include "engine/ArchiveSource.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <array>
#include <cstdint>

#include <yyjson.h>

namespace hm::engine
{

namespace
{

constexpr std::array<std::string_view, 11> kJobStatuses = {
    "INITIALIZING", "CREATED",  "RUNNING",    "FAILING",
    "FAILED",       "CANCELLING", "CANCELED", "FINISHED",
    "RESTARTING",   "SUSPENDED", "RECONCILING"};

struct LegacyTasks
{
    std::int64_t total = 0;
    std::int64_t created = 0;
    std::int64_t scheduled = 0;
    std::int64_t deploying = 0;
    std::int64_t running = 0;
    std::int64_t finished = 0;
    std::int64_t canceling = 0;
    std::int64_t canceled = 0;
    std::int64_t failed = 0;
};

struct LegacyJob
{
    std::string_view jid;
    std::string_view name;
    std::string_view state;
    std::int64_t start_time = 0;
    std::int64_t end_time = 0;
    std::int64_t duration = 0;
    std::int64_t last_modification = 0;
    LegacyTasks tasks;
};

bool read_count(yyjson_val *tasks, char const *key, std::int64_t &out)
{
    auto value = json::get_int64(tasks, key);
    if (!value)
    {
        HM_LOG_ERROR("legacy overview: task count '{}' missing", key);
        return false;
    }
    out = *value;
    return true;
}

bool read_tasks(yyjson_val *tasks, LegacyTasks &out)
{
    if (tasks == nullptr || !yyjson_is_obj(tasks))
    {
        HM_LOG_ERROR("legacy overview: 'tasks' object missing");
        return false;
    }
    if (!read_count(tasks, "total", out.total))
    {
        return false;
    }
    if (yyjson_obj_get(tasks, "pending") != nullptr)
    {
        // "pending" merged CREATED, SCHEDULED and DEPLOYING.
        if (!read_count(tasks, "pending", out.scheduled))
        {
            return false;
        }
        out.created = 0;
        out.deploying = 0;
    }
    else if (!read_count(tasks, "created", out.created) ||
             !read_count(tasks, "scheduled", out.scheduled) ||
             !read_count(tasks, "deploying", out.deploying))
    {
        return false;
    }
    return read_count(tasks, "running", out.running) &&
           read_count(tasks, "finished", out.finished) &&
           read_count(tasks, "canceling", out.canceling) &&
           read_count(tasks, "canceled", out.canceled) &&
           read_count(tasks, "failed", out.failed);
}

bool read_job(yyjson_val *job, LegacyJob &out)
{
    if (job == nullptr || !yyjson_is_obj(job))
    {
        HM_LOG_ERROR("legacy overview: job entry is not an object");
        return false;
    }
    auto jid = json::get_string(job, "jid");
    auto name = json::get_string(job, "name");
    auto state = json::get_string(job, "state");
    auto start_time = json::get_int64(job, "start-time");
    auto end_time = json::get_int64(job, "end-time");
    auto duration = json::get_int64(job, "duration");
    auto last_modification = json::get_int64(job, "last-modification");
    if (!jid || !name || !state || !start_time || !end_time || !duration ||
        !last_modification)
    {
        HM_LOG_ERROR("legacy overview: job fields missing or mistyped");
        return false;
    }
    if (!is_valid_job_id(*jid))
    {
        HM_LOG_ERROR("legacy overview: invalid job id '{}'", *jid);
        return false;
    }
    if (!is_known_job_status(*state))
    {
        HM_LOG_ERROR("legacy overview: unknown job state '{}'", *state);
        return false;
    }
    out.jid = *jid;
    out.name = *name;
    out.state = *state;
    out.start_time = *start_time;
    out.end_time = *end_time;
    out.duration = *duration;
    out.last_modification = *last_modification;
    return read_tasks(yyjson_obj_get(job, "tasks"), out.tasks);
}

std::optional<std::string> write_current_overview(LegacyJob const &job)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return std::nullopt;
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    auto *jobs = yyjson_mut_arr(native);
    yyjson_mut_obj_add_val(native, root, "jobs", jobs);

    auto *entry = yyjson_mut_arr_add_obj(native, jobs);
    yyjson_mut_obj_add_strncpy(native, entry, "jid", job.jid.data(),
                               job.jid.size());
    yyjson_mut_obj_add_strncpy(native, entry, "name", job.name.data(),
                               job.name.size());
    yyjson_mut_obj_add_sint(native, entry, "start-time", job.start_time);
    yyjson_mut_obj_add_sint(native, entry, "end-time", job.end_time);
    yyjson_mut_obj_add_sint(native, entry, "duration", job.duration);
    yyjson_mut_obj_add_strncpy(native, entry, "state", job.state.data(),
                               job.state.size());
    yyjson_mut_obj_add_sint(native, entry, "last-modification",
                            job.last_modification);

    auto *tasks = yyjson_mut_obj(native);
    auto const &t = job.tasks;
    yyjson_mut_obj_add_sint(native, tasks, "total", t.total);
    yyjson_mut_obj_add_sint(native, tasks, "created", t.created);
    yyjson_mut_obj_add_sint(native, tasks, "scheduled", t.scheduled);
    yyjson_mut_obj_add_sint(native, tasks, "deploying", t.deploying);
    yyjson_mut_obj_add_sint(native, tasks, "running", t.running);
    yyjson_mut_obj_add_sint(native, tasks, "finished", t.finished);
    yyjson_mut_obj_add_sint(native, tasks, "canceling", t.canceling);
    yyjson_mut_obj_add_sint(native, tasks, "canceled", t.canceled);
    yyjson_mut_obj_add_sint(native, tasks, "failed", t.failed);
    yyjson_mut_obj_add_sint(native, tasks, "reconciling", 0);
    yyjson_mut_obj_add_sint(native, tasks, "initializing", 0);
    yyjson_mut_obj_add_val(native, entry, "tasks", tasks);
    yyjson_mut_obj_add_sint(native, entry, "pending-operators", 0);
    return doc.write();
}

} // namespace

bool is_known_job_status(std::string_view state) noexcept
{
    for (auto const known : kJobStatuses)
    {
        if (known == state)
        {
            return true;
        }
    }
    return false;
}

std::optional<std::string> convert_legacy_overview(std::string_view legacy)
{
    auto doc = json::Document::parse(legacy);
    auto *root = doc.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        HM_LOG_ERROR("legacy overview is not a JSON object");
        return std::nullopt;
    }
    auto *finished = yyjson_obj_get(root, "finished");
    if (finished == nullptr || !yyjson_is_arr(finished) ||
        yyjson_arr_size(finished) == 0)
    {
        HM_LOG_ERROR("legacy overview has no finished job");
        return std::nullopt;
    }
    LegacyJob job;
    if (!read_job(yyjson_arr_get_first(finished), job))
    {
        return std::nullopt;
    }
    // job's string_views point into `doc`, which outlives the write below.
    return write_current_overview(job);
}

} // namespace hm::engine
