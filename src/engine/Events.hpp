#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace hm::engine
{

enum class ArchiveEventType
{
    Created,
    Deleted,
};

constexpr std::string_view to_string(ArchiveEventType type) noexcept
{
    return type == ArchiveEventType::Created ? "CREATED" : "DELETED";
}

struct ArchiveEvent
{
    std::string job_id;
    ArchiveEventType type = ArchiveEventType::Created;

    bool operator==(ArchiveEvent const &) const = default;
};

// Invoked synchronously on the fetch thread, once per event, in emission
// order. Listeners that do real work must hand it off.
using ArchiveEventListener = std::function<void(ArchiveEvent const &)>;

} // namespace hm::engine
