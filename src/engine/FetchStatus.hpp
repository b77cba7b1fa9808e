#pragma once

#include <string_view>

namespace hm::engine
{

enum class FetchStatus
{
    Ok = 0,
    // Archive location unreachable; no eviction for it this cycle.
    ListingFailed,
    // Bundle unreadable or a store write failed; rolled back, retried.
    IngestionFailed,
    // Bundle or legacy overview content invalid; handled as an ingestion
    // failure.
    MalformedArchive,
    // Rejected settings; only reported at startup.
    InvalidConfiguration,
    // Best-effort removal failed; logged only.
    HousekeepingFailed,
};

constexpr std::string_view to_string(FetchStatus status) noexcept
{
    switch (status)
    {
    case FetchStatus::Ok:
        return "ok";
    case FetchStatus::ListingFailed:
        return "listing failed";
    case FetchStatus::IngestionFailed:
        return "ingestion failed";
    case FetchStatus::MalformedArchive:
        return "malformed archive";
    case FetchStatus::InvalidConfiguration:
        return "invalid configuration";
    case FetchStatus::HousekeepingFailed:
        return "housekeeping failed";
    }
    return "unknown";
}

} // namespace hm::engine
