#pragma once

#include "engine/FetchStatus.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hm::engine
{

// Retained-jobs value that disables the size-limit pass.
inline constexpr int kUnlimitedRetainedJobs = -1;

enum class StoreBackend
{
    File,
    KvStore,
};

struct HistorySettings
{
    std::vector<std::filesystem::path> archive_dirs;
    std::chrono::milliseconds refresh_interval{10000};
    int retained_jobs = kUnlimitedRetainedJobs;
    bool cleanup_expired_jobs = false;
    bool cleanup_beyond_limit = true;
    std::filesystem::path web_dir;
    StoreBackend backend = StoreBackend::File;
    std::filesystem::path log_file;
};

struct SettingsResult
{
    FetchStatus status = FetchStatus::Ok;
    std::string message;
    HistorySettings settings;
};

using SettingsLookup =
    std::function<std::optional<std::string>(char const *key)>;

std::vector<std::filesystem::path> parse_archive_dirs(std::string_view raw);
std::optional<bool> parse_bool(std::string_view raw);
std::optional<StoreBackend> parse_store_backend(std::string_view raw);

// Reads HM_* keys through `lookup`; missing keys keep their defaults.
SettingsResult load_settings(SettingsLookup const &lookup,
                             HistorySettings defaults = {});

// Returns a non-Ok result describing the first rejected value.
SettingsResult validate_settings(HistorySettings settings);

bool retained_jobs_valid(int retained_jobs) noexcept;

} // namespace hm::engine
