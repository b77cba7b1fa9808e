#include "engine/Settings.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <string>
#include <system_error>

namespace hm::engine
{

namespace
{

std::string_view trim_whitespace(std::string_view value)
{
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
    {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string to_lower(std::string_view value)
{
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return lowered;
}

template <typename T> std::optional<T> parse_number(std::string_view raw)
{
    auto trimmed = trim_whitespace(raw);
    if (trimmed.empty())
    {
        return std::nullopt;
    }
    T value{};
    auto [ptr, ec] =
        std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (ec != std::errc() || ptr != trimmed.data() + trimmed.size())
    {
        return std::nullopt;
    }
    return value;
}

SettingsResult rejected(std::string message)
{
    SettingsResult result;
    result.status = FetchStatus::InvalidConfiguration;
    result.message = std::move(message);
    return result;
}

} // namespace

std::vector<std::filesystem::path> parse_archive_dirs(std::string_view raw)
{
    std::vector<std::filesystem::path> result;
    while (!raw.empty())
    {
        auto comma = raw.find(',');
        auto item = trim_whitespace(raw.substr(0, comma));
        if (!item.empty())
        {
            result.emplace_back(std::string(item));
        }
        if (comma == std::string_view::npos)
        {
            break;
        }
        raw.remove_prefix(comma + 1);
    }
    return result;
}

std::optional<bool> parse_bool(std::string_view raw)
{
    auto value = to_lower(trim_whitespace(raw));
    if (value == "1" || value == "true" || value == "yes" || value == "on")
    {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off")
    {
        return false;
    }
    return std::nullopt;
}

std::optional<StoreBackend> parse_store_backend(std::string_view raw)
{
    auto value = to_lower(trim_whitespace(raw));
    if (value == "file")
    {
        return StoreBackend::File;
    }
    if (value == "kvstore")
    {
        return StoreBackend::KvStore;
    }
    return std::nullopt;
}

bool retained_jobs_valid(int retained_jobs) noexcept
{
    return retained_jobs == kUnlimitedRetainedJobs || retained_jobs > 0;
}

SettingsResult load_settings(SettingsLookup const &lookup,
                             HistorySettings defaults)
{
    SettingsResult result;
    result.settings = std::move(defaults);
    auto &settings = result.settings;

    if (auto raw = lookup("HM_ARCHIVE_DIRS"))
    {
        settings.archive_dirs = parse_archive_dirs(*raw);
    }
    if (auto raw = lookup("HM_REFRESH_INTERVAL_MS"))
    {
        auto value = parse_number<long long>(*raw);
        if (!value)
        {
            return rejected(
                std::format("HM_REFRESH_INTERVAL_MS is not a number: '{}'", *raw));
        }
        settings.refresh_interval = std::chrono::milliseconds(*value);
    }
    if (auto raw = lookup("HM_RETAINED_JOBS"))
    {
        auto value = parse_number<int>(*raw);
        if (!value)
        {
            return rejected(
                std::format("HM_RETAINED_JOBS is not a number: '{}'", *raw));
        }
        settings.retained_jobs = *value;
    }
    if (auto raw = lookup("HM_CLEANUP_EXPIRED_JOBS"))
    {
        auto value = parse_bool(*raw);
        if (!value)
        {
            return rejected(std::format(
                "HM_CLEANUP_EXPIRED_JOBS is not a boolean: '{}'", *raw));
        }
        settings.cleanup_expired_jobs = *value;
    }
    if (auto raw = lookup("HM_CLEANUP_BEYOND_LIMIT"))
    {
        auto value = parse_bool(*raw);
        if (!value)
        {
            return rejected(std::format(
                "HM_CLEANUP_BEYOND_LIMIT is not a boolean: '{}'", *raw));
        }
        settings.cleanup_beyond_limit = *value;
    }
    if (auto raw = lookup("HM_WEB_DIR"); raw && !trim_whitespace(*raw).empty())
    {
        settings.web_dir = std::string(trim_whitespace(*raw));
    }
    if (auto raw = lookup("HM_STORE_BACKEND"))
    {
        auto value = parse_store_backend(*raw);
        if (!value)
        {
            return rejected(std::format(
                "HM_STORE_BACKEND must be 'file' or 'kvstore', got '{}'", *raw));
        }
        settings.backend = *value;
    }
    if (auto raw = lookup("HM_LOG_FILE"); raw && !trim_whitespace(*raw).empty())
    {
        settings.log_file = std::string(trim_whitespace(*raw));
    }
    return result;
}

SettingsResult validate_settings(HistorySettings settings)
{
    if (settings.archive_dirs.empty())
    {
        return rejected("no archive directories configured (HM_ARCHIVE_DIRS)");
    }
    if (!retained_jobs_valid(settings.retained_jobs))
    {
        return rejected(std::format(
            "retained jobs must be positive or {} (unlimited), got {}",
            kUnlimitedRetainedJobs, settings.retained_jobs));
    }
    if (settings.refresh_interval.count() <= 0)
    {
        return rejected(std::format("refresh interval must be positive, got {} ms",
                                    settings.refresh_interval.count()));
    }
    if (settings.web_dir.empty())
    {
        return rejected("no local storage root configured (HM_WEB_DIR)");
    }
    SettingsResult result;
    result.settings = std::move(settings);
    return result;
}

} // namespace hm::engine
