#include "engine/ArchiveSource.hpp"

#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <cctype>
#include <filesystem>
#include <system_error>

namespace hm::engine
{

namespace
{

constexpr std::size_t kJobIdLength = 32;

} // namespace

std::vector<ArchiveFileStatus>
LocalArchiveFileSystem::list(std::filesystem::path const &directory,
                             std::error_code &ec) const
{
    std::vector<ArchiveFileStatus> result;
    ec.clear();
    if (!std::filesystem::is_directory(directory, ec))
    {
        if (!ec)
        {
            ec = std::make_error_code(std::errc::not_a_directory);
        }
        return result;
    }
    std::filesystem::directory_iterator it(directory, ec);
    if (ec)
    {
        return result;
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec))
    {
        if (ec)
        {
            result.clear();
            return result;
        }
        ArchiveFileStatus status;
        status.path = it->path();
        std::error_code entry_ec;
        status.is_directory = it->is_directory(entry_ec);
        if (entry_ec)
        {
            // The archive may have been deleted between iteration steps.
            continue;
        }
        status.modification_time = it->last_write_time(entry_ec);
        if (entry_ec)
        {
            continue;
        }
        result.push_back(std::move(status));
    }
    if (ec)
    {
        result.clear();
    }
    return result;
}

std::optional<std::string>
LocalArchiveFileSystem::read(std::filesystem::path const &file,
                             std::error_code &ec) const
{
    return utils::read_file(file, ec);
}

bool LocalArchiveFileSystem::remove(std::filesystem::path const &file,
                                    std::error_code &ec)
{
    ec.clear();
    return std::filesystem::remove(file, ec);
}

bool is_valid_job_id(std::string_view candidate) noexcept
{
    if (candidate.size() != kJobIdLength)
    {
        return false;
    }
    for (char ch : candidate)
    {
        if (!std::isxdigit(static_cast<unsigned char>(ch)))
        {
            return false;
        }
    }
    return true;
}

std::optional<std::vector<ArchiveEntry>>
list_archives(RefreshLocation const &location)
{
    if (!location.fs)
    {
        HM_LOG_ERROR("no filesystem configured for archive location {}",
                     location.path.string());
        return std::nullopt;
    }
    std::error_code ec;
    auto statuses = location.fs->list(location.path, ec);
    if (ec)
    {
        HM_LOG_ERROR("Failed to access job archive location for path {}: {}",
                     location.path.string(), ec.message());
        return std::nullopt;
    }
    std::vector<ArchiveEntry> entries;
    entries.reserve(statuses.size());
    for (auto &status : statuses)
    {
        auto name = status.path.filename().string();
        if (status.is_directory || !is_valid_job_id(name))
        {
            HM_LOG_DEBUG("{} in {} is not a valid job archive; ignoring", name,
                        location.path.string());
            continue;
        }
        entries.push_back(ArchiveEntry{std::move(name), std::move(status.path),
                                       status.modification_time});
    }
    return entries;
}

} // namespace hm::engine
