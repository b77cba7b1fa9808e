#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace hm::engine
{

struct ArchiveFileStatus
{
    std::filesystem::path path;
    std::filesystem::file_time_type modification_time{};
    bool is_directory = false;
};

// Access to a directory of job archives. Implementations must be safe to call
// from the fetch thread while producers add and delete files concurrently.
class ArchiveFileSystem
{
  public:
    virtual ~ArchiveFileSystem() = default;

    // Entries of `directory` in the order the backing store yields them.
    // Sets `ec` when the directory cannot be read or does not exist.
    virtual std::vector<ArchiveFileStatus>
    list(std::filesystem::path const &directory, std::error_code &ec) const = 0;

    virtual std::optional<std::string> read(std::filesystem::path const &file,
                                            std::error_code &ec) const = 0;

    virtual bool remove(std::filesystem::path const &file,
                        std::error_code &ec) = 0;
};

class LocalArchiveFileSystem final : public ArchiveFileSystem
{
  public:
    std::vector<ArchiveFileStatus> list(std::filesystem::path const &directory,
                                        std::error_code &ec) const override;
    std::optional<std::string> read(std::filesystem::path const &file,
                                    std::error_code &ec) const override;
    bool remove(std::filesystem::path const &file,
                std::error_code &ec) override;
};

struct RefreshLocation
{
    std::filesystem::path path;
    std::shared_ptr<ArchiveFileSystem> fs;
};

struct ArchiveEntry
{
    std::string job_id;
    std::filesystem::path path;
    std::filesystem::file_time_type modification_time{};
};

// Job ids are 32 hexadecimal characters, in either case.
bool is_valid_job_id(std::string_view candidate) noexcept;

// Lists the archives of one location, skipping entries whose names are not
// job ids. Returns nullopt if the location cannot be listed; callers must not
// read that as "no archives".
std::optional<std::vector<ArchiveEntry>>
list_archives(RefreshLocation const &location);

} // namespace hm::engine
