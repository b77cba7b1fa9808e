#include "utils/FS.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#endif

namespace hm::utils
{

namespace
{
std::optional<std::filesystem::path> ensure_directory(
    std::filesystem::path const &candidate)
{
    std::error_code ec;
    std::filesystem::create_directories(candidate, ec);
    if (!ec || std::filesystem::exists(candidate))
    {
        return candidate;
    }
    return std::nullopt;
}

std::filesystem::path fallback_root()
{
    if (auto exe = executable_path(); exe && !exe->filename().empty())
    {
        return exe->parent_path();
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
}

std::filesystem::path temporary_sibling(std::filesystem::path const &target)
{
    static std::atomic<unsigned long long> s_counter{0};
    auto name = target.filename().string();
    name += ".tmp.";
    name += std::to_string(::getpid());
    name += '.';
    name += std::to_string(s_counter.fetch_add(1, std::memory_order_relaxed));
    return target.parent_path() / name;
}
} // namespace

std::optional<std::filesystem::path> executable_path()
{
#if defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    if (size == 0)
    {
        return std::nullopt;
    }
    std::vector<char> buffer(size);
    if (_NSGetExecutablePath(buffer.data(), &size) != 0)
    {
        return std::nullopt;
    }
    return std::filesystem::path(buffer.data());
#else
    std::vector<char> buffer(4096);
    while (true)
    {
        ssize_t length =
            readlink("/proc/self/exe", buffer.data(), buffer.size());
        if (length == -1)
        {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(length) < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        buffer.resize(buffer.size() * 2);
    }
#endif
}

std::filesystem::path data_root()
{
    auto fallback = fallback_root();
    fallback /= "data";
    if (auto ensured = ensure_directory(fallback))
    {
        return *ensured;
    }
    return fallback;
}

std::optional<std::string> read_file(std::filesystem::path const &path,
                                     std::error_code &ec)
{
    ec.clear();
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return std::nullopt;
    }
    std::string content{std::istreambuf_iterator<char>(input),
                        std::istreambuf_iterator<char>()};
    if (input.bad())
    {
        ec = std::make_error_code(std::errc::io_error);
        return std::nullopt;
    }
    return content;
}

bool replace_file(std::filesystem::path const &target,
                  std::string_view content, std::error_code &ec)
{
    ec.clear();
    if (auto parent = target.parent_path(); !parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            return false;
        }
    }
    auto temp = temporary_sibling(target);
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output)
        {
            ec = std::make_error_code(std::errc::io_error);
            return false;
        }
        output.write(content.data(),
                     static_cast<std::streamsize>(content.size()));
        output.flush();
        if (!output)
        {
            ec = std::make_error_code(std::errc::io_error);
            std::error_code remove_ec;
            std::filesystem::remove(temp, remove_ec);
            return false;
        }
    }
    std::filesystem::rename(temp, target, ec);
    if (ec)
    {
        std::error_code remove_ec;
        std::filesystem::remove(temp, remove_ec);
        return false;
    }
    return true;
}

} // namespace hm::utils
