#include "utils/Log.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <system_error>

namespace hm::log
{

namespace
{

std::mutex &sink_mutex()
{
    static std::mutex s_mutex;
    return s_mutex;
}

struct FileSink
{
    std::filesystem::path path;
    std::ofstream stream;
};

FileSink &file_sink()
{
    static FileSink s_sink;
    return s_sink;
}

} // namespace

void set_log_file(std::filesystem::path path)
{
    std::lock_guard<std::mutex> lk(sink_mutex());
    auto &sink = file_sink();
    if (sink.stream.is_open())
    {
        sink.stream.close();
    }
    sink.path = std::move(path);
    if (sink.path.empty())
    {
        return;
    }
    std::error_code ec;
    if (auto parent = sink.path.parent_path(); !parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
    }
    sink.stream.open(sink.path, std::ios::app | std::ios::out);
}

void append_log_line_to_file(std::string const &line)
{
    std::lock_guard<std::mutex> lk(sink_mutex());
    auto &sink = file_sink();
    if (!sink.stream.is_open())
    {
        return;
    }
    sink.stream << line << '\n';
    sink.stream.flush();
}

} // namespace hm::log
