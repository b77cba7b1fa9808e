#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace hm::utils
{

std::filesystem::path data_root();
std::optional<std::filesystem::path> executable_path();

std::optional<std::string> read_file(std::filesystem::path const &path,
                                     std::error_code &ec);

// Writes `content` to a temporary sibling of `target` and renames it over
// the target, so readers observe either the previous file or the new one.
bool replace_file(std::filesystem::path const &target,
                  std::string_view content, std::error_code &ec);

} // namespace hm::utils
