#pragma once

#include "warden/common/result.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace warden::common {

[[nodiscard]] std::string trim(std::string_view input);
[[nodiscard]] bool starts_with(std::string_view value, std::string_view prefix);
[[nodiscard]] bool ends_with(std::string_view value, std::string_view suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, std::string_view separator);
[[nodiscard]] std::vector<std::string> split(std::string_view value, char delimiter);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);
/// Component-wise prefix test; both paths are expected to be normalized.
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

} // namespace warden::common
