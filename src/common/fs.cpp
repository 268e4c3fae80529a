#include "warden/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace warden::common {

std::string trim(const std::string_view input) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto first = std::find_if_not(input.begin(), input.end(), is_space);
  auto last = std::find_if_not(input.rbegin(), input.rend(), is_space).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string_view value, const std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

bool ends_with(const std::string_view value, const std::string_view suffix) {
  return value.size() >= suffix.size() &&
         value.substr(value.size() - suffix.size()) == suffix;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string join(const std::vector<std::string> &parts, const std::string_view separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out.append(separator);
    }
    out += parts[i];
  }
  return out;
}

std::vector<std::string> split(const std::string_view value, const char delimiter) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    const auto pos = value.find(delimiter, start);
    if (pos == std::string_view::npos) {
      out.emplace_back(value.substr(start));
      break;
    }
    out.emplace_back(value.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure(ErrorCode::NotFound, "HOME is not set");
}

std::string expand_path(std::string value) {
  if (value.empty() || value[0] != '~') {
    return value;
  }
  if (value.size() > 1 && value[1] != '/') {
    return value;
  }
  if (auto home = home_dir(); home.ok()) {
    value.replace(0, 1, home.value().string());
  }
  return value;
}

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  auto c_it = candidate.begin();
  auto p_it = parent.begin();

  for (; p_it != parent.end(); ++p_it, ++c_it) {
    if (c_it == candidate.end() || *c_it != *p_it) {
      return false;
    }
  }

  return true;
}

} // namespace warden::common
