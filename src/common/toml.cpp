#include "warden/common/toml.hpp"

#include "warden/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace warden::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  bool escaped = false;
  std::string output;
  output.reserve(line.size());

  for (const char ch : line) {
    if (in_quotes && !escaped && ch == '\\') {
      escaped = true;
      output.push_back(ch);
      continue;
    }
    if (ch == '"' && !escaped) {
      in_quotes = !in_quotes;
    }
    escaped = false;
    if (!in_quotes && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

// Depth of unclosed '[' outside strings, used to join multi-line arrays.
int bracket_balance(const std::string &text) {
  int depth = 0;
  bool in_quotes = false;
  bool escaped = false;
  for (const char ch : text) {
    if (in_quotes) {
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_quotes = false;
      }
      continue;
    }
    if (ch == '"') {
      in_quotes = true;
    } else if (ch == '[') {
      ++depth;
    } else if (ch == ']') {
      --depth;
    }
  }
  return depth;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  bool in_quotes = false;
  bool escaped = false;

  for (const char ch : array_value) {
    if (in_quotes) {
      current.push_back(ch);
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_quotes = false;
      }
      continue;
    }
    if (ch == '"') {
      in_quotes = true;
      current.push_back(ch);
      continue;
    }
    if (ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  bool escaped = false;
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
      } else {
        out.push_back(ch);
      }
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  std::string normalized;
  for (const char ch : trim(it->second)) {
    if (ch != '_') {
      normalized.push_back(ch);
    }
  }
  std::uint64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }

  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure(ErrorCode::InvalidArgument,
                                             "Invalid empty section at line " +
                                                 std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure(ErrorCode::InvalidArgument,
                                           "Invalid key/value at line " +
                                               std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure(ErrorCode::InvalidArgument,
                                           "Missing key at line " + std::to_string(line_number));
    }

    const std::size_t start_line = line_number;
    while (bracket_balance(value) > 0) {
      if (!std::getline(stream, line)) {
        return Result<TomlDocument>::failure(ErrorCode::InvalidArgument,
                                             "Unterminated array starting at line " +
                                                 std::to_string(start_line));
      }
      ++line_number;
      value += " " + trim(strip_comment(line));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = trim(value);
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace warden::common
