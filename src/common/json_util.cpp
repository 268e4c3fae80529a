#include "warden/common/json_util.hpp"

#include "warden/common/fs.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace warden::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool parse_hex4(const std::string &raw, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    out <<= 4U;
    if (ch >= '0' && ch <= '9') {
      out |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      out |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      out |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

// Raw scalar token (number, true, false, null) starting at pos.
std::size_t scalar_end(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char code = raw[++i];
    switch (code) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      std::uint32_t cp = 0;
      if (!parse_hex4(raw, i + 1, cp)) {
        out.push_back(code);
        break;
      }
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        std::uint32_t low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10U) + (low - 0xDC00);
          i += 6;
        }
      }
      if (cp >= 0xD800 && cp <= 0xDFFF) {
        cp = 0xFFFD;
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(code);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, const std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, const std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = json_find_string_end(json, i);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      i = end;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

Result<JsonFlatMap> json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  const std::string text = trim(json);
  if (text.size() < 2 || text.front() != '{' || text.back() != '}') {
    return Result<JsonFlatMap>::failure(ErrorCode::InvalidArgument, "expected a JSON object");
  }

  std::size_t pos = 1;
  while (true) {
    pos = json_skip_ws(text, pos);
    if (pos >= text.size()) {
      return Result<JsonFlatMap>::failure(ErrorCode::InvalidArgument, "unterminated JSON object");
    }
    if (text[pos] == '}') {
      break;
    }
    if (text[pos] == ',') {
      ++pos;
      continue;
    }
    if (text[pos] != '"') {
      return Result<JsonFlatMap>::failure(ErrorCode::InvalidArgument,
                                          "expected a quoted key in JSON object");
    }
    const auto key_end = json_find_string_end(text, pos);
    if (key_end == std::string::npos) {
      return Result<JsonFlatMap>::failure(ErrorCode::InvalidArgument, "unterminated JSON key");
    }
    const std::string key = json_unescape(text.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(text, key_end + 1);
    if (pos >= text.size() || text[pos] != ':') {
      return Result<JsonFlatMap>::failure(ErrorCode::InvalidArgument,
                                          "expected ':' after key " + key);
    }
    pos = json_skip_ws(text, pos + 1);
    if (pos >= text.size()) {
      return Result<JsonFlatMap>::failure(ErrorCode::InvalidArgument,
                                          "missing value for key " + key);
    }

    if (text[pos] == '"') {
      const auto val_end = json_find_string_end(text, pos);
      if (val_end == std::string::npos) {
        return Result<JsonFlatMap>::failure(ErrorCode::InvalidArgument,
                                            "unterminated string for key " + key);
      }
      result[key] = json_unescape(text.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (text[pos] == '{' || text[pos] == '[') {
      const char open = text[pos];
      const char close = (open == '{') ? '}' : ']';
      const auto end = json_find_matching_token(text, pos, open, close);
      if (end == std::string::npos) {
        return Result<JsonFlatMap>::failure(ErrorCode::InvalidArgument,
                                            "unbalanced value for key " + key);
      }
      result[key] = text.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const std::size_t end = scalar_end(text, pos);
      result[key] = text.substr(pos, end - pos);
      pos = end;
    }
  }

  return Result<JsonFlatMap>::success(std::move(result));
}

Result<std::vector<std::string>> json_parse_string_array(const std::string &json) {
  const std::string text = trim(json);
  if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
    return Result<std::vector<std::string>>::failure(ErrorCode::InvalidArgument,
                                                     "expected a JSON array of strings");
  }

  std::vector<std::string> out;
  std::size_t pos = 1;
  while (true) {
    pos = json_skip_ws(text, pos);
    if (pos >= text.size() || text[pos] == ']') {
      break;
    }
    if (text[pos] == ',') {
      ++pos;
      continue;
    }
    if (text[pos] != '"') {
      return Result<std::vector<std::string>>::failure(ErrorCode::InvalidArgument,
                                                       "array elements must be strings");
    }
    const auto end = json_find_string_end(text, pos);
    if (end == std::string::npos) {
      return Result<std::vector<std::string>>::failure(ErrorCode::InvalidArgument,
                                                       "unterminated string in array");
    }
    out.push_back(json_unescape(text.substr(pos + 1, end - pos - 1)));
    pos = end + 1;
  }
  return Result<std::vector<std::string>>::success(std::move(out));
}

Result<std::vector<std::string>> json_split_top_level_objects(const std::string &array_json) {
  const std::string text = trim(array_json);
  if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
    return Result<std::vector<std::string>>::failure(ErrorCode::InvalidArgument,
                                                     "expected a JSON array of objects");
  }

  std::vector<std::string> out;
  std::size_t pos = 1;
  while (true) {
    pos = json_skip_ws(text, pos);
    if (pos >= text.size() || text[pos] == ']') {
      break;
    }
    if (text[pos] == ',') {
      ++pos;
      continue;
    }
    if (text[pos] != '{') {
      return Result<std::vector<std::string>>::failure(ErrorCode::InvalidArgument,
                                                       "array elements must be objects");
    }
    const auto end = json_find_matching_token(text, pos, '{', '}');
    if (end == std::string::npos) {
      return Result<std::vector<std::string>>::failure(ErrorCode::InvalidArgument,
                                                       "unbalanced object in array");
    }
    out.push_back(text.substr(pos, end - pos + 1));
    pos = end + 1;
  }
  return Result<std::vector<std::string>>::success(std::move(out));
}

} // namespace warden::common
