#pragma once

#include "warden/common/result.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace warden::common {

[[nodiscard]] std::string json_escape(const std::string &value);

[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Top-level members of an object. String values are unescaped; objects,
/// arrays, numbers and literals are kept as raw JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] Result<JsonFlatMap> json_parse_flat(const std::string &json);

[[nodiscard]] Result<std::vector<std::string>> json_parse_string_array(const std::string &json);

[[nodiscard]] Result<std::vector<std::string>>
json_split_top_level_objects(const std::string &array_json);

} // namespace warden::common
