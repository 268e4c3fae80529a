#include "args_internal.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/json_util.hpp"

#include <cctype>
#include <sstream>

namespace warden::tools::detail {

common::Result<std::string> required_arg(const ToolArgs &args, const std::string &name) {
  const auto it = args.find(name);
  if (it == args.end()) {
    return common::Result<std::string>::failure(common::ErrorCode::InvalidArgument,
                                                "Missing argument: " + name);
  }
  return common::Result<std::string>::success(it->second);
}

std::optional<std::string> optional_arg(const ToolArgs &args, const std::string &name) {
  const auto it = args.find(name);
  if (it == args.end()) {
    return std::nullopt;
  }
  return it->second;
}

common::Result<bool> bool_arg(const ToolArgs &args, const std::string &name) {
  const auto value = optional_arg(args, name);
  if (!value.has_value()) {
    return common::Result<bool>::success(false);
  }
  const std::string normalized = common::to_lower(common::trim(*value));
  if (normalized == "true" || normalized == "1") {
    return common::Result<bool>::success(true);
  }
  if (normalized == "false" || normalized == "0" || normalized.empty() || normalized == "null") {
    return common::Result<bool>::success(false);
  }
  return common::Result<bool>::failure(common::ErrorCode::InvalidArgument,
                                       "Argument " + name + " must be a boolean");
}

common::Result<std::optional<std::uint64_t>> uint_arg(const ToolArgs &args,
                                                      const std::string &name) {
  using UintResult = common::Result<std::optional<std::uint64_t>>;
  const auto value = optional_arg(args, name);
  if (!value.has_value() || common::trim(*value).empty() || common::trim(*value) == "null") {
    return UintResult::success(std::nullopt);
  }
  const std::string text = common::trim(*value);
  if (text.size() > 18) {
    return UintResult::failure(common::ErrorCode::InvalidArgument,
                               "Argument " + name + " is out of range");
  }
  std::uint64_t parsed = 0;
  for (const char ch : text) {
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      return UintResult::failure(common::ErrorCode::InvalidArgument,
                                 "Argument " + name + " must be a non-negative integer");
    }
    parsed = parsed * 10 + static_cast<std::uint64_t>(ch - '0');
  }
  return UintResult::success(parsed);
}

common::Result<std::vector<std::string>> string_list_arg(const ToolArgs &args,
                                                         const std::string &name) {
  const auto value = optional_arg(args, name);
  if (!value.has_value() || common::trim(*value).empty()) {
    return common::Result<std::vector<std::string>>::success({});
  }
  auto parsed = common::json_parse_string_array(*value);
  if (!parsed.ok()) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::InvalidArgument, "Argument " + name + " must be an array of strings");
  }
  return parsed;
}

edit::FileScope file_scope(const ToolContext &ctx) {
  return edit::FileScope{.project_root = ctx.workspace_path, .session = ctx.session};
}

std::string command_output_json(const int exit_code, const std::string &stdout_text,
                                const std::string &stderr_text, const bool truncated) {
  std::ostringstream out;
  out << "{\"exit_code\":" << exit_code << ",\"stdout\":\"" << common::json_escape(stdout_text)
      << "\",\"stderr\":\"" << common::json_escape(stderr_text)
      << "\",\"truncated\":" << (truncated ? "true" : "false") << "}";
  return out.str();
}

} // namespace warden::tools::detail
