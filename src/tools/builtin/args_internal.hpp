#pragma once

#include "warden/common/result.hpp"
#include "warden/edit/file_editor.hpp"
#include "warden/tools/tool.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden::tools::detail {

[[nodiscard]] common::Result<std::string> required_arg(const ToolArgs &args,
                                                       const std::string &name);
[[nodiscard]] std::optional<std::string> optional_arg(const ToolArgs &args,
                                                      const std::string &name);
[[nodiscard]] common::Result<bool> bool_arg(const ToolArgs &args, const std::string &name);
[[nodiscard]] common::Result<std::optional<std::uint64_t>> uint_arg(const ToolArgs &args,
                                                                    const std::string &name);
[[nodiscard]] common::Result<std::vector<std::string>> string_list_arg(const ToolArgs &args,
                                                                       const std::string &name);

[[nodiscard]] edit::FileScope file_scope(const ToolContext &ctx);

/// `{"exit_code":...,"stdout":...,"stderr":...,"truncated":...}`
[[nodiscard]] std::string command_output_json(int exit_code, const std::string &stdout_text,
                                              const std::string &stderr_text, bool truncated);

} // namespace warden::tools::detail
