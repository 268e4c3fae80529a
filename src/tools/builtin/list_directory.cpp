#include "warden/tools/builtin/list_directory.hpp"

#include "args_internal.hpp"

#include "warden/common/json_util.hpp"

#include <sstream>

namespace warden::tools {

ListDirectoryTool::ListDirectoryTool(std::shared_ptr<edit::FileEditor> editor)
    : editor_(std::move(editor)) {}

std::string_view ListDirectoryTool::name() const { return "list_directory"; }

std::string_view ListDirectoryTool::description() const {
  return "List a directory inside the project, optionally recursing into subdirectories";
}

std::string ListDirectoryTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string"},"recursive":{"type":"boolean"}}})";
}

common::Result<ToolResult> ListDirectoryTool::execute(const ToolArgs &args,
                                                      const ToolContext &ctx) {
  if (!editor_) {
    return common::Result<ToolResult>::failure("file editor unavailable");
  }
  auto path = detail::required_arg(args, "path");
  if (!path.ok()) {
    return common::Result<ToolResult>::failure(path.detail());
  }
  auto recursive = detail::bool_arg(args, "recursive");
  if (!recursive.ok()) {
    return common::Result<ToolResult>::failure(recursive.detail());
  }

  auto listing = editor_->list_directory(path.value(), recursive.value(), detail::file_scope(ctx));
  if (!listing.ok()) {
    return common::Result<ToolResult>::failure(listing.detail());
  }

  std::ostringstream out;
  out << '[';
  bool first = true;
  for (const auto &entry : listing.value().entries) {
    out << (first ? "" : ",") << "{\"name\":\"" << common::json_escape(entry.name)
        << "\",\"type\":\"" << entry.type << '"';
    if (entry.unreadable) {
      out << ",\"error\":\"unreadable\"";
    }
    out << '}';
    first = false;
  }
  out << ']';

  ToolResult result;
  result.output = out.str();
  result.truncated = listing.value().truncated;
  result.metadata["path"] = path.value();
  return common::Result<ToolResult>::success(std::move(result));
}

bool ListDirectoryTool::is_safe() const { return true; }

std::string_view ListDirectoryTool::group() const { return "fs"; }

} // namespace warden::tools
