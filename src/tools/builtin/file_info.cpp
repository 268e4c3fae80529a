#include "warden/tools/builtin/file_info.hpp"

#include "args_internal.hpp"

#include "warden/common/json_util.hpp"

#include <sstream>

namespace warden::tools {

FileInfoTool::FileInfoTool(std::shared_ptr<edit::FileEditor> editor)
    : editor_(std::move(editor)) {}

std::string_view FileInfoTool::name() const { return "file_info"; }

std::string_view FileInfoTool::description() const {
  return "Report size, type, access and modification time of a path inside the project";
}

std::string FileInfoTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string"}}})";
}

common::Result<ToolResult> FileInfoTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  if (!editor_) {
    return common::Result<ToolResult>::failure("file editor unavailable");
  }
  auto path = detail::required_arg(args, "path");
  if (!path.ok()) {
    return common::Result<ToolResult>::failure(path.detail());
  }
  auto info = editor_->file_info(path.value(), detail::file_scope(ctx));
  if (!info.ok()) {
    return common::Result<ToolResult>::failure(info.detail());
  }

  const auto &stat = info.value();
  std::ostringstream out;
  out << "{\"path\":\"" << common::json_escape(path.value()) << "\",\"size\":" << stat.size
      << ",\"type\":\"" << stat.type << "\",\"access\":\"" << stat.access << "\",\"mtime\":\""
      << stat.mtime << "\"}";

  ToolResult result;
  result.output = out.str();
  result.metadata["path"] = path.value();
  return common::Result<ToolResult>::success(std::move(result));
}

bool FileInfoTool::is_safe() const { return true; }

std::string_view FileInfoTool::group() const { return "fs"; }

} // namespace warden::tools
