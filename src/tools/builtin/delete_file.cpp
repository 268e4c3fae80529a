#include "warden/tools/builtin/delete_file.hpp"

#include "args_internal.hpp"

namespace warden::tools {

DeleteFileTool::DeleteFileTool(std::shared_ptr<edit::FileEditor> editor)
    : editor_(std::move(editor)) {}

std::string_view DeleteFileTool::name() const { return "delete_file"; }

std::string_view DeleteFileTool::description() const {
  return "Delete a file inside the project; requires confirm set to true";
}

std::string DeleteFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path","confirm"],"properties":{"path":{"type":"string"},"confirm":{"type":"boolean"}}})";
}

common::Result<ToolResult> DeleteFileTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  if (!editor_) {
    return common::Result<ToolResult>::failure("file editor unavailable");
  }
  auto path = detail::required_arg(args, "path");
  if (!path.ok()) {
    return common::Result<ToolResult>::failure(path.detail());
  }
  if (!detail::optional_arg(args, "confirm").has_value()) {
    return common::Result<ToolResult>::failure(
        common::ErrorCode::InvalidArgument, "delete_file requires confirm parameter set to true");
  }
  auto confirm = detail::bool_arg(args, "confirm");
  if (!confirm.ok()) {
    return common::Result<ToolResult>::failure(confirm.detail());
  }
  if (!confirm.value()) {
    return common::Result<ToolResult>::failure(common::ErrorCode::InvalidArgument,
                                               "Delete operation requires confirm=true");
  }

  if (auto deleted = editor_->delete_file(path.value(), detail::file_scope(ctx)); !deleted.ok()) {
    return common::Result<ToolResult>::failure(deleted.detail());
  }

  ToolResult result;
  result.output = "Deleted " + path.value();
  result.metadata["path"] = path.value();
  return common::Result<ToolResult>::success(std::move(result));
}

bool DeleteFileTool::is_safe() const { return false; }

std::string_view DeleteFileTool::group() const { return "fs"; }

} // namespace warden::tools
