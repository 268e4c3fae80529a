#include "warden/tools/builtin/create_directory.hpp"

#include "args_internal.hpp"

namespace warden::tools {

CreateDirectoryTool::CreateDirectoryTool(std::shared_ptr<edit::FileEditor> editor)
    : editor_(std::move(editor)) {}

std::string_view CreateDirectoryTool::name() const { return "create_directory"; }

std::string_view CreateDirectoryTool::description() const {
  return "Create a directory inside the project, including missing parents";
}

std::string CreateDirectoryTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string"}}})";
}

common::Result<ToolResult> CreateDirectoryTool::execute(const ToolArgs &args,
                                                        const ToolContext &ctx) {
  if (!editor_) {
    return common::Result<ToolResult>::failure("file editor unavailable");
  }
  auto path = detail::required_arg(args, "path");
  if (!path.ok()) {
    return common::Result<ToolResult>::failure(path.detail());
  }
  auto created = editor_->create_directory(path.value(), detail::file_scope(ctx));
  if (!created.ok()) {
    return common::Result<ToolResult>::failure(created.detail());
  }

  ToolResult result;
  result.output = (created.value() ? "Created directory " : "Directory already exists: ") +
                  path.value();
  result.metadata["path"] = path.value();
  return common::Result<ToolResult>::success(std::move(result));
}

bool CreateDirectoryTool::is_safe() const { return false; }

std::string_view CreateDirectoryTool::group() const { return "fs"; }

} // namespace warden::tools
