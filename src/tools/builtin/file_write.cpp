#include "warden/tools/builtin/file_write.hpp"

#include "args_internal.hpp"

namespace warden::tools {

WriteFileTool::WriteFileTool(std::shared_ptr<edit::FileEditor> editor)
    : editor_(std::move(editor)) {}

std::string_view WriteFileTool::name() const { return "write_file"; }

std::string_view WriteFileTool::description() const {
  return "Create or replace a text file inside the project";
}

std::string WriteFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path","content"],"properties":{"path":{"type":"string"},"content":{"type":"string"}}})";
}

common::Result<ToolResult> WriteFileTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  if (!editor_) {
    return common::Result<ToolResult>::failure("file editor unavailable");
  }
  auto path = detail::required_arg(args, "path");
  if (!path.ok()) {
    return common::Result<ToolResult>::failure(path.detail());
  }
  auto content = detail::required_arg(args, "content");
  if (!content.ok()) {
    return common::Result<ToolResult>::failure(content.detail());
  }

  auto written = editor_->write_file(path.value(), content.value(), detail::file_scope(ctx));
  if (!written.ok()) {
    return common::Result<ToolResult>::failure(written.detail());
  }

  ToolResult result;
  result.output = std::string(written.value().created ? "Created " : "Wrote ") + path.value() +
                  " (" + std::to_string(written.value().bytes) + " bytes)";
  result.metadata["path"] = path.value();
  return common::Result<ToolResult>::success(std::move(result));
}

bool WriteFileTool::is_safe() const { return false; }

std::string_view WriteFileTool::group() const { return "fs"; }

} // namespace warden::tools
