#include "warden/tools/builtin/file_edit.hpp"

#include "args_internal.hpp"

namespace warden::tools {

EditFileTool::EditFileTool(std::shared_ptr<edit::FileEditor> editor)
    : editor_(std::move(editor)) {}

std::string_view EditFileTool::name() const { return "edit_file"; }

std::string_view EditFileTool::description() const {
  return "Replace old_string with new_string in a file that was read this session";
}

std::string EditFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path","old_string","new_string"],"properties":{"path":{"type":"string"},"old_string":{"type":"string"},"new_string":{"type":"string"},"replace_all":{"type":"boolean"}}})";
}

common::Result<ToolResult> EditFileTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  if (!editor_) {
    return common::Result<ToolResult>::failure("file editor unavailable");
  }
  auto path = detail::required_arg(args, "path");
  auto old_arg = detail::required_arg(args, "old_string");
  auto new_arg = detail::required_arg(args, "new_string");
  auto replace_all = detail::bool_arg(args, "replace_all");
  for (const auto *arg : {&path, &old_arg, &new_arg}) {
    if (!arg->ok()) {
      return common::Result<ToolResult>::failure(arg->detail());
    }
  }
  if (!replace_all.ok()) {
    return common::Result<ToolResult>::failure(replace_all.detail());
  }

  const edit::EditRequest request{.old_string = old_arg.value(),
                                  .new_string = new_arg.value(),
                                  .replace_all = replace_all.value()};
  auto edited = editor_->edit_file(path.value(), request, detail::file_scope(ctx));
  if (!edited.ok()) {
    return common::Result<ToolResult>::failure(edited.detail());
  }

  const auto &outcome = edited.value().edit;
  const std::size_t count = outcome.replacements();
  ToolResult result;
  result.output = "Edited " + path.value() + ": " + std::to_string(count) +
                  (count == 1 ? " replacement" : " replacements") + " (" +
                  std::string(edit::to_string(outcome.applied.front().strategy)) + ")";
  result.metadata["path"] = path.value();
  result.metadata["strategy"] = std::string(edit::to_string(outcome.applied.front().strategy));
  return common::Result<ToolResult>::success(std::move(result));
}

bool EditFileTool::is_safe() const { return false; }

std::string_view EditFileTool::group() const { return "fs"; }

} // namespace warden::tools
