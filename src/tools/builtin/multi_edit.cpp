#include "warden/tools/builtin/multi_edit.hpp"

#include "args_internal.hpp"

#include "warden/common/json_util.hpp"

namespace warden::tools {

namespace {

common::Result<std::vector<edit::EditRequest>> parse_edits(const std::string &raw) {
  using EditsResult = common::Result<std::vector<edit::EditRequest>>;
  auto objects = common::json_split_top_level_objects(raw);
  if (!objects.ok()) {
    return EditsResult::failure(common::ErrorCode::InvalidArgument,
                                "edits must be an array of objects");
  }

  std::vector<edit::EditRequest> edits;
  edits.reserve(objects.value().size());
  for (std::size_t i = 0; i < objects.value().size(); ++i) {
    const std::string position = "edit " + std::to_string(i + 1);
    auto fields = common::json_parse_flat(objects.value()[i]);
    if (!fields.ok()) {
      return EditsResult::failure(common::ErrorCode::InvalidArgument,
                                  position + ": " + fields.error());
    }
    auto old_arg = detail::required_arg(fields.value(), "old_string");
    auto new_arg = detail::required_arg(fields.value(), "new_string");
    auto replace_all = detail::bool_arg(fields.value(), "replace_all");
    if (!old_arg.ok() || !new_arg.ok()) {
      return EditsResult::failure(common::ErrorCode::InvalidArgument,
                                  position + ": old_string and new_string are required");
    }
    if (!replace_all.ok()) {
      return EditsResult::failure(common::ErrorCode::InvalidArgument,
                                  position + ": " + replace_all.error());
    }
    edits.push_back(edit::EditRequest{.old_string = old_arg.value(),
                                      .new_string = new_arg.value(),
                                      .replace_all = replace_all.value()});
  }
  return EditsResult::success(std::move(edits));
}

} // namespace

MultiEditFileTool::MultiEditFileTool(std::shared_ptr<edit::FileEditor> editor)
    : editor_(std::move(editor)) {}

std::string_view MultiEditFileTool::name() const { return "multi_edit_file"; }

std::string_view MultiEditFileTool::description() const {
  return "Apply several edits to one file in order; all succeed or the file is untouched";
}

std::string MultiEditFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path","edits"],"properties":{"path":{"type":"string"},"edits":{"type":"array","items":{"type":"object","required":["old_string","new_string"],"properties":{"old_string":{"type":"string"},"new_string":{"type":"string"},"replace_all":{"type":"boolean"}}}}}})";
}

common::Result<ToolResult> MultiEditFileTool::execute(const ToolArgs &args,
                                                      const ToolContext &ctx) {
  if (!editor_) {
    return common::Result<ToolResult>::failure("file editor unavailable");
  }
  auto path = detail::required_arg(args, "path");
  if (!path.ok()) {
    return common::Result<ToolResult>::failure(path.detail());
  }
  auto raw_edits = detail::required_arg(args, "edits");
  if (!raw_edits.ok()) {
    return common::Result<ToolResult>::failure(raw_edits.detail());
  }
  auto edits = parse_edits(raw_edits.value());
  if (!edits.ok()) {
    return common::Result<ToolResult>::failure(edits.detail());
  }

  auto edited = editor_->multi_edit_file(path.value(), edits.value(), detail::file_scope(ctx));
  if (!edited.ok()) {
    return common::Result<ToolResult>::failure(edited.detail());
  }

  const auto &outcome = edited.value().edit;
  ToolResult result;
  result.output = "Applied " + std::to_string(outcome.applied.size()) + " edits to " +
                  path.value() + " (" + std::to_string(outcome.replacements()) +
                  " replacements)";
  result.metadata["path"] = path.value();
  return common::Result<ToolResult>::success(std::move(result));
}

bool MultiEditFileTool::is_safe() const { return false; }

std::string_view MultiEditFileTool::group() const { return "fs"; }

} // namespace warden::tools
