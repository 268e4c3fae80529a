#include "warden/tools/builtin/file_read.hpp"

#include "args_internal.hpp"

#include <sstream>

namespace warden::tools {

namespace {

// 1-based `offset`, at most `limit` lines.
std::string select_lines(const std::string &content, const std::uint64_t offset,
                         const std::optional<std::uint64_t> limit, bool &truncated) {
  std::istringstream in(content);
  std::ostringstream out;
  std::string line;
  std::uint64_t number = 0;
  std::uint64_t emitted = 0;
  while (std::getline(in, line)) {
    ++number;
    if (number < offset) {
      continue;
    }
    if (limit.has_value() && emitted >= *limit) {
      truncated = true;
      break;
    }
    out << line;
    if (!in.eof()) {
      out << '\n';
    }
    ++emitted;
  }
  return out.str();
}

} // namespace

ReadFileTool::ReadFileTool(std::shared_ptr<edit::FileEditor> editor) : editor_(std::move(editor)) {}

std::string_view ReadFileTool::name() const { return "read_file"; }

std::string_view ReadFileTool::description() const {
  return "Read a UTF-8 text file inside the project and record it as read";
}

std::string ReadFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string"},"offset":{"type":"integer"},"limit":{"type":"integer"}}})";
}

common::Result<ToolResult> ReadFileTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  if (!editor_) {
    return common::Result<ToolResult>::failure("file editor unavailable");
  }
  auto path = detail::required_arg(args, "path");
  if (!path.ok()) {
    return common::Result<ToolResult>::failure(path.detail());
  }
  auto offset = detail::uint_arg(args, "offset");
  auto limit = detail::uint_arg(args, "limit");
  if (!offset.ok()) {
    return common::Result<ToolResult>::failure(offset.detail());
  }
  if (!limit.ok()) {
    return common::Result<ToolResult>::failure(limit.detail());
  }

  auto read = editor_->read_file(path.value(), detail::file_scope(ctx));
  if (!read.ok()) {
    return common::Result<ToolResult>::failure(read.detail());
  }

  ToolResult result;
  if (offset.value().has_value() || limit.value().has_value()) {
    result.output = select_lines(read.value().content, offset.value().value_or(1), limit.value(),
                                 result.truncated);
  } else {
    result.output = std::move(read.value().content);
  }
  result.metadata["path"] = path.value();
  return common::Result<ToolResult>::success(std::move(result));
}

bool ReadFileTool::is_safe() const { return true; }

std::string_view ReadFileTool::group() const { return "fs"; }

} // namespace warden::tools
