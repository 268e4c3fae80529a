#include "warden/tools/builtin/run_command.hpp"

#include "args_internal.hpp"

namespace warden::tools {

RunCommandTool::RunCommandTool(std::shared_ptr<sandbox::CommandSandbox> sandbox)
    : sandbox_(std::move(sandbox)) {}

std::string_view RunCommandTool::name() const { return "run_command"; }

std::string_view RunCommandTool::description() const {
  return "Run an allowlisted program in the project without a shell";
}

std::string RunCommandTool::parameters_schema() const {
  return R"({"type":"object","required":["program"],"properties":{"program":{"type":"string"},"args":{"type":"array","items":{"type":"string"}},"allow_destructive":{"type":"boolean"},"timeout_ms":{"type":"integer"}}})";
}

common::Result<ToolResult> RunCommandTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  if (!sandbox_) {
    return common::Result<ToolResult>::failure("command sandbox unavailable");
  }
  if (ctx.session == nullptr) {
    return common::Result<ToolResult>::failure(common::ErrorCode::InvalidArgument,
                                               "commands require a session");
  }
  auto program = detail::required_arg(args, "program");
  if (!program.ok()) {
    return common::Result<ToolResult>::failure(program.detail());
  }
  auto rest = detail::string_list_arg(args, "args");
  if (!rest.ok()) {
    return common::Result<ToolResult>::failure(rest.detail());
  }
  auto allow_destructive = detail::bool_arg(args, "allow_destructive");
  if (!allow_destructive.ok()) {
    return common::Result<ToolResult>::failure(allow_destructive.detail());
  }
  auto timeout = detail::uint_arg(args, "timeout_ms");
  if (!timeout.ok()) {
    return common::Result<ToolResult>::failure(timeout.detail());
  }

  sandbox::CommandRequest request;
  request.program = program.value();
  request.args = rest.value();
  request.allow_destructive = allow_destructive.value();
  if (timeout.value().has_value()) {
    request.timeout = std::chrono::milliseconds(*timeout.value());
  }

  auto output = sandbox_->execute(request, *ctx.session);
  if (!output.ok()) {
    return common::Result<ToolResult>::failure(output.detail());
  }

  const auto &out = output.value();
  ToolResult result;
  result.output = detail::command_output_json(out.exit_code, out.stdout_text, out.stderr_text,
                                              out.truncated);
  result.success = out.exit_code == 0;
  result.truncated = out.truncated;
  return common::Result<ToolResult>::success(std::move(result));
}

bool RunCommandTool::is_safe() const { return false; }

std::string_view RunCommandTool::group() const { return "runtime"; }

} // namespace warden::tools
