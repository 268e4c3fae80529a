#include "warden/tools/builtin/git_command.hpp"

#include "args_internal.hpp"

namespace warden::tools {

GitCommandTool::GitCommandTool(std::shared_ptr<sandbox::CommandSandbox> sandbox)
    : sandbox_(std::move(sandbox)) {}

std::string_view GitCommandTool::name() const { return "git_command"; }

std::string_view GitCommandTool::description() const {
  return "Run a git subcommand in the project; destructive forms need allow_destructive";
}

std::string GitCommandTool::parameters_schema() const {
  return R"({"type":"object","required":["subcommand"],"properties":{"subcommand":{"type":"string"},"args":{"type":"array","items":{"type":"string"}},"allow_destructive":{"type":"boolean"},"timeout_ms":{"type":"integer"}}})";
}

common::Result<ToolResult> GitCommandTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  if (!sandbox_) {
    return common::Result<ToolResult>::failure("command sandbox unavailable");
  }
  if (ctx.session == nullptr) {
    return common::Result<ToolResult>::failure(common::ErrorCode::InvalidArgument,
                                               "commands require a session");
  }
  auto subcommand = detail::required_arg(args, "subcommand");
  if (!subcommand.ok()) {
    return common::Result<ToolResult>::failure(subcommand.detail());
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
  request.program = "git";
  request.args.push_back(subcommand.value());
  request.args.insert(request.args.end(), rest.value().begin(), rest.value().end());
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
  if (out.git_safety.has_value()) {
    result.metadata["git_safety"] = std::string(security::to_string(*out.git_safety));
  }
  return common::Result<ToolResult>::success(std::move(result));
}

bool GitCommandTool::is_safe() const { return false; }

std::string_view GitCommandTool::group() const { return "runtime"; }

} // namespace warden::tools
