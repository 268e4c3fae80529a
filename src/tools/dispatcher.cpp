#include "warden/tools/dispatcher.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/json_util.hpp"
#include "warden/observability/global.hpp"

#include <chrono>
#include <sstream>

namespace warden::tools {

namespace {

DispatchResponse error_response(const common::Error &error) {
  DispatchResponse response;
  response.ok = false;
  response.message = error.message;
  response.code = error.code;
  response.match_count = error.match_count;
  response.edit_index = error.batch_index;
  return response;
}

} // namespace

std::string DispatchResponse::to_json() const {
  std::ostringstream out;
  if (ok) {
    out << "{\"ok\":\"" << common::json_escape(message) << "\"}";
    return out.str();
  }
  out << "{\"error\":\"" << common::json_escape(message) << "\",\"code\":\""
      << common::to_string(code) << "\"";
  if (match_count > 0) {
    out << ",\"match_count\":" << match_count;
  }
  if (edit_index > 0) {
    out << ",\"edit_index\":" << edit_index;
  }
  out << "}";
  return out.str();
}

Dispatcher::Dispatcher(std::shared_ptr<ToolRegistry> registry) : registry_(std::move(registry)) {}

common::Result<ToolRequest> Dispatcher::parse_request(const std::string &json) {
  auto fields = common::json_parse_flat(json);
  if (!fields.ok()) {
    return common::Result<ToolRequest>::failure(common::ErrorCode::InvalidArgument,
                                                "malformed request: " + fields.error());
  }
  ToolRequest request;
  const auto tool = fields.value().find("tool");
  if (tool == fields.value().end() || common::trim(tool->second).empty()) {
    return common::Result<ToolRequest>::failure(common::ErrorCode::InvalidArgument,
                                                "request is missing a tool name");
  }
  request.tool = tool->second;

  if (const auto args = fields.value().find("args"); args != fields.value().end()) {
    auto parsed = common::json_parse_flat(args->second);
    if (!parsed.ok()) {
      return common::Result<ToolRequest>::failure(common::ErrorCode::InvalidArgument,
                                                  "args must be a JSON object");
    }
    request.args = std::move(parsed.value());
  }
  return common::Result<ToolRequest>::success(std::move(request));
}

DispatchResponse Dispatcher::dispatch(const ToolRequest &request, const ToolContext &ctx) const {
  ITool *tool = registry_ ? registry_->get_tool(request.tool) : nullptr;
  if (tool == nullptr) {
    return error_response(
        common::make_error(common::ErrorCode::InvalidArgument, "unknown tool: " + request.tool));
  }

  const auto started = std::chrono::steady_clock::now();
  auto result = tool->execute(request.args, ctx);
  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_tool_call(request.tool, ctx.session_id, duration, result.ok());

  if (!result.ok()) {
    if (result.code() == common::ErrorCode::Io) {
      // OS detail stays in the log.
      observability::record_error("dispatcher", request.tool + ": " + result.error());
      return error_response(common::make_error(
          common::ErrorCode::Io, "internal error while running " + request.tool));
    }
    return error_response(result.detail());
  }

  DispatchResponse response;
  response.ok = true;
  response.message = std::move(result.value().output);
  return response;
}

DispatchResponse Dispatcher::handle_line(const std::string &line, const ToolContext &ctx) const {
  auto request = parse_request(line);
  if (!request.ok()) {
    return error_response(request.detail());
  }
  return dispatch(request.value(), ctx);
}

} // namespace warden::tools
