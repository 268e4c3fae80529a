#pragma once

#include "warden/common/result.hpp"
#include "warden/tools/tool.hpp"
#include "warden/tools/tool_registry.hpp"

#include <memory>
#include <string>

namespace warden::tools {

struct ToolRequest {
  std::string tool;
  ToolArgs args;
};

struct DispatchResponse {
  bool ok = false;
  std::string message;
  common::ErrorCode code = common::ErrorCode::None;
  std::size_t match_count = 0;
  std::size_t edit_index = 0;

  /// `{"ok":"..."}` or `{"error":"...","code":"..."}`.
  [[nodiscard]] std::string to_json() const;
};

/// Boundary between callers and the tools. Every failure comes back as a
/// stable message that names only what the caller supplied.
class Dispatcher {
public:
  explicit Dispatcher(std::shared_ptr<ToolRegistry> registry);

  [[nodiscard]] static common::Result<ToolRequest> parse_request(const std::string &json);

  [[nodiscard]] DispatchResponse dispatch(const ToolRequest &request,
                                          const ToolContext &ctx) const;
  [[nodiscard]] DispatchResponse handle_line(const std::string &line,
                                             const ToolContext &ctx) const;

private:
  std::shared_ptr<ToolRegistry> registry_;
};

} // namespace warden::tools
