#pragma once

#include "warden/common/result.hpp"
#include "warden/sessions/session_context.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>

namespace warden::tools {

// String arguments arrive unescaped; anything else stays raw JSON text.
using ToolArgs = std::unordered_map<std::string, std::string>;

struct ToolResult {
  std::string output;
  bool success = true;
  bool truncated = false;
  std::unordered_map<std::string, std::string> metadata;
};

struct ToolSpec {
  std::string name;
  std::string description;
  std::string parameters_json;
  bool safe = false;
  std::string group;
};

struct ToolContext {
  // Project root for callers without a session.
  std::filesystem::path workspace_path;
  std::string session_id;
  sessions::SessionContext *session = nullptr;
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual std::string parameters_schema() const = 0;
  [[nodiscard]] virtual common::Result<ToolResult> execute(const ToolArgs &args,
                                                           const ToolContext &ctx) = 0;

  [[nodiscard]] virtual bool is_safe() const = 0;
  [[nodiscard]] virtual std::string_view group() const = 0;

  [[nodiscard]] ToolSpec spec() const;
};

} // namespace warden::tools
