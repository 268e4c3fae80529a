#pragma once

#include "warden/sandbox/command_sandbox.hpp"
#include "warden/tools/tool.hpp"

#include <memory>

namespace warden::tools {

class RunCommandTool final : public ITool {
public:
  explicit RunCommandTool(std::shared_ptr<sandbox::CommandSandbox> sandbox);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override;
  [[nodiscard]] std::string_view group() const override;

private:
  std::shared_ptr<sandbox::CommandSandbox> sandbox_;
};

} // namespace warden::tools
