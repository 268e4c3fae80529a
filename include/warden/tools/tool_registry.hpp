#pragma once

#include "warden/edit/file_editor.hpp"
#include "warden/sandbox/command_sandbox.hpp"
#include "warden/tools/tool.hpp"

#include <memory>
#include <unordered_map>
#include <vector>

namespace warden::tools {

class ToolRegistry {
public:
  ToolRegistry() = default;

  void register_tool(std::unique_ptr<ITool> tool);
  [[nodiscard]] ITool *get_tool(std::string_view name) const;
  [[nodiscard]] std::vector<ToolSpec> all_specs() const;

  [[nodiscard]] static ToolRegistry create_default(std::shared_ptr<edit::FileEditor> editor,
                                                   std::shared_ptr<sandbox::CommandSandbox> sandbox);

private:
  std::vector<std::unique_ptr<ITool>> tools_;
  std::unordered_map<std::string, ITool *> by_name_;
};

} // namespace warden::tools
