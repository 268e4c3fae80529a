#include "warden/tools/tool_registry.hpp"

#include "warden/common/fs.hpp"
#include "warden/tools/builtin/create_directory.hpp"
#include "warden/tools/builtin/delete_file.hpp"
#include "warden/tools/builtin/file_edit.hpp"
#include "warden/tools/builtin/file_info.hpp"
#include "warden/tools/builtin/file_read.hpp"
#include "warden/tools/builtin/file_write.hpp"
#include "warden/tools/builtin/git_command.hpp"
#include "warden/tools/builtin/list_directory.hpp"
#include "warden/tools/builtin/multi_edit.hpp"
#include "warden/tools/builtin/run_command.hpp"

namespace warden::tools {

void ToolRegistry::register_tool(std::unique_ptr<ITool> tool) {
  ITool *raw = tool.get();
  by_name_[common::to_lower(std::string(raw->name()))] = raw;
  tools_.push_back(std::move(tool));
}

ITool *ToolRegistry::get_tool(const std::string_view name) const {
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<ToolSpec> ToolRegistry::all_specs() const {
  std::vector<ToolSpec> specs;
  specs.reserve(tools_.size());
  for (const auto &tool : tools_) {
    specs.push_back(tool->spec());
  }
  return specs;
}

ToolRegistry ToolRegistry::create_default(std::shared_ptr<edit::FileEditor> editor,
                                          std::shared_ptr<sandbox::CommandSandbox> sandbox) {
  ToolRegistry registry;
  registry.register_tool(std::make_unique<ReadFileTool>(editor));
  registry.register_tool(std::make_unique<WriteFileTool>(editor));
  registry.register_tool(std::make_unique<EditFileTool>(editor));
  registry.register_tool(std::make_unique<MultiEditFileTool>(editor));
  registry.register_tool(std::make_unique<ListDirectoryTool>(editor));
  registry.register_tool(std::make_unique<FileInfoTool>(editor));
  registry.register_tool(std::make_unique<CreateDirectoryTool>(editor));
  registry.register_tool(std::make_unique<DeleteFileTool>(editor));
  registry.register_tool(std::make_unique<GitCommandTool>(sandbox));
  registry.register_tool(std::make_unique<RunCommandTool>(sandbox));
  return registry;
}

} // namespace warden::tools
