#pragma once

#include "warden/edit/file_editor.hpp"
#include "warden/tools/tool.hpp"

#include <memory>

namespace warden::tools {

class ReadFileTool final : public ITool {
public:
  explicit ReadFileTool(std::shared_ptr<edit::FileEditor> editor);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override;
  [[nodiscard]] std::string_view group() const override;

private:
  std::shared_ptr<edit::FileEditor> editor_;
};

} // namespace warden::tools
