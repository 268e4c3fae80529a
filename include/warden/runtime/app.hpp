#pragma once

#include "warden/common/result.hpp"
#include "warden/config/schema.hpp"
#include "warden/edit/file_editor.hpp"
#include "warden/sandbox/command_sandbox.hpp"
#include "warden/sessions/session_context.hpp"
#include "warden/tools/dispatcher.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace warden::runtime {

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;

  void install_observer() const;

  [[nodiscard]] common::Result<std::shared_ptr<edit::FileEditor>> create_file_editor() const;
  /// A null `runner` means the real fork/exec runner.
  [[nodiscard]] std::shared_ptr<sandbox::CommandSandbox>
  create_sandbox(std::shared_ptr<sandbox::IProcessRunner> runner = nullptr) const;
  [[nodiscard]] common::Result<std::shared_ptr<tools::Dispatcher>>
  create_dispatcher(std::shared_ptr<sandbox::IProcessRunner> runner = nullptr) const;
  [[nodiscard]] common::Result<std::shared_ptr<sessions::SessionContext>>
  create_session(std::string id, const std::filesystem::path &project_root) const;

private:
  config::Config config_;
};

} // namespace warden::runtime
