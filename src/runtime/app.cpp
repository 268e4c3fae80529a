#include "warden/runtime/app.hpp"

#include "warden/config/config.hpp"
#include "warden/observability/factory.hpp"
#include "warden/observability/global.hpp"
#include "warden/tools/tool_registry.hpp"

namespace warden::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.detail());
  }
  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<RuntimeContext>::failure(validated.detail());
  }
  for (const auto &warning : validated.value()) {
    observability::record_warning("config", warning);
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

void RuntimeContext::install_observer() const {
  observability::set_global_observer(observability::create_observer(config_));
}

common::Result<std::shared_ptr<edit::FileEditor>> RuntimeContext::create_file_editor() const {
  using EditorResult = common::Result<std::shared_ptr<edit::FileEditor>>;

  const auto legacy = edit::legacy_mode_from_string(config_.session.legacy_mode);
  if (!legacy.has_value()) {
    return EditorResult::failure(common::ErrorCode::InvalidArgument,
                                 "invalid session.legacy_mode: " + config_.session.legacy_mode);
  }

  std::vector<edit::MatchStrategy> strategies;
  for (const auto &name : config_.edits.strategies) {
    const auto strategy = edit::strategy_from_string(name);
    if (!strategy.has_value()) {
      return EditorResult::failure(common::ErrorCode::InvalidArgument,
                                   "unknown edit strategy: " + name);
    }
    strategies.push_back(*strategy);
  }

  const edit::EditLimits limits{
      .max_batch_edits = config_.edits.max_batch_edits,
      .max_string_bytes = static_cast<std::size_t>(config_.edits.max_string_bytes)};
  const edit::FilePolicy policy{.legacy_mode = *legacy,
                                .max_file_bytes = config_.edits.max_file_bytes,
                                .default_mode = config_.files.default_mode};
  return EditorResult::success(std::make_shared<edit::FileEditor>(
      edit::EditEngine(limits, edit::TextMatcher(std::move(strategies))), policy));
}

std::shared_ptr<sandbox::CommandSandbox>
RuntimeContext::create_sandbox(std::shared_ptr<sandbox::IProcessRunner> runner) const {
  if (!runner) {
    runner = std::make_shared<sandbox::PosixProcessRunner>();
  }
  return std::make_shared<sandbox::CommandSandbox>(
      sandbox::sandbox_options_from_config(config_.sandbox), std::move(runner));
}

common::Result<std::shared_ptr<tools::Dispatcher>>
RuntimeContext::create_dispatcher(std::shared_ptr<sandbox::IProcessRunner> runner) const {
  auto editor = create_file_editor();
  if (!editor.ok()) {
    return common::Result<std::shared_ptr<tools::Dispatcher>>::failure(editor.detail());
  }
  auto registry = std::make_shared<tools::ToolRegistry>(
      tools::ToolRegistry::create_default(editor.value(), create_sandbox(std::move(runner))));
  return common::Result<std::shared_ptr<tools::Dispatcher>>::success(
      std::make_shared<tools::Dispatcher>(std::move(registry)));
}

common::Result<std::shared_ptr<sessions::SessionContext>>
RuntimeContext::create_session(std::string id, const std::filesystem::path &project_root) const {
  return sessions::SessionContext::create(std::move(id), project_root,
                                          config_.sandbox.max_commands_per_minute);
}

} // namespace warden::runtime
