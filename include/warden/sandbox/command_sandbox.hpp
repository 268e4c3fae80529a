#pragma once

#include "warden/common/result.hpp"
#include "warden/config/schema.hpp"
#include "warden/sandbox/process_runner.hpp"
#include "warden/sandbox/worker_pool.hpp"
#include "warden/security/git_classifier.hpp"
#include "warden/sessions/session_context.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace warden::sandbox {

struct SandboxOptions {
  std::vector<std::string> allowed_commands;
  std::vector<std::string> env_allowlist;
  std::chrono::milliseconds default_timeout{25'000};
  std::chrono::milliseconds max_timeout{120'000};
  std::size_t max_output_bytes = 1024 * 1024;
  std::size_t worker_threads = 4;
};

[[nodiscard]] SandboxOptions sandbox_options_from_config(const config::SandboxConfig &config);

struct CommandRequest {
  // Bare program name, looked up in the sanitized PATH.
  std::string program;
  std::vector<std::string> args;
  bool allow_destructive = false;
  std::optional<std::chrono::milliseconds> timeout;
};

struct CommandOutput {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool truncated = false;
  std::chrono::milliseconds duration{0};
  std::optional<security::GitSafety> git_safety;
};

inline constexpr std::string_view TRUNCATION_MARKER = "\n[output truncated]";

/// Every refusal happens before anything is spawned.
class CommandSandbox {
public:
  CommandSandbox(SandboxOptions options, std::shared_ptr<IProcessRunner> runner);

  CommandSandbox(const CommandSandbox &) = delete;
  CommandSandbox &operator=(const CommandSandbox &) = delete;

  [[nodiscard]] common::Result<CommandOutput> execute(const CommandRequest &request,
                                                      sessions::SessionContext &session);

  [[nodiscard]] common::Status check(const CommandRequest &request,
                                     const std::filesystem::path &project_root) const;

  [[nodiscard]] std::vector<std::string> sanitized_environment() const;
  [[nodiscard]] common::Result<std::filesystem::path>
  resolve_executable(const std::string &program) const;
  [[nodiscard]] std::chrono::milliseconds
  effective_timeout(std::optional<std::chrono::milliseconds> requested) const;

  [[nodiscard]] const SandboxOptions &options() const { return options_; }

private:
  [[nodiscard]] common::Status check_git(const CommandRequest &request,
                                         const std::filesystem::path &project_root) const;
  [[nodiscard]] common::Status check_arguments(const CommandRequest &request,
                                               const std::filesystem::path &project_root) const;

  SandboxOptions options_;
  std::shared_ptr<IProcessRunner> runner_;
  WorkerPool pool_;
};

} // namespace warden::sandbox
