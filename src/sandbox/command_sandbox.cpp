#include "warden/sandbox/command_sandbox.hpp"

#include "warden/common/fs.hpp"
#include "warden/observability/global.hpp"
#include "warden/security/path_validator.hpp"

#include <algorithm>
#include <cstdlib>
#include <set>
#include <unistd.h>

namespace warden::sandbox {

namespace {

const std::set<std::string, std::less<>> SHELL_INTERPRETERS = {
    "bash", "sh", "zsh", "fish", "dash", "ksh", "csh", "tcsh", "ash"};

// Programs whose job is to run another program.
const std::set<std::string, std::less<>> COMMAND_WRAPPERS = {"env",  "nice",    "nohup",
                                                             "sudo", "doas",    "timeout",
                                                             "xargs", "exec",   "command"};

const std::set<std::string, std::less<>> FIND_EXEC_FLAGS = {"-exec", "-execdir", "-ok",
                                                            "-okdir"};

const std::set<std::string, std::less<>> SAFE_ABSOLUTE_ARGS = {"/dev/null", "/dev/stdin",
                                                               "/dev/stdout", "/dev/stderr"};

constexpr std::string_view DEFAULT_PATH = "/usr/local/bin:/usr/bin:/bin";

common::Status refuse(const std::string &kind, const std::string &subject,
                      const common::ErrorCode code, const std::string &message) {
  observability::record_security_violation("command_sandbox", kind, subject);
  return common::Status::error(code, message);
}

bool has_dotdot_segment(std::string_view value) {
  const auto segments = common::split(value, '/');
  return std::find(segments.begin(), segments.end(), "..") != segments.end();
}

std::string command_line(const CommandRequest &request) {
  std::string out = request.program;
  for (const auto &arg : request.args) {
    out.push_back(' ');
    out += arg;
  }
  return out;
}

} // namespace

SandboxOptions sandbox_options_from_config(const config::SandboxConfig &config) {
  return SandboxOptions{
      .allowed_commands = config.allowed_commands,
      .env_allowlist = config.env_allowlist,
      .default_timeout = std::chrono::milliseconds(config.default_timeout_ms),
      .max_timeout = std::chrono::milliseconds(config.max_timeout_ms),
      .max_output_bytes = static_cast<std::size_t>(config.max_output_bytes),
      .worker_threads = config.worker_threads,
  };
}

CommandSandbox::CommandSandbox(SandboxOptions options, std::shared_ptr<IProcessRunner> runner)
    : options_(std::move(options)), runner_(std::move(runner)), pool_(options_.worker_threads) {}

std::vector<std::string> CommandSandbox::sanitized_environment() const {
  static const std::vector<std::pair<std::string, std::string>> fixed = {
      {"LANG", "C.UTF-8"},
      {"GIT_TERMINAL_PROMPT", "0"},
      {"GIT_PAGER", "cat"},
      {"PAGER", "cat"},
  };

  std::vector<std::string> env;
  bool has_path = false;
  for (const auto &name : options_.env_allowlist) {
    const bool overridden = std::any_of(fixed.begin(), fixed.end(),
                                        [&name](const auto &entry) { return entry.first == name; });
    if (overridden || name.empty() || name.find('=') != std::string::npos) {
      continue;
    }
    if (const char *value = std::getenv(name.c_str()); value != nullptr) {
      env.push_back(name + "=" + value);
      has_path = has_path || name == "PATH";
    }
  }
  if (!has_path) {
    env.push_back("PATH=" + std::string(DEFAULT_PATH));
  }
  for (const auto &[name, value] : fixed) {
    env.push_back(name + "=" + value);
  }
  return env;
}

common::Result<std::filesystem::path>
CommandSandbox::resolve_executable(const std::string &program) const {
  std::string path_value(DEFAULT_PATH);
  for (const auto &entry : sanitized_environment()) {
    if (common::starts_with(entry, "PATH=")) {
      path_value = entry.substr(5);
    }
  }
  for (const auto &dir : common::split(path_value, ':')) {
    const std::filesystem::path directory(dir);
    if (dir.empty() || directory.is_relative()) {
      continue;
    }
    const auto candidate = directory / program;
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec) &&
        access(candidate.c_str(), X_OK) == 0) {
      return common::Result<std::filesystem::path>::success(candidate);
    }
  }
  return common::Result<std::filesystem::path>::failure(common::ErrorCode::NotFound,
                                                        "command not found: " + program);
}

std::chrono::milliseconds
CommandSandbox::effective_timeout(const std::optional<std::chrono::milliseconds> requested) const {
  if (!requested.has_value() || requested->count() <= 0) {
    return std::min(options_.default_timeout, options_.max_timeout);
  }
  return std::min(*requested, options_.max_timeout);
}

common::Status CommandSandbox::check(const CommandRequest &request,
                                     const std::filesystem::path &project_root) const {
  const std::string &program = request.program;
  if (common::trim(program).empty()) {
    return common::Status::error(common::ErrorCode::InvalidArgument, "command must not be empty");
  }
  if (program.find('/') != std::string::npos) {
    return refuse("program_path", program, common::ErrorCode::Disallowed,
                  "commands must be given by name, not path: " + program);
  }
  if (SHELL_INTERPRETERS.contains(program)) {
    return refuse("shell_interpreter", program, common::ErrorCode::Disallowed,
                  "shell interpreters are not allowed: " + program);
  }
  if (COMMAND_WRAPPERS.contains(program)) {
    return refuse("command_wrapper", program, common::ErrorCode::Disallowed,
                  "command wrappers are not allowed: " + program);
  }
  if (std::find(options_.allowed_commands.begin(), options_.allowed_commands.end(), program) ==
      options_.allowed_commands.end()) {
    return refuse("not_allowlisted", program, common::ErrorCode::Disallowed,
                  "command is not allowed: " + program);
  }

  if (program == "git") {
    return check_git(request, project_root);
  }
  if (program == "find") {
    for (const auto &arg : request.args) {
      if (FIND_EXEC_FLAGS.contains(arg)) {
        return refuse("find_exec", arg, common::ErrorCode::Disallowed,
                      "find flag '" + arg + "' is not allowed");
      }
    }
  }
  return check_arguments(request, project_root);
}

common::Status CommandSandbox::check_git(const CommandRequest &request,
                                         const std::filesystem::path &project_root) const {
  if (request.args.empty()) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "git requires a subcommand");
  }
  const std::string &subcommand = request.args.front();
  if (common::starts_with(subcommand, "-")) {
    return refuse("git_global_option", subcommand, common::ErrorCode::Disallowed,
                  "git options before the subcommand are not allowed: " + subcommand);
  }
  if (!security::is_known_git_subcommand(subcommand)) {
    return refuse("git_subcommand", subcommand, common::ErrorCode::Disallowed,
                  "git subcommand '" + subcommand + "' is not allowed");
  }

  const std::vector<std::string> rest(request.args.begin() + 1, request.args.end());
  const auto spec = security::normalize_git_args(subcommand, rest);
  if (auto status = security::validate_git_args(spec, project_root); !status.ok()) {
    return status;
  }
  if (auto status = check_arguments(request, project_root); !status.ok()) {
    return status;
  }
  if (security::classify_git(spec) == security::GitSafety::Destructive &&
      !request.allow_destructive) {
    return refuse("destructive_git", command_line(request), common::ErrorCode::DestructiveRefused,
                  "Refusing destructive command: " + command_line(request) +
                      ". Set allow_destructive to run it.");
  }
  return common::Status::success();
}

common::Status CommandSandbox::check_arguments(const CommandRequest &request,
                                               const std::filesystem::path &project_root) const {
  for (const auto &arg : request.args) {
    std::string_view value = arg;
    // --flag=value carries its path in the value.
    if (common::starts_with(value, "-")) {
      const auto eq = value.find('=');
      if (eq == std::string_view::npos) {
        continue;
      }
      value = value.substr(eq + 1);
    }
    const bool absolute = !value.empty() && value.front() == '/';
    if (absolute && SAFE_ABSOLUTE_ARGS.contains(value)) {
      continue;
    }
    if (!absolute && !has_dotdot_segment(value)) {
      continue;
    }
    const auto validated = security::validate_path(std::string(value), project_root);
    if (!validated.ok()) {
      return common::Status::error(validated.detail());
    }
  }
  return common::Status::success();
}

common::Result<CommandOutput> CommandSandbox::execute(const CommandRequest &request,
                                                      sessions::SessionContext &session) {
  if (auto status = check(request, session.project_root()); !status.ok()) {
    return common::Result<CommandOutput>::failure(status.detail());
  }
  if (!session.command_tracker().try_record()) {
    observability::record_security_violation("command_sandbox", "rate_limited", request.program);
    return common::Result<CommandOutput>::failure(common::ErrorCode::CapExceeded,
                                                  "command rate limit exceeded; retry later");
  }

  auto executable = resolve_executable(request.program);
  if (!executable.ok()) {
    return common::Result<CommandOutput>::failure(executable.detail());
  }

  ProcessSpec spec;
  spec.executable = executable.value();
  spec.argv.push_back(request.program);
  spec.argv.insert(spec.argv.end(), request.args.begin(), request.args.end());
  spec.environment = sanitized_environment();
  spec.working_dir = session.project_root();
  spec.timeout = effective_timeout(request.timeout);
  spec.max_output_bytes = options_.max_output_bytes;

  auto lock = session.lock_mutations();
  const auto started = std::chrono::steady_clock::now();
  auto submitted = pool_.submit([runner = runner_, spec] { return runner->run(spec); });
  if (!submitted.ok()) {
    return common::Result<CommandOutput>::failure(submitted.detail());
  }
  auto result = submitted.value().get();
  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  lock.unlock();

  if (!result.ok()) {
    observability::record_error("command_sandbox",
                                request.program + " could not be started: " + result.error());
    return common::Result<CommandOutput>::failure(result.detail());
  }

  auto &process = result.value();
  observability::record_command(request.program, session.id(), process.exit_code, duration,
                                process.timed_out);
  if (process.timed_out) {
    return common::Result<CommandOutput>::failure(
        common::ErrorCode::TimedOut,
        "Command timed out after " + std::to_string(spec.timeout.count()) + "ms");
  }

  CommandOutput output;
  output.exit_code = process.exit_code;
  output.stdout_text = std::move(process.stdout_text);
  output.stderr_text = std::move(process.stderr_text);
  output.truncated = process.truncated;
  output.duration = duration;
  if (output.truncated) {
    for (auto *stream : {&output.stdout_text, &output.stderr_text}) {
      if (stream->size() >= options_.max_output_bytes) {
        stream->append(TRUNCATION_MARKER);
      }
    }
  }
  if (request.program == "git") {
    const std::vector<std::string> rest(request.args.begin() + 1, request.args.end());
    output.git_safety = security::classify_git(request.args.front(), rest);
  }
  return common::Result<CommandOutput>::success(std::move(output));
}

} // namespace warden::sandbox
