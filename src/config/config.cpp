#include "warden/config/config.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/toml.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace warden::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".warden";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

const std::vector<std::string> &known_strategies() {
  static const std::vector<std::string> names = {"exact", "line_trimmed", "whitespace_normalized",
                                                 "indentation_flexible", "fuzzy"};
  return names;
}

const std::vector<std::string> &shell_interpreters() {
  static const std::vector<std::string> names = {"bash", "sh",   "zsh", "fish", "dash",
                                                 "ksh",  "csh",  "tcsh", "ash"};
  return names;
}

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("WARDEN_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::uint32_t> parse_mode(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.empty()) {
    return std::nullopt;
  }
  std::uint32_t mode = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, mode, 8);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return mode;
}

std::optional<std::uint64_t> env_u64(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  const std::string text(raw);
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::uint32_t clamp_u32(const std::uint64_t value) {
  return static_cast<std::uint32_t>(std::min<std::uint64_t>(value, UINT32_MAX));
}

common::Result<Config> config_from_document(const common::TomlDocument &doc) {
  Config config;

  config.session.legacy_mode =
      common::to_lower(doc.get_string("session.legacy_mode", config.session.legacy_mode));

  config.edits.max_batch_edits =
      clamp_u32(doc.get_u64("edits.max_batch_edits", config.edits.max_batch_edits));
  config.edits.max_string_bytes =
      doc.get_u64("edits.max_string_bytes", config.edits.max_string_bytes);
  config.edits.max_file_bytes = doc.get_u64("edits.max_file_bytes", config.edits.max_file_bytes);
  config.edits.strategies = doc.get_string_array("edits.strategies", config.edits.strategies);

  if (doc.has("files.default_mode")) {
    const auto mode = parse_mode(doc.get_string("files.default_mode"));
    if (!mode.has_value()) {
      return common::Result<Config>::failure(common::ErrorCode::InvalidArgument,
                                             "files.default_mode must be an octal string");
    }
    config.files.default_mode = *mode;
  }

  config.sandbox.allowed_commands =
      doc.get_string_array("sandbox.allowed_commands", config.sandbox.allowed_commands);
  config.sandbox.env_allowlist =
      doc.get_string_array("sandbox.env_allowlist", config.sandbox.env_allowlist);
  config.sandbox.default_timeout_ms =
      doc.get_u64("sandbox.default_timeout_ms", config.sandbox.default_timeout_ms);
  config.sandbox.max_timeout_ms =
      doc.get_u64("sandbox.max_timeout_ms", config.sandbox.max_timeout_ms);
  config.sandbox.max_output_bytes =
      doc.get_u64("sandbox.max_output_bytes", config.sandbox.max_output_bytes);
  config.sandbox.worker_threads =
      clamp_u32(doc.get_u64("sandbox.worker_threads", config.sandbox.worker_threads));
  config.sandbox.max_commands_per_minute = clamp_u32(
      doc.get_u64("sandbox.max_commands_per_minute", config.sandbox.max_commands_per_minute));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = ".";
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.detail());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.detail());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const char *mode = std::getenv("WARDEN_LEGACY_MODE"); mode != nullptr && *mode) {
    config.session.legacy_mode = common::to_lower(common::trim(mode));
  }
  if (const char *backend = std::getenv("WARDEN_OBSERVABILITY_BACKEND");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
  if (const auto timeout = env_u64("WARDEN_COMMAND_TIMEOUT_MS"); timeout.has_value()) {
    config.sandbox.default_timeout_ms = *timeout;
  }
  if (const auto workers = env_u64("WARDEN_WORKER_THREADS"); workers.has_value()) {
    config.sandbox.worker_threads = clamp_u32(*workers);
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.detail());
  }
  return config_from_document(parsed.value());
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.detail());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorCode::NotFound,
                                           "Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return common::Result<Config>::failure(config.code(),
                                           path.string() + ": " + config.error());
  }

  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.session.legacy_mode != "deny" && config.session.legacy_mode != "warn") {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "session.legacy_mode must be \"deny\" or \"warn\"");
  }

  if (config.edits.strategies.empty()) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "edits.strategies must name at least one strategy");
  }
  for (const auto &name : config.edits.strategies) {
    const auto &known = known_strategies();
    if (std::find(known.begin(), known.end(), name) == known.end()) {
      return Warnings::failure(common::ErrorCode::InvalidArgument,
                               "Unknown match strategy: " + name);
    }
  }
  if (config.edits.max_batch_edits == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "edits.max_batch_edits must be positive");
  }
  if (config.edits.max_string_bytes == 0 || config.edits.max_file_bytes == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "edits size limits must be positive");
  }

  if (config.files.default_mode > 0777) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "files.default_mode must be a permission mode such as 0644");
  }
  if ((config.files.default_mode & 0002U) != 0) {
    warnings.push_back("files.default_mode makes new files world-writable");
  }

  if (config.sandbox.worker_threads == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "sandbox.worker_threads must be positive");
  }
  if (config.sandbox.default_timeout_ms == 0 ||
      config.sandbox.default_timeout_ms > config.sandbox.max_timeout_ms) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "sandbox.default_timeout_ms must be between 1 and "
                             "sandbox.max_timeout_ms");
  }
  if (config.sandbox.max_output_bytes == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "sandbox.max_output_bytes must be positive");
  }
  for (const auto &command : config.sandbox.allowed_commands) {
    const auto &shells = shell_interpreters();
    if (std::find(shells.begin(), shells.end(), command) != shells.end()) {
      warnings.push_back("sandbox.allowed_commands entry '" + command +
                         "' is a shell interpreter and is always refused");
    }
    if (command.find('/') != std::string::npos) {
      warnings.push_back("sandbox.allowed_commands entry '" + command +
                         "' contains a path separator and can never match");
    }
  }
  if (config.sandbox.max_commands_per_minute == 0) {
    warnings.push_back("sandbox.max_commands_per_minute is 0; command rate limiting is off");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend != "log" && backend != "none" && backend != "noop") {
    warnings.push_back("Unknown observability.backend '" + config.observability.backend +
                       "'; falling back to log");
  }

  return Warnings::success(std::move(warnings));
}

} // namespace warden::config
