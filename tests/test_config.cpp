#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "warden/config/config.hpp"

#include <cstdlib>
#include <optional>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(const std::filesystem::path &path) {
    warden::config::set_config_path_override(path);
  }
  ~ConfigOverrideGuard() { warden::config::clear_config_path_override(); }
};

bool has_warning(const std::vector<std::string> &warnings, const std::string &needle) {
  for (const auto &warning : warnings) {
    if (warning.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

void register_config_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;
  namespace cfg = warden::config;

  tests.push_back({"config_defaults_are_valid", [] {
                     const cfg::Config config;
                     require(config.session.legacy_mode == "deny", "legacy mode defaults to deny");
                     require(config.edits.max_batch_edits == 100, "batch cap");
                     require(config.edits.max_string_bytes == 512 * 1024, "string cap");
                     require(config.sandbox.default_timeout_ms == 25'000, "timeout");
                     const auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(validated.value().empty(), "defaults should not warn");
                   }});

  tests.push_back({"config_parse_reads_every_section", [] {
                     const auto parsed = cfg::parse_config("[session]\n"
                                                           "legacy_mode = \"WARN\"\n"
                                                           "[edits]\n"
                                                           "max_batch_edits = 5\n"
                                                           "strategies = [\"exact\", \"fuzzy\"]\n"
                                                           "[files]\n"
                                                           "default_mode = \"0600\"\n"
                                                           "[sandbox]\n"
                                                           "allowed_commands = [\"git\"]\n"
                                                           "default_timeout_ms = 1000\n"
                                                           "max_commands_per_minute = 3\n"
                                                           "[observability]\n"
                                                           "backend = \"none\"\n");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.session.legacy_mode == "warn", "legacy mode is lowercased");
                     require(config.edits.max_batch_edits == 5, "batch cap");
                     require(config.edits.strategies.size() == 2, "strategies");
                     require(config.files.default_mode == 0600, "octal mode");
                     require(config.sandbox.allowed_commands.size() == 1, "allowlist");
                     require(config.sandbox.default_timeout_ms == 1000, "timeout");
                     require(config.sandbox.max_commands_per_minute == 3, "rate limit");
                     require(config.observability.backend == "none", "backend");
                   }});

  tests.push_back({"config_rejects_non_octal_mode", [] {
                     const auto parsed = cfg::parse_config("[files]\ndefault_mode = \"rw-r--r--\"\n");
                     require(!parsed.ok(), "mode should fail");
                     require(parsed.code() == warden::common::ErrorCode::InvalidArgument, "code");
                   }});

  tests.push_back({"config_validate_rejects_unusable_settings", [] {
                     cfg::Config config;
                     config.session.legacy_mode = "allow";
                     require(!cfg::validate_config(config).ok(), "unknown legacy mode");

                     config = cfg::Config{};
                     config.edits.strategies = {"exact", "regex"};
                     const auto strategies = cfg::validate_config(config);
                     require(!strategies.ok(), "unknown strategy");
                     require(strategies.error().find("regex") != std::string::npos, "names it");

                     config = cfg::Config{};
                     config.sandbox.default_timeout_ms = 200'000;
                     require(!cfg::validate_config(config).ok(), "timeout above max");

                     config = cfg::Config{};
                     config.sandbox.worker_threads = 0;
                     require(!cfg::validate_config(config).ok(), "no workers");
                   }});

  tests.push_back({"config_validate_warns_on_suspicious_settings", [] {
                     cfg::Config config;
                     config.files.default_mode = 0666;
                     config.sandbox.allowed_commands.push_back("bash");
                     config.sandbox.allowed_commands.push_back("/usr/bin/git");
                     config.observability.backend = "prometheus";
                     const auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     const auto &warnings = validated.value();
                     require(has_warning(warnings, "world-writable"), "mode warning");
                     require(has_warning(warnings, "'bash'"), "shell warning");
                     require(has_warning(warnings, "path separator"), "path warning");
                     require(has_warning(warnings, "prometheus"), "backend warning");
                   }});

  tests.push_back({"config_env_overrides_apply", [] {
                     const EnvGuard mode("WARDEN_LEGACY_MODE", std::string(" Warn "));
                     const EnvGuard timeout("WARDEN_COMMAND_TIMEOUT_MS", std::string("1500"));
                     const EnvGuard workers("WARDEN_WORKER_THREADS", std::string("not-a-number"));
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.session.legacy_mode == "warn", "legacy mode");
                     require(config.sandbox.default_timeout_ms == 1500, "timeout");
                     require(config.sandbox.worker_threads == 4, "bad numbers are ignored");
                   }});

  tests.push_back({"config_load_uses_override_path", [] {
                     warden::testing::TempWorkspace workspace;
                     workspace.create_file("config.toml", "[sandbox]\nworker_threads = 7\n");
                     const ConfigOverrideGuard guard(workspace.path());
                     const EnvGuard workers("WARDEN_WORKER_THREADS", std::nullopt);

                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == workspace.path() / "config.toml",
                             "directory override resolves to config.toml");
                     require(cfg::config_exists(), "config should exist");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().sandbox.worker_threads == 7, "file value");
                   }});

  tests.push_back({"config_load_without_file_returns_defaults", [] {
                     warden::testing::TempWorkspace workspace;
                     const ConfigOverrideGuard guard(workspace.path() / "missing.toml");
                     const EnvGuard mode("WARDEN_LEGACY_MODE", std::nullopt);
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().session.legacy_mode == "deny", "default mode");
                   }});

  tests.push_back({"config_load_reports_parse_errors_with_path", [] {
                     warden::testing::TempWorkspace workspace;
                     workspace.create_file("bad.toml", "[edits\n");
                     const ConfigOverrideGuard guard(workspace.path() / "bad.toml");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "broken file should fail");
                     require(loaded.error().find("bad.toml") != std::string::npos,
                             "error names the file");
                   }});
}
