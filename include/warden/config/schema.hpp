#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace warden::config {

struct SessionConfig {
  // "deny" rejects writes that arrive without a session; "warn" logs and allows.
  std::string legacy_mode = "deny";
};

struct EditsConfig {
  std::uint32_t max_batch_edits = 100;
  std::uint64_t max_string_bytes = 512ULL * 1024;
  std::uint64_t max_file_bytes = 10ULL * 1024 * 1024;
  std::vector<std::string> strategies = {"exact", "line_trimmed", "whitespace_normalized",
                                         "indentation_flexible", "fuzzy"};
};

struct FilesConfig {
  std::uint32_t default_mode = 0644;
};

struct SandboxConfig {
  std::vector<std::string> allowed_commands = {
      "git",  "make", "cmake", "ninja", "cargo", "rustc", "go",    "python", "python3",
      "pip",  "pip3", "node",  "npm",   "npx",   "yarn",  "pnpm",  "ls",     "cat",
      "head", "tail", "grep",  "find",  "wc",    "diff",  "sort",  "uniq",   "test",
      "true", "false", "echo", "printf", "pwd",  "mkdir", "rmdir", "cp",     "mv",
      "ln",   "touch", "rm",   "date",  "sleep"};
  std::vector<std::string> env_allowlist = {"PATH", "LANG", "LC_ALL", "TZ"};
  std::uint64_t default_timeout_ms = 25'000;
  std::uint64_t max_timeout_ms = 120'000;
  std::uint64_t max_output_bytes = 1024ULL * 1024;
  std::uint32_t worker_threads = 4;
  std::uint32_t max_commands_per_minute = 60;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  SessionConfig session;
  EditsConfig edits;
  FilesConfig files;
  SandboxConfig sandbox;
  ObservabilityConfig observability;
};

} // namespace warden::config
