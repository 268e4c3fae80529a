#pragma once

#include "warden/common/result.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::security {

enum class GitSafety {
  ReadOnly,
  Modifying,
  Destructive,
};

[[nodiscard]] std::string_view to_string(GitSafety safety);

/// Canonical form of one git invocation. Every spelling of a flag
/// (`-fd`, `--force`, `--for`, `branch -D`, `--exe`) lands in
/// `canonical_flags` as the names the checks use.
struct GitArgSpec {
  std::string subcommand;
  std::set<std::string> canonical_flags;
  std::vector<std::string> positional_args;
  // Values attached to flags, in order, keyed by the canonical flag.
  std::vector<std::pair<std::string, std::string>> flag_values;
  // First positional for subcommands that take an action word (`stash drop`).
  std::string action;
};

/// Destructive when every flag in `required_flags` is present, or when the
/// rule names an `action` and the invocation performs it.
struct DestructiveRule {
  std::string subcommand;
  std::set<std::string> required_flags;
  std::string action;
};

[[nodiscard]] const std::vector<DestructiveRule> &destructive_rules();

[[nodiscard]] bool is_known_git_subcommand(std::string_view subcommand);

[[nodiscard]] GitArgSpec normalize_git_args(const std::string &subcommand,
                                            const std::vector<std::string> &args);

[[nodiscard]] GitSafety classify_git(const GitArgSpec &spec);
[[nodiscard]] GitSafety classify_git(const std::string &subcommand,
                                     const std::vector<std::string> &args);

/// Refuses flags that make git run other programs (Disallowed) and checks
/// path-bearing flag values and path-like positionals against `project_root`.
[[nodiscard]] common::Status validate_git_args(const GitArgSpec &spec,
                                               const std::filesystem::path &project_root);

} // namespace warden::security
