#include "warden/security/git_classifier.hpp"

#include "warden/common/fs.hpp"
#include "warden/observability/global.hpp"
#include "warden/security/path_validator.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>

namespace warden::security {

namespace {

const std::set<std::string, std::less<>> READ_ONLY_SUBCOMMANDS = {
    "status", "diff", "log", "show", "rev-parse", "blame", "reflog"};

// Read-only while they only list things.
const std::set<std::string, std::less<>> LISTING_SUBCOMMANDS = {"branch", "tag", "remote"};

const std::set<std::string, std::less<>> MODIFYING_SUBCOMMANDS = {
    "add",   "commit", "checkout", "switch", "merge",  "rebase", "stash",
    "push",  "pull",   "fetch",    "reset",  "revert", "cherry-pick", "clean"};

const std::set<std::string, std::less<>> LONG_VALUE_OPTIONS = {
    "--message", "--file",   "--output", "--output-directory", "--template", "--author",
    "--date",    "--exclude", "--upload-pack", "--receive-pack", "--exec",    "--config"};

const std::map<std::string, std::string, std::less<>> SHORT_VALUE_OPTIONS = {
    {"commit", "mFCct"}, {"tag", "mFu"},   {"log", "n"},    {"push", "o"},
    {"checkout", "bB"},  {"switch", "cC"}, {"merge", "msX"}, {"rebase", "sXx"},
    {"branch", "u"},     {"clean", "e"},   {"revert", "m"}, {"cherry-pick", "m"}};

const std::map<std::string, std::map<std::string, std::vector<std::string>, std::less<>>,
               std::less<>>
    FLAG_ALIASES = {
        {"branch",
         {{"-D", {"--delete", "--force"}},
          {"-d", {"--delete"}},
          {"-M", {"--move", "--force"}},
          {"-m", {"--move"}},
          {"-f", {"--force"}},
          {"-C", {"--copy", "--force"}},
          {"-c", {"--copy"}}}},
        {"push", {{"-f", {"--force"}}, {"-d", {"--delete"}}}},
        {"clean", {{"-f", {"--force"}}}},
        {"checkout", {{"-f", {"--force"}}}},
        {"tag", {{"-f", {"--force"}}, {"-d", {"--delete"}}}},
};

const std::set<std::string, std::less<>> BRANCH_MUTATING_FLAGS = {
    "--delete", "--move",   "--copy",           "--force",         "--set-upstream-to",
    "-u",       "--track",  "--unset-upstream", "--edit-description"};

const std::set<std::string, std::less<>> TAG_MUTATING_FLAGS = {
    "--delete", "--force", "-a", "--annotate", "-s", "--sign", "-m", "--message",
    "-F",       "--file",  "-u", "--local-user"};

const std::set<std::string, std::less<>> LIST_FLAGS = {"-l", "--list"};

const std::set<std::string, std::less<>> PROGRAM_FLAGS = {"--upload-pack", "--receive-pack",
                                                          "--exec", "-c", "--config"};

// Subcommands where `-c` is an ordinary option rather than a config override.
const std::set<std::string, std::less<>> SHORT_C_OPTION_SUBCOMMANDS = {"switch", "branch",
                                                                       "commit"};

const std::set<std::string, std::less<>> PATH_FLAGS = {
    "--output",    "-o",          "--file",     "-F",
    "--git-dir",   "--work-tree", "--template", "--output-directory"};

bool is_numeric_shorthand(std::string_view token) {
  return token.size() > 1 && std::all_of(token.begin() + 1, token.end(), [](const char ch) {
           return std::isdigit(static_cast<unsigned char>(ch)) != 0;
         });
}

bool short_takes_value(const std::string &subcommand, const char option) {
  const auto it = SHORT_VALUE_OPTIONS.find(subcommand);
  return it != SHORT_VALUE_OPTIONS.end() && it->second.find(option) != std::string::npos;
}

// Long options whose abbreviations must resolve before any check runs.
const std::set<std::string, std::less<>> &sensitive_long_options() {
  static const std::set<std::string, std::less<>> options = [] {
    std::set<std::string, std::less<>> all(LONG_VALUE_OPTIONS.begin(), LONG_VALUE_OPTIONS.end());
    for (const auto *flags : {&PROGRAM_FLAGS, &PATH_FLAGS}) {
      for (const auto &flag : *flags) {
        if (common::starts_with(flag, "--")) {
          all.insert(flag);
        }
      }
    }
    return all;
  }();
  return options;
}

// Every sensitive option `name` abbreviates; git accepts any unambiguous prefix.
std::vector<std::string> sensitive_expansions(std::string_view name) {
  std::vector<std::string> expansions;
  if (name.size() <= 2) {
    return expansions;
  }
  for (const auto &option : sensitive_long_options()) {
    if (option.size() > name.size() && common::starts_with(option, name)) {
      expansions.push_back(option);
    }
  }
  return expansions;
}

bool abbreviates_any(std::string_view name, const std::set<std::string, std::less<>> &flags) {
  return std::any_of(flags.begin(), flags.end(), [name](const std::string &flag) {
    return name.size() > 2 && flag.size() > name.size() && common::starts_with(flag, "--") &&
           common::starts_with(flag, name);
  });
}

void add_flag(GitArgSpec &spec, const std::string &flag) {
  spec.canonical_flags.insert(flag);

  if (const auto sub = FLAG_ALIASES.find(spec.subcommand); sub != FLAG_ALIASES.end()) {
    if (const auto alias = sub->second.find(flag); alias != sub->second.end()) {
      spec.canonical_flags.insert(alias->second.begin(), alias->second.end());
    }
  }

  // git accepts unambiguous prefixes of long options; treat a prefix of a
  // destructive flag as that flag.
  if (flag.size() > 2 && common::starts_with(flag, "--")) {
    for (const auto &rule : destructive_rules()) {
      if (rule.subcommand != spec.subcommand) {
        continue;
      }
      for (const auto &required : rule.required_flags) {
        if (required.size() > flag.size() && common::starts_with(required, "--") &&
            common::starts_with(required, flag)) {
          spec.canonical_flags.insert(required);
        }
      }
    }
  }
}

bool has_any(const GitArgSpec &spec, const std::set<std::string, std::less<>> &flags) {
  return std::any_of(spec.canonical_flags.begin(), spec.canonical_flags.end(),
                     [&flags](const std::string &flag) { return flags.contains(flag); });
}

bool has_dotdot_segment(std::string_view value) {
  for (const auto &segment : common::split(value, '/')) {
    if (segment == "..") {
      return true;
    }
  }
  return false;
}

common::Status refuse_flag(const std::string &flag) {
  observability::record_security_violation("git_classifier", "forbidden_flag", flag);
  return common::Status::error(common::ErrorCode::Disallowed,
                               "git flag '" + flag + "' is not allowed");
}

common::Status check_path_argument(const std::string &value,
                                   const std::filesystem::path &project_root) {
  const auto validated = validate_path(value, project_root);
  if (!validated.ok()) {
    return common::Status::error(validated.detail());
  }
  return common::Status::success();
}

} // namespace

std::string_view to_string(const GitSafety safety) {
  switch (safety) {
  case GitSafety::ReadOnly:
    return "read_only";
  case GitSafety::Modifying:
    return "modifying";
  case GitSafety::Destructive:
    return "destructive";
  }
  return "modifying";
}

const std::vector<DestructiveRule> &destructive_rules() {
  static const std::vector<DestructiveRule> rules = {
      {"push", {"--force"}, ""},
      {"push", {"-f"}, ""},
      {"push", {"--force-with-lease"}, ""},
      {"push", {"--force-if-includes"}, ""},
      {"push", {"--delete"}, ""},
      {"push", {"--mirror"}, ""},
      {"push", {"--prune"}, ""},
      {"reset", {"--hard"}, ""},
      {"clean", {"-f"}, ""},
      {"clean", {"--force"}, ""},
      {"branch", {"--delete", "--force"}, ""},
      {"branch", {"-D"}, ""},
      {"branch", {"--move", "--force"}, ""},
      {"branch", {"-M"}, ""},
      {"checkout", {"--force"}, ""},
      {"checkout", {"-f"}, ""},
      {"tag", {"--force"}, ""},
      {"tag", {"-f"}, ""},
      {"stash", {}, "clear"},
      {"stash", {}, "drop"},
  };
  return rules;
}

bool is_known_git_subcommand(const std::string_view subcommand) {
  return READ_ONLY_SUBCOMMANDS.contains(subcommand) || LISTING_SUBCOMMANDS.contains(subcommand) ||
         MODIFYING_SUBCOMMANDS.contains(subcommand);
}

GitArgSpec normalize_git_args(const std::string &subcommand, const std::vector<std::string> &args) {
  GitArgSpec spec;
  spec.subcommand = subcommand;

  bool options_done = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &token = args[i];
    if (options_done || token.size() < 2 || token[0] != '-') {
      spec.positional_args.push_back(token);
      continue;
    }
    if (token == "--") {
      options_done = true;
      continue;
    }

    if (common::starts_with(token, "--")) {
      const auto eq = token.find('=');
      std::string name = token.substr(0, eq);
      if (!sensitive_long_options().contains(name)) {
        const auto expansions = sensitive_expansions(name);
        if (expansions.size() == 1) {
          name = expansions.front();
        } else {
          // Ambiguous against our table: keep every candidate so each check sees it.
          spec.canonical_flags.insert(expansions.begin(), expansions.end());
        }
      }
      std::optional<std::string> value;
      if (eq != std::string::npos) {
        value = token.substr(eq + 1);
      } else if (LONG_VALUE_OPTIONS.contains(name) && i + 1 < args.size()) {
        value = args[++i];
      }
      add_flag(spec, name);
      if (value.has_value()) {
        spec.flag_values.emplace_back(name, *value);
      }
      continue;
    }

    if (is_numeric_shorthand(token)) {
      spec.canonical_flags.insert(token);
      continue;
    }

    // Clustered short options; a value-taking option swallows the rest.
    for (std::size_t j = 1; j < token.size(); ++j) {
      const std::string flag = std::string("-") + token[j];
      add_flag(spec, flag);
      if (short_takes_value(subcommand, token[j])) {
        std::string value = token.substr(j + 1);
        if (value.empty() && i + 1 < args.size()) {
          value = args[++i];
        }
        spec.flag_values.emplace_back(flag, value);
        break;
      }
    }
  }

  if (subcommand == "push") {
    for (const auto &arg : spec.positional_args) {
      if (common::starts_with(arg, "+")) {
        spec.canonical_flags.insert("--force");
      } else if (common::starts_with(arg, ":")) {
        spec.canonical_flags.insert("--delete");
      }
    }
  }
  if (subcommand == "stash" && !spec.positional_args.empty()) {
    spec.action = spec.positional_args.front();
  }
  return spec;
}

GitSafety classify_git(const GitArgSpec &spec) {
  for (const auto &rule : destructive_rules()) {
    if (rule.subcommand != spec.subcommand) {
      continue;
    }
    if (!rule.action.empty()) {
      if (spec.action == rule.action) {
        return GitSafety::Destructive;
      }
      continue;
    }
    if (std::includes(spec.canonical_flags.begin(), spec.canonical_flags.end(),
                      rule.required_flags.begin(), rule.required_flags.end())) {
      return GitSafety::Destructive;
    }
  }

  if (READ_ONLY_SUBCOMMANDS.contains(spec.subcommand)) {
    return GitSafety::ReadOnly;
  }
  if (LISTING_SUBCOMMANDS.contains(spec.subcommand)) {
    const bool listing = has_any(spec, LIST_FLAGS);
    if (spec.subcommand == "branch" &&
        (has_any(spec, BRANCH_MUTATING_FLAGS) || (!spec.positional_args.empty() && !listing))) {
      return GitSafety::Modifying;
    }
    if (spec.subcommand == "tag" &&
        (has_any(spec, TAG_MUTATING_FLAGS) || (!spec.positional_args.empty() && !listing))) {
      return GitSafety::Modifying;
    }
    if (spec.subcommand == "remote" && !spec.positional_args.empty()) {
      return GitSafety::Modifying;
    }
    return GitSafety::ReadOnly;
  }
  return GitSafety::Modifying;
}

GitSafety classify_git(const std::string &subcommand, const std::vector<std::string> &args) {
  return classify_git(normalize_git_args(subcommand, args));
}

common::Status validate_git_args(const GitArgSpec &spec,
                                 const std::filesystem::path &project_root) {
  for (const auto &flag : spec.canonical_flags) {
    if (flag == "-c" && SHORT_C_OPTION_SUBCOMMANDS.contains(spec.subcommand)) {
      continue;
    }
    if (PROGRAM_FLAGS.contains(flag)) {
      return refuse_flag(flag);
    }
    if (spec.subcommand == "rebase" && flag == "-x") {
      return refuse_flag(flag);
    }
  }

  for (const auto &[flag, value] : spec.flag_values) {
    if (!PATH_FLAGS.contains(flag) && !abbreviates_any(flag, PATH_FLAGS)) {
      continue;
    }
    if (value.empty()) {
      continue;
    }
    if (auto status = check_path_argument(value, project_root); !status.ok()) {
      return status;
    }
  }

  for (const auto &arg : spec.positional_args) {
    const bool absolute = !arg.empty() && arg.front() == '/';
    if (!absolute && !has_dotdot_segment(arg)) {
      continue;
    }
    if (auto status = check_path_argument(arg, project_root); !status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

} // namespace warden::security
