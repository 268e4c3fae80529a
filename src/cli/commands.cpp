#include "warden/cli/commands.hpp"

#include "warden/common/fs.hpp"
#include "warden/config/config.hpp"
#include "warden/observability/global.hpp"
#include "warden/runtime/app.hpp"
#include "warden/security/git_classifier.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace warden::cli {

namespace {

std::string version_string() {
#ifdef WARDEN_VERSION
  std::string version = WARDEN_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "warden " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

int run_serve(std::vector<std::string> args) {
  std::string root;
  std::string session_id = "main";
  (void)take_option(args, "--root", "-r", root);
  (void)take_option(args, "--session", "-s", session_id);
  if (root.empty()) {
    std::cerr << "usage: warden serve --root DIR [--session ID]\n";
    return 1;
  }

  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  context.value().install_observer();

  auto dispatcher = context.value().create_dispatcher();
  if (!dispatcher.ok()) {
    std::cerr << dispatcher.error() << "\n";
    return 1;
  }
  auto session = context.value().create_session(session_id, common::expand_path(root));
  if (!session.ok()) {
    std::cerr << session.error() << ": " << root << "\n";
    return 1;
  }

  const tools::ToolContext ctx{.workspace_path = session.value()->project_root(),
                               .session_id = session.value()->id(),
                               .session = session.value().get()};
  std::string line;
  while (std::getline(std::cin, line)) {
    if (common::trim(line).empty()) {
      continue;
    }
    std::cout << dispatcher.value()->handle_line(line, ctx).to_json() << "\n" << std::flush;
  }
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 0;
}

int run_classify(const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "usage: warden classify <subcommand> [args...]\n";
    return 1;
  }
  if (!security::is_known_git_subcommand(args[0])) {
    std::cout << "disallowed\n";
    return 0;
  }
  const std::vector<std::string> rest(args.begin() + 1, args.end());
  std::cout << security::to_string(security::classify_git(args[0], rest)) << "\n";
  return 0;
}

int run_tools() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto editor = context.value().create_file_editor();
  if (!editor.ok()) {
    std::cerr << editor.error() << "\n";
    return 1;
  }
  const auto registry =
      tools::ToolRegistry::create_default(editor.value(), context.value().create_sandbox());
  for (const auto &spec : registry.all_specs()) {
    std::cout << spec.name << "  " << spec.description << "\n";
  }
  return 0;
}

int run_check_config() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return 1;
  }
  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    std::cerr << "invalid config: " << validated.error() << "\n";
    return 1;
  }
  for (const auto &warning : validated.value()) {
    std::cout << "warning: " << warning << "\n";
  }
  std::cout << "config ok\n";
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: warden [--config PATH] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  serve --root DIR [--session ID]  Read JSON tool requests from stdin, one per line\n";
  std::cout << "  classify <subcommand> [args...]  Print the safety class of a git invocation\n";
  std::cout << "  tools                            List available tools\n";
  std::cout << "  check-config                     Validate the configuration file\n";
  std::cout << "  config-path                      Print the configuration file location\n";
  std::cout << "  version                          Show version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "classify") {
    return run_classify(args);
  }
  if (subcommand == "tools") {
    return run_tools();
  }
  if (subcommand == "check-config") {
    return run_check_config();
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace warden::cli
