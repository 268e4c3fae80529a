#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "warden/sandbox/command_sandbox.hpp"
#include "warden/sandbox/process_runner.hpp"
#include "warden/sandbox/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <ctime>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <thread>

namespace {

using warden::common::ErrorCode;

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

class FakeProcessRunner final : public warden::sandbox::IProcessRunner {
public:
  warden::common::Result<warden::sandbox::ProcessResult>
  run(const warden::sandbox::ProcessSpec &spec) override {
    ++spawns;
    last_spec = spec;
    return warden::common::Result<warden::sandbox::ProcessResult>::success(result);
  }

  std::atomic<int> spawns{0};
  warden::sandbox::ProcessSpec last_spec;
  warden::sandbox::ProcessResult result{.exit_code = 0, .stdout_text = "ok\n"};
};

warden::sandbox::SandboxOptions test_options() {
  return warden::sandbox::sandbox_options_from_config(warden::testing::mock_config().sandbox);
}

std::shared_ptr<warden::sessions::SessionContext> make_session(const std::filesystem::path &root,
                                                               std::uint32_t per_minute = 60) {
  auto session = warden::sessions::SessionContext::create("sandbox-session", root, per_minute);
  if (!session.ok()) {
    throw std::runtime_error(session.error());
  }
  return session.value();
}

warden::sandbox::CommandRequest request(std::string program, std::vector<std::string> args,
                                        bool allow_destructive = false) {
  warden::sandbox::CommandRequest req;
  req.program = std::move(program);
  req.args = std::move(args);
  req.allow_destructive = allow_destructive;
  return req;
}

bool has_env(const std::vector<std::string> &env, const std::string &entry) {
  return std::find(env.begin(), env.end(), entry) != env.end();
}

bool has_env_name(const std::vector<std::string> &env, const std::string &name) {
  return std::any_of(env.begin(), env.end(),
                     [&name](const std::string &entry) { return entry.rfind(name + "=", 0) == 0; });
}

} // namespace

void register_sandbox_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;
  namespace sandbox = warden::sandbox;

  tests.push_back({"sandbox_refuses_programs_outside_the_allowlist", [] {
                     warden::testing::ObserverGuard guard;
                     warden::testing::TempWorkspace workspace;
                     const auto runner = std::make_shared<FakeProcessRunner>();
                     const sandbox::CommandSandbox box(test_options(), runner);
                     const auto root = workspace.path();

                     require(box.check(request("bash", {"-c", "ls"}), root).code() ==
                                 ErrorCode::Disallowed,
                             "shell");
                     require(box.check(request("/bin/ls", {}), root).code() == ErrorCode::Disallowed,
                             "path to program");
                     require(box.check(request("env", {"ls"}), root).code() == ErrorCode::Disallowed,
                             "wrapper");
                     require(box.check(request("curl", {"example.com"}), root).code() ==
                                 ErrorCode::Disallowed,
                             "not allowlisted");
                     require(box.check(request("", {}), root).code() == ErrorCode::InvalidArgument,
                             "empty");
                     require(box.check(request("ls", {"-la"}), root).ok(), "ls allowed");
                     require(guard.observer().violations().size() == 4, "each refusal recorded");
                   }});

  tests.push_back({"sandbox_checks_arguments_against_root", [] {
                     warden::testing::TempWorkspace workspace;
                     const sandbox::CommandSandbox box(test_options(),
                                                       std::make_shared<FakeProcessRunner>());
                     const auto root = workspace.path();
                     require(box.check(request("cat", {"../secret"}), root).code() ==
                                 ErrorCode::PathTraversal,
                             "relative escape");
                     require(box.check(request("cat", {"/etc/passwd"}), root).code() ==
                                 ErrorCode::PathTraversal,
                             "absolute outside");
                     require(box.check(request("grep", {"--file=/etc/shadow", "x"}), root).code() ==
                                 ErrorCode::PathTraversal,
                             "path in a flag value");
                     require(box.check(request("diff", {"a.txt", "/dev/null"}), root).ok(),
                             "/dev/null is fine");
                     require(box.check(request("find", {".", "-exec", "rm", "{}", ";"}), root)
                                     .code() == ErrorCode::Disallowed,
                             "find -exec");
                   }});

  tests.push_back({"sandbox_git_checks", [] {
                     warden::testing::TempWorkspace workspace;
                     const sandbox::CommandSandbox box(test_options(),
                                                       std::make_shared<FakeProcessRunner>());
                     const auto root = workspace.path();
                     require(box.check(request("git", {}), root).code() == ErrorCode::InvalidArgument,
                             "no subcommand");
                     require(box.check(request("git", {"-C", "/", "status"}), root).code() ==
                                 ErrorCode::Disallowed,
                             "global options");
                     require(box.check(request("git", {"filter-branch"}), root).code() ==
                                 ErrorCode::Disallowed,
                             "unknown subcommand");
                     const auto refused = box.check(request("git", {"reset", "--hard"}), root);
                     require(refused.code() == ErrorCode::DestructiveRefused, "destructive");
                     require(refused.error() == "Refusing destructive command: git reset --hard. "
                                                "Set allow_destructive to run it.",
                             "message");
                     require(box.check(request("git", {"reset", "--hard"}, true), root).ok(),
                             "explicitly allowed");
                     require(box.check(request("git", {"status"}), root).ok(), "status");
                   }});

  tests.push_back({"sandbox_git_abbreviated_options_are_refused", [] {
                     warden::testing::TempWorkspace workspace;
                     const auto runner = std::make_shared<FakeProcessRunner>();
                     sandbox::CommandSandbox box(test_options(), runner);
                     const auto session = make_session(workspace.path());
                     const std::vector<std::vector<std::string>> attempts = {
                         {"rebase", "--exe=touch /tmp/warden-owned", "HEAD~1"},
                         {"fetch", "--upload-pa=touch /tmp/warden-owned; git-upload-pack", "."},
                         {"pull", "--upload-pa", "touch /tmp/warden-owned", "origin"},
                         {"push", "--receive-pa=touch /tmp/warden-owned", "origin"},
                     };
                     for (const auto &args : attempts) {
                       const auto result = box.execute(request("git", args), *session);
                       require(result.code() == ErrorCode::Disallowed, args.front() + " " + args[1]);
                     }
                     const auto file = box.execute(
                         request("git", {"commit", "--fil=/etc/passwd"}), *session);
                     require(file.code() == ErrorCode::PathTraversal, "--fil outside the root");
                     const auto tag = box.execute(
                         request("git", {"tag", "-a", "v1", "--fil", "/etc/passwd"}), *session);
                     require(tag.code() == ErrorCode::PathTraversal, "--fil with a separate value");
                     require(runner->spawns == 0, "nothing ran");
                   }});

  tests.push_back({"sandbox_destructive_refusal_spawns_nothing", [] {
                     warden::testing::TempWorkspace workspace;
                     const auto runner = std::make_shared<FakeProcessRunner>();
                     sandbox::CommandSandbox box(test_options(), runner);
                     const auto session = make_session(workspace.path());
                     const auto result = box.execute(request("git", {"clean", "-fd"}), *session);
                     require(result.code() == ErrorCode::DestructiveRefused, "refused");
                     require(runner->spawns == 0, "no process started");
                   }});

  tests.push_back({"sandbox_execute_builds_the_process_spec", [] {
                     warden::testing::ObserverGuard guard;
                     warden::testing::TempWorkspace workspace;
                     warden::testing::TempWorkspace bin;
                     bin.create_file("git", "#!/bin/sh\n");
                     std::filesystem::permissions(bin.path() / "git",
                                                  std::filesystem::perms::owner_all);
                     const EnvGuard path("PATH", bin.path().string());
                     const auto runner = std::make_shared<FakeProcessRunner>();
                     sandbox::CommandSandbox box(test_options(), runner);
                     const auto session = make_session(workspace.path());

                     auto req = request("git", {"push", "--force"}, true);
                     req.timeout = std::chrono::milliseconds(999'999);
                     const auto result = box.execute(req, *session);
                     require(result.ok(), result.error());
                     require(runner->spawns == 1, "one spawn");
                     require(result.value().stdout_text == "ok\n", "output passed through");
                     require(result.value().git_safety == warden::security::GitSafety::Destructive,
                             "classification reported");

                     const auto &spec = runner->last_spec;
                     require(spec.executable == bin.path() / "git", "resolved through PATH");
                     require(spec.argv == std::vector<std::string>{"git", "push", "--force"}, "argv");
                     require(spec.working_dir == session->project_root(), "cwd is the root");
                     require(spec.timeout == std::chrono::milliseconds(10'000), "timeout clamped");
                     require(guard.observer().commands().size() == 1, "command recorded");
                   }});

  tests.push_back({"sandbox_environment_is_an_allowlist", [] {
                     const EnvGuard secret("WARDEN_TEST_SECRET_TOKEN", std::string("hunter2"));
                     const EnvGuard lang("LANG", std::string("de_DE.UTF-8"));
                     const EnvGuard tz("TZ", std::string("UTC"));
                     const sandbox::CommandSandbox box(test_options(),
                                                       std::make_shared<FakeProcessRunner>());
                     const auto env = box.sanitized_environment();
                     require(!has_env_name(env, "WARDEN_TEST_SECRET_TOKEN"), "secret dropped");
                     require(has_env(env, "TZ=UTC"), "allowlisted value kept");
                     require(has_env(env, "LANG=C.UTF-8"), "LANG is fixed");
                     require(!has_env(env, "LANG=de_DE.UTF-8"), "caller LANG ignored");
                     require(has_env(env, "GIT_TERMINAL_PROMPT=0"), "no git prompts");
                     require(has_env_name(env, "PATH"), "PATH present");
                   }});

  tests.push_back({"sandbox_default_path_when_unset", [] {
                     const EnvGuard path("PATH", std::nullopt);
                     const sandbox::CommandSandbox box(test_options(),
                                                       std::make_shared<FakeProcessRunner>());
                     require(has_env(box.sanitized_environment(), "PATH=/usr/local/bin:/usr/bin:/bin"),
                             "fallback PATH");
                     require(box.resolve_executable("no-such-program-warden").code() ==
                                 ErrorCode::NotFound,
                             "missing program");
                   }});

  tests.push_back({"sandbox_effective_timeout", [] {
                     const sandbox::CommandSandbox box(test_options(),
                                                       std::make_shared<FakeProcessRunner>());
                     require(box.effective_timeout(std::nullopt) == std::chrono::milliseconds(5'000),
                             "default");
                     require(box.effective_timeout(std::chrono::milliseconds(0)) ==
                                 std::chrono::milliseconds(5'000),
                             "zero means default");
                     require(box.effective_timeout(std::chrono::milliseconds(200)) ==
                                 std::chrono::milliseconds(200),
                             "requested");
                     require(box.effective_timeout(std::chrono::milliseconds(60'000)) ==
                                 std::chrono::milliseconds(10'000),
                             "clamped");
                   }});

  tests.push_back({"sandbox_rate_limits_per_session", [] {
                     warden::testing::TempWorkspace workspace;
                     const auto runner = std::make_shared<FakeProcessRunner>();
                     sandbox::CommandSandbox box(test_options(), runner);
                     const auto limited = make_session(workspace.path(), 2);
                     const auto other = make_session(workspace.path(), 2);
                     require(box.execute(request("ls", {}), *limited).ok(), "first");
                     require(box.execute(request("ls", {}), *limited).ok(), "second");
                     const auto third = box.execute(request("ls", {}), *limited);
                     require(third.code() == ErrorCode::CapExceeded, "third refused");
                     require(box.execute(request("ls", {}), *other).ok(),
                             "other sessions are unaffected");
                     require(runner->spawns == 3, "refusal spawns nothing");
                   }});

  tests.push_back({"sandbox_reports_timeout_and_truncation", [] {
                     warden::testing::TempWorkspace workspace;
                     auto options = test_options();
                     options.max_output_bytes = 4;
                     const auto runner = std::make_shared<FakeProcessRunner>();
                     sandbox::CommandSandbox box(options, runner);
                     const auto session = make_session(workspace.path());

                     runner->result = sandbox::ProcessResult{
                         .exit_code = 0, .stdout_text = "abcd", .truncated = true};
                     const auto truncated = box.execute(request("cat", {"big.txt"}), *session);
                     require(truncated.ok(), truncated.error());
                     require(truncated.value().truncated, "flag");
                     require(truncated.value().stdout_text ==
                                 "abcd" + std::string(sandbox::TRUNCATION_MARKER),
                             "marker appended");

                     runner->result = sandbox::ProcessResult{.exit_code = -1, .timed_out = true};
                     auto slow = request("sleep", {"100"});
                     slow.timeout = std::chrono::milliseconds(250);
                     const auto timed_out = box.execute(slow, *session);
                     require(timed_out.code() == ErrorCode::TimedOut, "timed out");
                     require(timed_out.error() == "Command timed out after 250ms", "message");
                   }});

  tests.push_back({"posix_runner_runs_in_root_with_clean_env", [] {
                     warden::testing::TempWorkspace workspace;
                     sandbox::CommandSandbox box(test_options(),
                                                 std::make_shared<sandbox::PosixProcessRunner>());
                     const auto session = make_session(workspace.path());

                     const auto echo = box.execute(request("echo", {"hello", "world"}), *session);
                     require(echo.ok(), echo.error());
                     require(echo.value().exit_code == 0, "exit code");
                     require(echo.value().stdout_text == "hello world\n", "stdout");

                     const auto pwd = box.execute(request("pwd", {}), *session);
                     require(pwd.ok(), pwd.error());
                     require(pwd.value().stdout_text == session->project_root().string() + "\n",
                             "runs in the project root");

                     const auto failing = box.execute(request("false", {}), *session);
                     require(failing.ok(), failing.error());
                     require(failing.value().exit_code == 1, "non-zero exit is not an error");
                   }});

  tests.push_back({"posix_runner_caps_output", [] {
                     warden::testing::TempWorkspace workspace;
                     workspace.create_file("big.txt", std::string(10'000, 'x'));
                     auto options = test_options();
                     options.max_output_bytes = 64;
                     sandbox::CommandSandbox box(options,
                                                 std::make_shared<sandbox::PosixProcessRunner>());
                     const auto session = make_session(workspace.path());
                     const auto result = box.execute(request("cat", {"big.txt"}), *session);
                     require(result.ok(), result.error());
                     require(result.value().truncated, "truncated");
                     require(result.value().stdout_text ==
                                 std::string(64, 'x') + std::string(sandbox::TRUNCATION_MARKER),
                             "capped output with marker");
                   }});

  tests.push_back({"posix_runner_kills_on_timeout", [] {
                     warden::testing::TempWorkspace workspace;
                     sandbox::CommandSandbox box(test_options(),
                                                 std::make_shared<sandbox::PosixProcessRunner>());
                     const auto session = make_session(workspace.path());
                     auto slow = request("sleep", {"30"});
                     slow.timeout = std::chrono::milliseconds(200);
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = box.execute(slow, *session);
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(result.code() == ErrorCode::TimedOut, "timed out");
                     require(elapsed < std::chrono::seconds(5), "killed promptly");
                   }});

  tests.push_back({"posix_runner_idles_after_child_closes_its_output", [] {
                     warden::testing::TempWorkspace workspace;
                     sandbox::PosixProcessRunner runner;
                     sandbox::ProcessSpec spec;
                     spec.executable = "/bin/sh";
                     spec.argv = {"sh", "-c", "exec >&- 2>&-; sleep 1"};
                     spec.environment = {"PATH=/usr/bin:/bin"};
                     spec.working_dir = workspace.path();
                     spec.timeout = std::chrono::milliseconds(5000);
                     spec.max_output_bytes = 1024;
                     const std::clock_t cpu_before = std::clock();
                     const auto result = runner.run(spec);
                     const double cpu_seconds =
                         static_cast<double>(std::clock() - cpu_before) / CLOCKS_PER_SEC;
                     require(result.ok(), result.error());
                     require(result.value().exit_code == 0 && !result.value().timed_out, "exited");
                     require(cpu_seconds < 0.4, "waits without spinning");
                   }});

  tests.push_back({"worker_pool_bounds_concurrency", [] {
                     sandbox::WorkerPool pool(2);
                     require(pool.size() == 2, "two threads");
                     std::atomic<int> running{0};
                     std::atomic<int> peak{0};
                     std::vector<std::future<int>> futures;
                     for (int i = 0; i < 6; ++i) {
                       auto submitted = pool.submit([&running, &peak, i] {
                         const int now = ++running;
                         int expected = peak.load();
                         while (now > expected && !peak.compare_exchange_weak(expected, now)) {
                         }
                         std::this_thread::sleep_for(std::chrono::milliseconds(20));
                         --running;
                         return i;
                       });
                       require(submitted.ok(), submitted.error());
                       futures.push_back(std::move(submitted.value()));
                     }
                     int sum = 0;
                     for (auto &future : futures) {
                       sum += future.get();
                     }
                     require(sum == 15, "every task ran");
                     require(peak.load() <= 2, "never more than the pool size");
                   }});

  tests.push_back({"worker_pool_refuses_after_shutdown", [] {
                     sandbox::WorkerPool pool(1);
                     pool.shutdown();
                     const auto submitted = pool.submit([] { return 1; });
                     require(!submitted.ok(), "shut down");
                   }});
}
