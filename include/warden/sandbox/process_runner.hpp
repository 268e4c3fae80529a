#pragma once

#include "warden/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace warden::sandbox {

struct ProcessSpec {
  // Absolute path; no PATH lookup happens in the child.
  std::filesystem::path executable;
  // argv[0] included.
  std::vector<std::string> argv;
  // "NAME=value" entries; the child inherits nothing else.
  std::vector<std::string> environment;
  std::filesystem::path working_dir;
  std::chrono::milliseconds timeout{25'000};
  std::size_t max_output_bytes = 1024 * 1024;
};

struct ProcessResult {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  bool truncated = false;
  bool timed_out = false;
};

class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;
  /// A timeout is reported through `ProcessResult::timed_out`; errors are
  /// reserved for failing to start the process at all.
  [[nodiscard]] virtual common::Result<ProcessResult> run(const ProcessSpec &spec) = 0;
};

/// fork/execve runner. The child leads its own process group.
class PosixProcessRunner final : public IProcessRunner {
public:
  [[nodiscard]] common::Result<ProcessResult> run(const ProcessSpec &spec) override;
};

} // namespace warden::sandbox
