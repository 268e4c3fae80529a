#include "warden/sandbox/process_runner.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace warden::sandbox {

namespace {

class Pipe {
public:
  Pipe() = default;
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;
  ~Pipe() {
    close_read();
    close_write();
  }

  [[nodiscard]] bool open() { return pipe2(fds_, O_CLOEXEC) == 0; }
  [[nodiscard]] int read_end() const { return fds_[0]; }
  [[nodiscard]] int write_end() const { return fds_[1]; }

  void close_read() {
    if (fds_[0] >= 0) {
      ::close(fds_[0]);
      fds_[0] = -1;
    }
  }
  void close_write() {
    if (fds_[1] >= 0) {
      ::close(fds_[1]);
      fds_[1] = -1;
    }
  }

private:
  int fds_[2] = {-1, -1};
};

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

// Drains whatever is available. Bytes past `cap` are read and dropped so the
// child never blocks on a full pipe. Returns false once the writer is gone.
bool read_into_buffer(const int fd, std::string &buffer, const std::size_t cap, bool &truncated) {
  if (fd < 0) {
    return false;
  }
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      const auto count = static_cast<std::size_t>(bytes);
      if (buffer.size() < cap) {
        const std::size_t room = cap - buffer.size();
        buffer.append(chunk.data(), std::min(room, count));
        truncated = truncated || count > room;
      } else {
        truncated = true;
      }
      continue;
    }
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    return bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK);
  }
}

void drain(Pipe &pipe, std::string &buffer, const std::size_t cap, bool &truncated) {
  if (!read_into_buffer(pipe.read_end(), buffer, cap, truncated)) {
    // poll() skips negative descriptors, so a closed stream stops waking us.
    pipe.close_read();
  }
}

std::vector<char *> to_c_strings(const std::vector<std::string> &values) {
  std::vector<char *> out;
  out.reserve(values.size() + 1);
  for (const auto &value : values) {
    out.push_back(const_cast<char *>(value.c_str()));
  }
  out.push_back(nullptr);
  return out;
}

int decode_status(const int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

common::Result<ProcessResult> PosixProcessRunner::run(const ProcessSpec &spec) {
  if (spec.argv.empty()) {
    return common::Result<ProcessResult>::failure(common::ErrorCode::InvalidArgument,
                                                  "command is empty");
  }

  // Everything the child touches is prepared before fork.
  const std::string executable = spec.executable.string();
  const std::string working_dir = spec.working_dir.string();
  auto argv = to_c_strings(spec.argv);
  auto envp = to_c_strings(spec.environment);

  Pipe out_pipe;
  Pipe err_pipe;
  if (!out_pipe.open() || !err_pipe.open()) {
    return common::Result<ProcessResult>::failure("failed to create pipes for command");
  }

  const pid_t pid = fork();
  if (pid < 0) {
    return common::Result<ProcessResult>::failure("failed to start command");
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      (void)dup2(devnull, STDIN_FILENO);
    }
    (void)dup2(out_pipe.write_end(), STDOUT_FILENO);
    (void)dup2(err_pipe.write_end(), STDERR_FILENO);
    if (chdir(working_dir.c_str()) != 0) {
      _exit(126);
    }
    execve(executable.c_str(), argv.data(), envp.data());
    _exit(127);
  }

  (void)setpgid(pid, pid);
  out_pipe.close_write();
  err_pipe.close_write();
  set_non_blocking(out_pipe.read_end());
  set_non_blocking(err_pipe.read_end());

  ProcessResult result;
  int status = 0;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    drain(out_pipe, result.stdout_text, spec.max_output_bytes, result.truncated);
    drain(err_pipe, result.stderr_text, spec.max_output_bytes, result.truncated);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited < 0 && errno != EINTR) {
      (void)kill(-pid, SIGKILL);
      return common::Result<ProcessResult>::failure("failed to wait for command");
    }

    if (std::chrono::steady_clock::now() - started > spec.timeout) {
      result.timed_out = true;
      (void)kill(-pid, SIGKILL);
      while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = out_pipe.read_end(), .events = POLLIN, .revents = 0},
        {.fd = err_pipe.read_end(), .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  // Background children of the command do not outlive it.
  (void)kill(-pid, SIGKILL);

  drain(out_pipe, result.stdout_text, spec.max_output_bytes, result.truncated);
  drain(err_pipe, result.stderr_text, spec.max_output_bytes, result.truncated);

  result.exit_code = result.timed_out ? -1 : decode_status(status);
  return common::Result<ProcessResult>::success(std::move(result));
}

} // namespace warden::sandbox
