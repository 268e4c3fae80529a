#include "warden/files/atomic_writer.hpp"

#include "warden/common/crypto.hpp"
#include "warden/common/fs.hpp"
#include "warden/observability/global.hpp"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace warden::files {

namespace {

constexpr const char *TEMP_MARKER = ".warden-";
constexpr const char *TEMP_SUFFIX = ".tmp";
constexpr std::size_t TEMP_RANDOM_BYTES = 16;

class FileDescriptor {
public:
  explicit FileDescriptor(int fd) : fd_(fd) {}
  ~FileDescriptor() { reset(); }

  FileDescriptor(const FileDescriptor &) = delete;
  FileDescriptor &operator=(const FileDescriptor &) = delete;

  [[nodiscard]] int get() const { return fd_; }
  [[nodiscard]] bool valid() const { return fd_ >= 0; }

  int release_and_close() {
    const int rc = ::close(fd_);
    fd_ = -1;
    return rc;
  }

  void reset() {
    if (fd_ >= 0) {
      (void)::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_;
};

bool write_all(const int fd, std::string_view bytes) {
  while (!bytes.empty()) {
    const ssize_t written = ::write(fd, bytes.data(), bytes.size());
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    bytes.remove_prefix(static_cast<std::size_t>(written));
  }
  return true;
}

void remove_if_present(const std::filesystem::path &temp_path) {
  std::error_code ec;
  if (std::filesystem::exists(std::filesystem::symlink_status(temp_path, ec))) {
    std::filesystem::remove(temp_path, ec);
    if (ec) {
      observability::record_error("atomic_writer",
                                  "failed to remove temp file " + temp_path.filename().string());
    }
  }
}

void sync_directory(const std::filesystem::path &dir) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd >= 0) {
    (void)::fsync(fd);
    (void)::close(fd);
  }
}

} // namespace

bool is_temp_file_name(const std::string_view name) {
  return common::starts_with(name, ".") && name.find(TEMP_MARKER) != std::string_view::npos &&
         common::ends_with(name, TEMP_SUFFIX);
}

common::Status write_atomic(const std::filesystem::path &path, const std::string_view bytes,
                            const WriteOptions &options) {
  const auto dir = path.parent_path();
  std::error_code ec;
  if (options.create_parents && !dir.empty()) {
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      return common::Status::error(common::ErrorCode::Io, "unable to create parent directory");
    }
  }
  if (!dir.empty() && !std::filesystem::is_directory(dir, ec)) {
    return common::Status::error(common::ErrorCode::NotFound, "parent directory does not exist");
  }

  const auto suffix = common::random_hex(TEMP_RANDOM_BYTES);
  if (!suffix.ok()) {
    return common::Status::error(common::ErrorCode::Io, suffix.error());
  }
  const auto temp_path =
      dir / ("." + path.filename().string() + TEMP_MARKER + suffix.value() + TEMP_SUFFIX);

  FileDescriptor fd(::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC,
                           S_IRUSR | S_IWUSR));
  if (!fd.valid()) {
    return common::Status::error(common::ErrorCode::Io, "unable to create temp file");
  }

  const auto fail = [&](common::ErrorCode code, const std::string &message) {
    fd.reset();
    remove_if_present(temp_path);
    return common::Status::error(code, message);
  };

  if (!write_all(fd.get(), bytes)) {
    return fail(common::ErrorCode::Io, "failed to write temp file");
  }
  if (::fsync(fd.get()) != 0) {
    return fail(common::ErrorCode::Io, "failed to flush temp file");
  }
  if (::fchmod(fd.get(), static_cast<mode_t>(options.permissions & 07777U)) != 0) {
    return fail(common::ErrorCode::Io, "failed to set permissions on temp file");
  }
  if (fd.release_and_close() != 0) {
    remove_if_present(temp_path);
    return common::Status::error(common::ErrorCode::Io, "failed to close temp file");
  }

  if (options.before_rename) {
    const auto hook = options.before_rename(temp_path);
    if (!hook.ok()) {
      remove_if_present(temp_path);
      if (hook.code() == common::ErrorCode::IntegrityError) {
        return common::Status::error(common::ErrorCode::Io, hook.error());
      }
      return hook;
    }
  }

  if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
    remove_if_present(temp_path);
    return common::Status::error(common::ErrorCode::Io, "failed to move temp file into place");
  }
  sync_directory(dir.empty() ? std::filesystem::path(".") : dir);

  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    return common::Status::error(common::ErrorCode::IntegrityError,
                                 "written file disappeared after rename");
  }
  if (static_cast<std::uint64_t>(st.st_size) != bytes.size()) {
    return common::Status::error(common::ErrorCode::IntegrityError,
                                 "written size " + std::to_string(st.st_size) +
                                     " does not match expected " + std::to_string(bytes.size()));
  }

  return common::Status::success();
}

} // namespace warden::files
