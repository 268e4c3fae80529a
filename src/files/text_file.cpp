#include "warden/files/text_file.hpp"

#include "warden/common/utf8.hpp"

#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace warden::files {

common::Result<TextFile> read_text_file(const std::filesystem::path &path,
                                        const std::uint64_t max_bytes) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    return common::Result<TextFile>::failure(common::ErrorCode::NotFound, "file not found");
  }
  if (S_ISDIR(st.st_mode)) {
    return common::Result<TextFile>::failure(common::ErrorCode::InvalidArgument,
                                             "path is a directory");
  }
  if (!S_ISREG(st.st_mode)) {
    return common::Result<TextFile>::failure(common::ErrorCode::NotText,
                                             "path is not a regular file");
  }
  if (static_cast<std::uint64_t>(st.st_size) > max_bytes) {
    return common::Result<TextFile>::failure(common::ErrorCode::CapExceeded,
                                             "file exceeds the " + std::to_string(max_bytes) +
                                                 " byte limit");
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return common::Result<TextFile>::failure(common::ErrorCode::Io, "unable to open file");
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return common::Result<TextFile>::failure(common::ErrorCode::Io, "unable to read file");
  }

  TextFile file;
  file.content = buffer.str();
  file.permissions = static_cast<std::uint32_t>(st.st_mode & 07777);
  if (file.content.size() > max_bytes) {
    return common::Result<TextFile>::failure(common::ErrorCode::CapExceeded,
                                             "file exceeds the " + std::to_string(max_bytes) +
                                                 " byte limit");
  }
  if (!common::is_text(file.content)) {
    return common::Result<TextFile>::failure(common::ErrorCode::NotText,
                                             "file is not valid UTF-8 text");
  }
  return common::Result<TextFile>::success(std::move(file));
}

} // namespace warden::files
