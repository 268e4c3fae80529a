#pragma once

#include "warden/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace warden::files {

struct TextFile {
  std::string content;
  std::uint32_t permissions = 0644;
};

/// NotFound, CapExceeded, NotText (NUL bytes or invalid UTF-8) or Io.
[[nodiscard]] common::Result<TextFile> read_text_file(const std::filesystem::path &path,
                                                      std::uint64_t max_bytes);

} // namespace warden::files
