#pragma once

#include "warden/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string_view>

namespace warden::files {

struct WriteOptions {
  std::uint32_t permissions = 0644;
  bool create_parents = false;
  // Runs after the temp file is complete and before it is renamed into place.
  // A failing status aborts the write.
  std::function<common::Status(const std::filesystem::path &temp_path)> before_rename;
};

/// Replaces `path` with `bytes` via a sibling temp file and rename, so readers
/// see either the old or the new content. The temp file receives its final
/// permissions before the rename and is removed on any failure before it.
/// IntegrityError is reserved for checks after the rename, when `path`
/// already holds the new bytes.
[[nodiscard]] common::Status write_atomic(const std::filesystem::path &path,
                                          std::string_view bytes,
                                          const WriteOptions &options = {});

[[nodiscard]] bool is_temp_file_name(std::string_view name);

} // namespace warden::files
