#pragma once

#include "warden/common/result.hpp"

#include <filesystem>
#include <string>

namespace warden::security {

/// Resolves `raw_path` against `project_root` and certifies that the result,
/// with every symlink along the way followed, stays inside the root.
/// Paths that do not exist yet are accepted when their deepest existing
/// ancestor resolves inside the root; the unresolved suffix is re-appended.
[[nodiscard]] common::Result<std::filesystem::path>
validate_path(const std::string &raw_path, const std::filesystem::path &project_root);

[[nodiscard]] common::Result<std::filesystem::path>
canonical_root(const std::filesystem::path &project_root);

} // namespace warden::security
