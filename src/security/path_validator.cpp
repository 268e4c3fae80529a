#include "warden/security/path_validator.hpp"

#include "warden/common/fs.hpp"
#include "warden/observability/global.hpp"

namespace warden::security {

namespace {

constexpr int MAX_SYMLINK_HOPS = 40;

common::Result<std::filesystem::path> violation(const common::ErrorCode code,
                                                const std::string &kind,
                                                const std::string &raw_path,
                                                const std::string &message) {
  observability::record_security_violation("path_validator", kind, raw_path);
  return common::Result<std::filesystem::path>::failure(code, message);
}

// Follows `candidate` through the filesystem. Components that do not exist
// are carried over verbatim; a dangling link is chased to its target so the
// eventual write location is the one that gets checked.
common::Result<std::filesystem::path> resolve(std::filesystem::path candidate,
                                              const std::string &raw_path) {
  for (int hop = 0; hop < MAX_SYMLINK_HOPS; ++hop) {
    std::filesystem::path existing = candidate;
    std::filesystem::path suffix;
    std::error_code ec;
    while (!std::filesystem::exists(std::filesystem::symlink_status(existing, ec))) {
      if (existing == existing.root_path() || existing.empty()) {
        break;
      }
      suffix = suffix.empty() ? existing.filename() : existing.filename() / suffix;
      existing = existing.parent_path();
    }

    const auto link_status = std::filesystem::symlink_status(existing, ec);
    const bool dangling = std::filesystem::is_symlink(link_status) &&
                          !std::filesystem::exists(std::filesystem::status(existing, ec));
    if (!dangling) {
      const auto resolved = std::filesystem::canonical(existing, ec);
      if (ec) {
        if (ec == std::errc::too_many_symbolic_link_levels) {
          return violation(common::ErrorCode::SymlinkEscape, "symlink_loop", raw_path,
                           "symlink loop while resolving path: " + raw_path);
        }
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::Io, "unable to resolve path: " + raw_path);
      }
      return common::Result<std::filesystem::path>::success(
          suffix.empty() ? resolved : (resolved / suffix).lexically_normal());
    }

    auto target = std::filesystem::read_symlink(existing, ec);
    if (ec) {
      return common::Result<std::filesystem::path>::failure(
          common::ErrorCode::Io, "unable to resolve path: " + raw_path);
    }
    if (target.is_relative()) {
      const auto parent = std::filesystem::canonical(existing.parent_path(), ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::Io, "unable to resolve path: " + raw_path);
      }
      target = parent / target;
    }
    candidate = (suffix.empty() ? target : target / suffix).lexically_normal();
  }

  return violation(common::ErrorCode::SymlinkEscape, "symlink_loop", raw_path,
                   "symlink loop while resolving path: " + raw_path);
}

} // namespace

common::Result<std::filesystem::path> canonical_root(const std::filesystem::path &project_root) {
  std::error_code ec;
  auto root = std::filesystem::canonical(project_root, ec);
  if (ec || !std::filesystem::is_directory(root, ec)) {
    return common::Result<std::filesystem::path>::failure(common::ErrorCode::NotFound,
                                                          "project root is not accessible");
  }
  return common::Result<std::filesystem::path>::success(std::move(root));
}

common::Result<std::filesystem::path> validate_path(const std::string &raw_path,
                                                    const std::filesystem::path &project_root) {
  if (raw_path.empty()) {
    return violation(common::ErrorCode::PathTraversal, "empty_path", raw_path,
                     "invalid path");
  }
  if (raw_path.find('\0') != std::string::npos) {
    return violation(common::ErrorCode::PathTraversal, "null_byte", raw_path,
                     "invalid path");
  }

  const auto root = canonical_root(project_root);
  if (!root.ok()) {
    return root;
  }
  const auto &canonical = root.value();
  std::error_code ec;
  auto lexical_root = std::filesystem::absolute(project_root, ec).lexically_normal();
  if (ec || lexical_root.empty()) {
    lexical_root = canonical;
  } else if (!lexical_root.has_filename() && lexical_root != lexical_root.root_path()) {
    lexical_root = lexical_root.parent_path();
  }

  const std::filesystem::path input(raw_path);
  const bool relative = input.is_relative();
  const auto normalized = (relative ? canonical / input : input).lexically_normal();

  if (!common::is_subpath(normalized, canonical) && !common::is_subpath(normalized, lexical_root)) {
    if (relative) {
      return violation(common::ErrorCode::PathTraversal, "path_escapes_boundary", raw_path,
                       "path escapes the project root: " + raw_path);
    }
    return violation(common::ErrorCode::PathTraversal, "path_outside_boundary", raw_path,
                     "path is outside the project root: " + raw_path);
  }

  auto resolved = resolve(normalized, raw_path);
  if (!resolved.ok()) {
    return resolved;
  }

  if (!common::is_subpath(resolved.value(), canonical)) {
    return violation(common::ErrorCode::SymlinkEscape, "symlink_escape", raw_path,
                     "path resolves outside the project root through a symlink: " + raw_path);
  }

  return resolved;
}

} // namespace warden::security
