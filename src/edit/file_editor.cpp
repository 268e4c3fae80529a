#include "warden/edit/file_editor.hpp"

#include "warden/common/utf8.hpp"
#include "warden/files/atomic_writer.hpp"
#include "warden/files/text_file.hpp"
#include "warden/observability/global.hpp"
#include "warden/security/path_validator.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <ctime>
#include <mutex>

namespace warden::edit {

namespace {

std::filesystem::path scope_root(const FileScope &scope) {
  return scope.session != nullptr ? scope.session->project_root() : scope.project_root;
}

std::unique_lock<std::mutex> lock_scope(const FileScope &scope) {
  if (scope.session == nullptr) {
    return {};
  }
  return scope.session->lock_mutations();
}

bool is_security_code(const common::ErrorCode code) {
  return code == common::ErrorCode::PathTraversal || code == common::ErrorCode::SymlinkEscape;
}

std::string entry_type(const std::filesystem::file_status status) {
  if (std::filesystem::is_symlink(status)) {
    return "symlink";
  }
  if (std::filesystem::is_directory(status)) {
    return "directory";
  }
  return "file";
}

bool sorted_children(const std::filesystem::path &dir, std::vector<std::filesystem::path> &out) {
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  for (const std::filesystem::directory_iterator end{}; !ec && it != end; it.increment(ec)) {
    out.push_back(it->path());
  }
  if (ec) {
    return false;
  }
  std::sort(out.begin(), out.end());
  return true;
}

// Depth-first, a directory before its children. Symlinked directories are
// listed but never entered.
bool collect_entries(const std::filesystem::path &dir, const std::filesystem::path &base,
                     const bool recursive, const std::size_t cap, DirectoryListing &listing) {
  std::vector<std::filesystem::path> children;
  if (!sorted_children(dir, children)) {
    return false;
  }
  for (const auto &child : children) {
    if (listing.entries.size() >= cap) {
      listing.truncated = true;
      return true;
    }
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(child, ec);
    listing.entries.push_back(DirectoryEntry{
        .name = child.lexically_relative(base).generic_string(), .type = entry_type(status)});
    if (!recursive || listing.entries.back().type != "directory") {
      continue;
    }
    const auto index = listing.entries.size() - 1;
    if (!collect_entries(child, base, recursive, cap, listing)) {
      listing.entries[index].unreadable = true;
    }
    if (listing.truncated) {
      return true;
    }
  }
  return true;
}

std::string access_mode(const std::filesystem::path &path) {
  const bool readable = ::access(path.c_str(), R_OK) == 0;
  const bool writable = ::access(path.c_str(), W_OK) == 0;
  if (readable && writable) {
    return "read_write";
  }
  if (readable) {
    return "read";
  }
  return writable ? "write" : "none";
}

std::string utc_timestamp(const std::time_t when) {
  std::tm parts{};
  if (::gmtime_r(&when, &parts) == nullptr) {
    return "";
  }
  char buffer[32];
  const auto size = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &parts);
  return std::string(buffer, size);
}

} // namespace

std::optional<LegacyMode> legacy_mode_from_string(const std::string_view value) {
  if (value == "deny") {
    return LegacyMode::Deny;
  }
  if (value == "warn") {
    return LegacyMode::Warn;
  }
  return std::nullopt;
}

FileEditor::FileEditor(EditEngine engine, FilePolicy policy)
    : engine_(std::move(engine)), policy_(policy) {}

common::Result<ReadOutcome> FileEditor::read_file(const std::string &raw_path,
                                                  const FileScope &scope) const {
  auto path = security::validate_path(raw_path, scope_root(scope));
  if (!path.ok()) {
    return common::Result<ReadOutcome>::failure(path.detail());
  }
  auto file = files::read_text_file(path.value(), policy_.max_file_bytes);
  if (!file.ok()) {
    return common::Result<ReadOutcome>::failure(file.detail());
  }
  if (scope.session != nullptr) {
    if (auto marked = scope.session->mark_read(path.value(), file.value().content); !marked.ok()) {
      return common::Result<ReadOutcome>::failure(marked.detail());
    }
  }
  return common::Result<ReadOutcome>::success(
      ReadOutcome{.path = path.value(), .content = std::move(file.value().content)});
}

common::Result<WriteOutcome> FileEditor::write_file(const std::string &raw_path,
                                                    const std::string &content,
                                                    const FileScope &scope) const {
  if (content.size() > policy_.max_file_bytes) {
    return common::Result<WriteOutcome>::failure(
        common::ErrorCode::CapExceeded,
        "content exceeds the limit of " + std::to_string(policy_.max_file_bytes) + " bytes");
  }
  if (!common::is_text(content)) {
    return common::Result<WriteOutcome>::failure(common::ErrorCode::NotText,
                                                 "content must be UTF-8 text without NUL bytes");
  }

  auto lock = lock_scope(scope);
  const auto root = scope_root(scope);
  auto path = security::validate_path(raw_path, root);
  if (!path.ok()) {
    return common::Result<WriteOutcome>::failure(path.detail());
  }

  std::error_code ec;
  const auto status = std::filesystem::status(path.value(), ec);
  const bool exists = std::filesystem::exists(status);
  if (exists && std::filesystem::is_directory(status)) {
    return common::Result<WriteOutcome>::failure(common::ErrorCode::InvalidArgument,
                                                 "path is a directory: " + raw_path);
  }

  std::uint32_t permissions = policy_.default_mode;
  if (exists) {
    auto current = files::read_text_file(path.value(), policy_.max_file_bytes);
    if (!current.ok()) {
      return common::Result<WriteOutcome>::failure(current.detail());
    }
    if (auto state = check_read_state(path.value(), raw_path, current.value().content, scope);
        !state.ok()) {
      return common::Result<WriteOutcome>::failure(state.detail());
    }
    permissions = current.value().permissions;
  }

  if (auto committed = commit(path.value(), raw_path, root, content, permissions, true);
      !committed.ok()) {
    return common::Result<WriteOutcome>::failure(committed.detail());
  }
  if (scope.session != nullptr) {
    if (auto marked = scope.session->mark_read(path.value(), content); !marked.ok()) {
      return common::Result<WriteOutcome>::failure(marked.detail());
    }
  }
  return common::Result<WriteOutcome>::success(
      WriteOutcome{.path = path.value(), .bytes = content.size(), .created = !exists});
}

common::Result<FileEditOutcome> FileEditor::edit_file(const std::string &raw_path,
                                                      const EditRequest &request,
                                                      const FileScope &scope) const {
  return mutate(raw_path, scope, [&request](const EditEngine &engine, std::string_view content) {
    return engine.apply_edit(content, request);
  });
}

common::Result<FileEditOutcome> FileEditor::multi_edit_file(const std::string &raw_path,
                                                            const std::vector<EditRequest> &edits,
                                                            const FileScope &scope) const {
  observability::record_metric(observability::EditBatchSizeMetric{.edits = edits.size()});
  return mutate(raw_path, scope, [&edits](const EditEngine &engine, std::string_view content) {
    return engine.apply_edits(content, edits);
  });
}

common::Result<DirectoryListing> FileEditor::list_directory(const std::string &raw_path,
                                                            const bool recursive,
                                                            const FileScope &scope) const {
  auto path = security::validate_path(raw_path, scope_root(scope));
  if (!path.ok()) {
    return common::Result<DirectoryListing>::failure(path.detail());
  }
  std::error_code ec;
  const auto status = std::filesystem::status(path.value(), ec);
  if (!std::filesystem::exists(status)) {
    return common::Result<DirectoryListing>::failure(common::ErrorCode::NotFound,
                                                     "directory not found: " + raw_path);
  }
  if (!std::filesystem::is_directory(status)) {
    return common::Result<DirectoryListing>::failure(common::ErrorCode::InvalidArgument,
                                                     "not a directory: " + raw_path);
  }
  DirectoryListing listing;
  if (!collect_entries(path.value(), path.value(), recursive, policy_.max_list_entries,
                       listing)) {
    return common::Result<DirectoryListing>::failure(common::ErrorCode::Io,
                                                     "unable to list directory: " + raw_path);
  }
  return common::Result<DirectoryListing>::success(std::move(listing));
}

common::Result<PathInfo> FileEditor::file_info(const std::string &raw_path,
                                               const FileScope &scope) const {
  auto path = security::validate_path(raw_path, scope_root(scope));
  if (!path.ok()) {
    return common::Result<PathInfo>::failure(path.detail());
  }
  struct stat st {};
  if (::stat(path.value().c_str(), &st) != 0) {
    if (errno == ENOENT || errno == ENOTDIR) {
      return common::Result<PathInfo>::failure(common::ErrorCode::NotFound,
                                               "path not found: " + raw_path);
    }
    return common::Result<PathInfo>::failure(common::ErrorCode::Io,
                                             "unable to stat " + raw_path);
  }
  PathInfo info;
  info.size = static_cast<std::uint64_t>(st.st_size);
  if (S_ISREG(st.st_mode)) {
    info.type = "regular";
  } else if (S_ISDIR(st.st_mode)) {
    info.type = "directory";
  } else {
    info.type = "other";
  }
  info.access = access_mode(path.value());
  info.mtime = utc_timestamp(st.st_mtime);
  return common::Result<PathInfo>::success(std::move(info));
}

common::Result<bool> FileEditor::create_directory(const std::string &raw_path,
                                                  const FileScope &scope) const {
  auto lock = lock_scope(scope);
  if (auto allowed = check_session_scope(raw_path, scope); !allowed.ok()) {
    return common::Result<bool>::failure(allowed.detail());
  }
  const auto root = scope_root(scope);
  auto path = security::validate_path(raw_path, root);
  if (!path.ok()) {
    return common::Result<bool>::failure(path.detail());
  }
  std::error_code ec;
  const auto status = std::filesystem::status(path.value(), ec);
  if (std::filesystem::exists(status)) {
    if (std::filesystem::is_directory(status)) {
      return common::Result<bool>::success(false);
    }
    return common::Result<bool>::failure(common::ErrorCode::InvalidArgument,
                                         "path exists and is not a directory: " + raw_path);
  }
  std::filesystem::create_directories(path.value(), ec);
  if (ec) {
    observability::record_error("file_editor",
                                "create_directories " + path.value().string() + ": " +
                                    ec.message());
    return common::Result<bool>::failure(common::ErrorCode::Io,
                                         "unable to create directory: " + raw_path);
  }
  // A parent swapped for a link mid-create would put the result outside.
  if (auto again = security::validate_path(raw_path, root); !again.ok()) {
    return common::Result<bool>::failure(again.detail());
  }
  return common::Result<bool>::success(true);
}

common::Status FileEditor::delete_file(const std::string &raw_path, const FileScope &scope) const {
  auto lock = lock_scope(scope);
  if (auto allowed = check_session_scope(raw_path, scope); !allowed.ok()) {
    return allowed;
  }
  const auto root = scope_root(scope);
  auto path = security::validate_path(raw_path, root);
  if (!path.ok()) {
    return common::Status::error(path.detail());
  }

  const std::filesystem::path input(raw_path);
  const auto lexical = (input.is_absolute() ? input : root / input).lexically_normal();
  std::error_code ec;
  auto target = path.value();
  if (std::filesystem::is_symlink(std::filesystem::symlink_status(lexical, ec))) {
    // Unlink the link itself; its target may be shared.
    target = lexical;
  } else {
    const auto status = std::filesystem::status(target, ec);
    if (!std::filesystem::exists(status)) {
      return common::Status::error(common::ErrorCode::NotFound, "file not found: " + raw_path);
    }
    if (std::filesystem::is_directory(status)) {
      return common::Status::error(common::ErrorCode::InvalidArgument,
                                   "not a file: " + raw_path);
    }
  }

  if (!std::filesystem::remove(target, ec)) {
    if (!ec) {
      return common::Status::error(common::ErrorCode::NotFound, "file not found: " + raw_path);
    }
    observability::record_error("file_editor",
                                "remove " + target.string() + ": " + ec.message());
    return common::Status::error(common::ErrorCode::Io, "unable to delete " + raw_path);
  }
  if (scope.session != nullptr) {
    scope.session->forget(path.value());
  }
  return common::Status::success();
}

common::Result<FileEditOutcome> FileEditor::mutate(const std::string &raw_path,
                                                   const FileScope &scope,
                                                   const Mutation &mutation) const {
  auto lock = lock_scope(scope);
  const auto root = scope_root(scope);
  auto path = security::validate_path(raw_path, root);
  if (!path.ok()) {
    return common::Result<FileEditOutcome>::failure(path.detail());
  }

  auto file = files::read_text_file(path.value(), policy_.max_file_bytes);
  if (!file.ok()) {
    if (file.code() == common::ErrorCode::NotFound) {
      return common::Result<FileEditOutcome>::failure(common::ErrorCode::NotFound,
                                                      "file not found: " + raw_path);
    }
    return common::Result<FileEditOutcome>::failure(file.detail());
  }
  if (auto state = check_read_state(path.value(), raw_path, file.value().content, scope);
      !state.ok()) {
    return common::Result<FileEditOutcome>::failure(state.detail());
  }

  auto edited = mutation(engine_, file.value().content);
  if (!edited.ok()) {
    return common::Result<FileEditOutcome>::failure(edited.detail());
  }
  if (edited.value().content.size() > policy_.max_file_bytes) {
    return common::Result<FileEditOutcome>::failure(
        common::ErrorCode::CapExceeded,
        "edited file would exceed the limit of " + std::to_string(policy_.max_file_bytes) +
            " bytes");
  }

  if (auto committed = commit(path.value(), raw_path, root, edited.value().content,
                              file.value().permissions, false);
      !committed.ok()) {
    return common::Result<FileEditOutcome>::failure(committed.detail());
  }
  if (scope.session != nullptr) {
    if (auto marked = scope.session->mark_read(path.value(), edited.value().content);
        !marked.ok()) {
      return common::Result<FileEditOutcome>::failure(marked.detail());
    }
  }
  return common::Result<FileEditOutcome>::success(
      FileEditOutcome{.path = path.value(), .edit = std::move(edited.value())});
}

common::Status FileEditor::check_session_scope(const std::string &raw_path,
                                               const FileScope &scope) const {
  if (scope.session != nullptr) {
    return common::Status::success();
  }
  if (policy_.legacy_mode == LegacyMode::Warn) {
    observability::record_warning("file_editor",
                                  "change without a session allowed by legacy mode: " + raw_path);
    return common::Status::success();
  }
  return common::Status::error(common::ErrorCode::InvalidArgument,
                               "A session is required to change " + raw_path);
}

common::Status FileEditor::check_read_state(const std::filesystem::path &path,
                                            const std::string &raw_path,
                                            const std::string_view current,
                                            const FileScope &scope) const {
  if (scope.session == nullptr) {
    if (policy_.legacy_mode == LegacyMode::Warn) {
      observability::record_warning("file_editor",
                                    "mutation without a session allowed by legacy mode: " +
                                        raw_path);
      return common::Status::success();
    }
    return common::Status::error(common::ErrorCode::ReadBeforeWriteRequired,
                                 "File must be read before editing: " + raw_path);
  }
  if (!scope.session->was_read(path)) {
    return common::Status::error(common::ErrorCode::ReadBeforeWriteRequired,
                                 "File must be read before editing: " + raw_path);
  }
  if (!scope.session->is_fresh(path, current)) {
    return common::Status::error(common::ErrorCode::ReadBeforeWriteRequired,
                                 "File has changed since it was last read: " + raw_path);
  }
  return common::Status::success();
}

common::Status FileEditor::commit(const std::filesystem::path &path, const std::string &raw_path,
                                  const std::filesystem::path &root,
                                  const std::string_view content,
                                  const std::uint32_t permissions,
                                  const bool create_parents) const {
  files::WriteOptions options;
  options.permissions = permissions;
  options.create_parents = create_parents;
  options.before_rename = [this, &path, &raw_path,
                           &root](const std::filesystem::path &temp_path) -> common::Status {
    if (commit_hook_) {
      if (auto hooked = commit_hook_(temp_path); !hooked.ok()) {
        return hooked;
      }
    }
    // The destination may have been swapped for a link since validation.
    auto again = security::validate_path(raw_path, root);
    if (!again.ok()) {
      return common::Status::error(again.detail());
    }
    if (again.value() != path) {
      return common::Status::error(common::ErrorCode::SymlinkEscape,
                                   "path changed while writing: " + raw_path);
    }
    return common::Status::success();
  };

  auto status = files::write_atomic(path, content, options);
  if (status.ok() || is_security_code(status.code())) {
    return status;
  }
  observability::record_error("file_editor",
                              "commit failed for " + raw_path + ": " + status.error());
  if (status.code() == common::ErrorCode::IntegrityError) {
    return common::Status::error(common::ErrorCode::IntegrityError,
                                 "wrote " + raw_path +
                                     " but could not verify the result; read it again before "
                                     "editing");
  }
  return common::Status::error(common::ErrorCode::IntegrityError,
                               "failed to write " + raw_path + "; the file was left unchanged");
}

} // namespace warden::edit
