#pragma once

#include "warden/common/result.hpp"
#include "warden/edit/edit_engine.hpp"
#include "warden/sessions/session_context.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::edit {

enum class LegacyMode {
  Deny,
  Warn,
};

[[nodiscard]] std::optional<LegacyMode> legacy_mode_from_string(std::string_view value);

struct FilePolicy {
  LegacyMode legacy_mode = LegacyMode::Deny;
  std::uint64_t max_file_bytes = 10ULL * 1024 * 1024;
  // Mode for newly created files; existing files keep theirs.
  std::uint32_t default_mode = 0644;
  std::size_t max_list_entries = 10'000;
};

struct FileScope {
  // Used only when `session` is null.
  std::filesystem::path project_root;
  sessions::SessionContext *session = nullptr;
};

struct ReadOutcome {
  std::filesystem::path path;
  std::string content;
};

struct WriteOutcome {
  std::filesystem::path path;
  std::size_t bytes = 0;
  bool created = false;
};

struct FileEditOutcome {
  std::filesystem::path path;
  EditOutcome edit;
};

struct DirectoryEntry {
  // Relative to the listed directory, '/'-separated.
  std::string name;
  // "file", "directory" or "symlink"; links are never followed.
  std::string type;
  bool unreadable = false;
};

struct DirectoryListing {
  std::vector<DirectoryEntry> entries;
  bool truncated = false;
};

struct PathInfo {
  std::uint64_t size = 0;
  // "regular", "directory" or "other"
  std::string type;
  // "read_write", "read", "write" or "none"
  std::string access;
  // UTC, YYYY-MM-DDTHH:MM:SSZ
  std::string mtime;
};

/// File-level operations. Each mutation holds the session's mutation lock,
/// validates the path, enforces read-before-write, applies everything in
/// memory and commits with a single atomic write.
class FileEditor {
public:
  using CommitHook = std::function<common::Status(const std::filesystem::path &temp_path)>;

  FileEditor(EditEngine engine, FilePolicy policy);

  [[nodiscard]] common::Result<ReadOutcome> read_file(const std::string &raw_path,
                                                      const FileScope &scope) const;
  [[nodiscard]] common::Result<WriteOutcome> write_file(const std::string &raw_path,
                                                        const std::string &content,
                                                        const FileScope &scope) const;
  [[nodiscard]] common::Result<FileEditOutcome>
  edit_file(const std::string &raw_path, const EditRequest &request, const FileScope &scope) const;
  [[nodiscard]] common::Result<FileEditOutcome>
  multi_edit_file(const std::string &raw_path, const std::vector<EditRequest> &edits,
                  const FileScope &scope) const;

  [[nodiscard]] common::Result<DirectoryListing>
  list_directory(const std::string &raw_path, bool recursive, const FileScope &scope) const;
  [[nodiscard]] common::Result<PathInfo> file_info(const std::string &raw_path,
                                                   const FileScope &scope) const;
  /// False when the directory already existed.
  [[nodiscard]] common::Result<bool> create_directory(const std::string &raw_path,
                                                      const FileScope &scope) const;
  /// Removes a regular file or a symlink itself, never a directory.
  [[nodiscard]] common::Status delete_file(const std::string &raw_path,
                                           const FileScope &scope) const;

  /// Runs just before each commit's rename; a failure aborts the commit.
  void set_commit_hook(CommitHook hook) { commit_hook_ = std::move(hook); }

  [[nodiscard]] const FilePolicy &policy() const { return policy_; }
  [[nodiscard]] const EditEngine &engine() const { return engine_; }

private:
  using Mutation =
      std::function<common::Result<EditOutcome>(const EditEngine &, std::string_view content)>;

  [[nodiscard]] common::Result<FileEditOutcome> mutate(const std::string &raw_path,
                                                       const FileScope &scope,
                                                       const Mutation &mutation) const;
  [[nodiscard]] common::Status check_session_scope(const std::string &raw_path,
                                                   const FileScope &scope) const;
  [[nodiscard]] common::Status check_read_state(const std::filesystem::path &path,
                                                const std::string &raw_path,
                                                std::string_view current,
                                                const FileScope &scope) const;
  [[nodiscard]] common::Status commit(const std::filesystem::path &path,
                                      const std::string &raw_path,
                                      const std::filesystem::path &root, std::string_view content,
                                      std::uint32_t permissions, bool create_parents) const;

  EditEngine engine_;
  FilePolicy policy_;
  CommitHook commit_hook_;
};

} // namespace warden::edit
