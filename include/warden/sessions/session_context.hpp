#pragma once

#include "warden/common/result.hpp"
#include "warden/security/action_tracker.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace warden::sessions {

struct FileReadRecord {
  std::string digest;
  std::chrono::system_clock::time_point observed_at;
};

class SessionContext {
public:
  /// Fails with NotFound when `project_root` is not an accessible directory.
  [[nodiscard]] static common::Result<std::shared_ptr<SessionContext>>
  create(std::string id, const std::filesystem::path &project_root,
         std::uint32_t max_commands_per_minute = 60);

  SessionContext(const SessionContext &) = delete;
  SessionContext &operator=(const SessionContext &) = delete;

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] const std::filesystem::path &project_root() const { return project_root_; }

  [[nodiscard]] common::Status mark_read(const std::filesystem::path &path,
                                         std::string_view content);
  [[nodiscard]] bool was_read(const std::filesystem::path &path) const;
  /// True when `path` was read and `content` still hashes to the recorded digest.
  [[nodiscard]] bool is_fresh(const std::filesystem::path &path, std::string_view content) const;
  [[nodiscard]] std::optional<FileReadRecord> read_record(const std::filesystem::path &path) const;
  void forget(const std::filesystem::path &path);
  [[nodiscard]] std::size_t read_count() const;

  [[nodiscard]] std::unique_lock<std::mutex> lock_mutations();

  [[nodiscard]] security::ActionTracker &command_tracker() { return command_tracker_; }

private:
  SessionContext(std::string id, std::filesystem::path project_root,
                 std::uint32_t max_commands_per_minute);

  const std::string id_;
  const std::filesystem::path project_root_;

  mutable std::mutex records_mutex_;
  std::unordered_map<std::string, FileReadRecord> records_;

  std::mutex mutation_mutex_;
  security::ActionTracker command_tracker_;
};

} // namespace warden::sessions
