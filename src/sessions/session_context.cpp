#include "warden/sessions/session_context.hpp"

#include "warden/common/crypto.hpp"
#include "warden/security/path_validator.hpp"

namespace warden::sessions {

namespace {

std::string record_key(const std::filesystem::path &path) {
  return path.lexically_normal().string();
}

} // namespace

common::Result<std::shared_ptr<SessionContext>>
SessionContext::create(std::string id, const std::filesystem::path &project_root,
                       const std::uint32_t max_commands_per_minute) {
  auto root = security::canonical_root(project_root);
  if (!root.ok()) {
    return common::Result<std::shared_ptr<SessionContext>>::failure(root.detail());
  }
  return common::Result<std::shared_ptr<SessionContext>>::success(
      std::shared_ptr<SessionContext>(new SessionContext(std::move(id), std::move(root.value()),
                                                         max_commands_per_minute)));
}

SessionContext::SessionContext(std::string id, std::filesystem::path project_root,
                               const std::uint32_t max_commands_per_minute)
    : id_(std::move(id)), project_root_(std::move(project_root)),
      command_tracker_(max_commands_per_minute, std::chrono::seconds(60)) {}

common::Status SessionContext::mark_read(const std::filesystem::path &path,
                                         const std::string_view content) {
  auto digest = common::sha256_hex(content);
  if (!digest.ok()) {
    return common::Status::error(digest.detail());
  }
  std::lock_guard<std::mutex> lock(records_mutex_);
  records_[record_key(path)] = FileReadRecord{.digest = std::move(digest.value()),
                                              .observed_at = std::chrono::system_clock::now()};
  return common::Status::success();
}

bool SessionContext::was_read(const std::filesystem::path &path) const {
  std::lock_guard<std::mutex> lock(records_mutex_);
  return records_.contains(record_key(path));
}

bool SessionContext::is_fresh(const std::filesystem::path &path,
                              const std::string_view content) const {
  const auto record = read_record(path);
  if (!record.has_value()) {
    return false;
  }
  const auto digest = common::sha256_hex(content);
  return digest.ok() && digest.value() == record->digest;
}

std::optional<FileReadRecord> SessionContext::read_record(const std::filesystem::path &path) const {
  std::lock_guard<std::mutex> lock(records_mutex_);
  const auto it = records_.find(record_key(path));
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void SessionContext::forget(const std::filesystem::path &path) {
  std::lock_guard<std::mutex> lock(records_mutex_);
  records_.erase(record_key(path));
}

std::size_t SessionContext::read_count() const {
  std::lock_guard<std::mutex> lock(records_mutex_);
  return records_.size();
}

std::unique_lock<std::mutex> SessionContext::lock_mutations() {
  return std::unique_lock<std::mutex>(mutation_mutex_);
}

} // namespace warden::sessions
