#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

namespace warden::security {

/// Sliding-window counter. A limit of zero never refuses.
class ActionTracker {
public:
  ActionTracker(std::uint32_t max_actions, std::chrono::seconds window);

  void record();
  void record_at(std::chrono::steady_clock::time_point now);

  [[nodiscard]] bool check();
  [[nodiscard]] bool check_at(std::chrono::steady_clock::time_point now);

  /// Records only when under the limit.
  [[nodiscard]] bool try_record();
  [[nodiscard]] bool try_record_at(std::chrono::steady_clock::time_point now);

  [[nodiscard]] std::size_t count();
  [[nodiscard]] std::size_t count_at(std::chrono::steady_clock::time_point now);

  [[nodiscard]] std::chrono::milliseconds retry_after_at(std::chrono::steady_clock::time_point now);

private:
  void prune_locked(std::chrono::steady_clock::time_point now);
  [[nodiscard]] bool under_limit_locked() const;

  std::mutex mutex_;
  std::vector<std::chrono::steady_clock::time_point> actions_;
  std::uint32_t max_actions_;
  std::chrono::seconds window_;
};

} // namespace warden::security
