#include "warden/security/action_tracker.hpp"

#include <algorithm>

namespace warden::security {

ActionTracker::ActionTracker(const std::uint32_t max_actions, const std::chrono::seconds window)
    : max_actions_(max_actions), window_(window) {}

void ActionTracker::prune_locked(const std::chrono::steady_clock::time_point now) {
  const auto cutoff = now - window_;
  actions_.erase(std::remove_if(actions_.begin(), actions_.end(),
                                [cutoff](const auto &t) { return t <= cutoff; }),
                 actions_.end());
}

bool ActionTracker::under_limit_locked() const {
  return max_actions_ == 0 || actions_.size() < static_cast<std::size_t>(max_actions_);
}

void ActionTracker::record() { record_at(std::chrono::steady_clock::now()); }

void ActionTracker::record_at(const std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  prune_locked(now);
  actions_.push_back(now);
}

bool ActionTracker::check() { return check_at(std::chrono::steady_clock::now()); }

bool ActionTracker::check_at(const std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  prune_locked(now);
  return under_limit_locked();
}

bool ActionTracker::try_record() { return try_record_at(std::chrono::steady_clock::now()); }

bool ActionTracker::try_record_at(const std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  prune_locked(now);
  if (!under_limit_locked()) {
    return false;
  }
  actions_.push_back(now);
  return true;
}

std::size_t ActionTracker::count() { return count_at(std::chrono::steady_clock::now()); }

std::size_t ActionTracker::count_at(const std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  prune_locked(now);
  return actions_.size();
}

std::chrono::milliseconds
ActionTracker::retry_after_at(const std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  prune_locked(now);
  if (under_limit_locked() || actions_.empty()) {
    return std::chrono::milliseconds(0);
  }
  const auto oldest = *std::min_element(actions_.begin(), actions_.end());
  return std::chrono::duration_cast<std::chrono::milliseconds>(oldest + window_ - now);
}

} // namespace warden::security
