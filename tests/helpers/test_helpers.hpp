#pragma once

#include "warden/config/schema.hpp"
#include "warden/observability/observer.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace warden::testing {

config::Config mock_config();

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::string read_file(const std::string &name) const;
  /// Entries directly under `dir` (relative to the workspace), sorted.
  [[nodiscard]] std::vector<std::string> list(const std::string &dir = ".") const;

private:
  std::filesystem::path path_;
};

/// Keeps every event and metric for later inspection.
class CaptureObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "capture"; }

  [[nodiscard]] std::vector<observability::SecurityViolationEvent> violations() const;
  [[nodiscard]] std::vector<observability::ToolCallEvent> tool_calls() const;
  [[nodiscard]] std::vector<observability::CommandEvent> commands() const;
  [[nodiscard]] std::vector<observability::WarningEvent> warnings() const;
  [[nodiscard]] std::vector<observability::ErrorEvent> errors() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Installs a CaptureObserver as the global observer for the guard's lifetime.
class ObserverGuard {
public:
  ObserverGuard();
  ~ObserverGuard();

  ObserverGuard(const ObserverGuard &) = delete;
  ObserverGuard &operator=(const ObserverGuard &) = delete;

  [[nodiscard]] CaptureObserver &observer() { return *observer_; }

private:
  CaptureObserver *observer_ = nullptr;
};

} // namespace warden::testing
