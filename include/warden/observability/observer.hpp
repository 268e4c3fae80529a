#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace warden::observability {

struct ToolCallEvent {
  std::string tool;
  std::string session_id;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

/// A request was refused at a security boundary. `subject` is the
/// caller-supplied path or command, never a resolved location.
struct SecurityViolationEvent {
  std::string component;
  std::string kind;
  std::string subject;
};

struct CommandEvent {
  std::string program;
  std::string session_id;
  int exit_code = 0;
  std::chrono::milliseconds duration{0};
  bool timed_out = false;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ToolCallEvent, SecurityViolationEvent, CommandEvent,
                                   WarningEvent, ErrorEvent>;

struct CommandLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct EditBatchSizeMetric {
  std::uint64_t edits = 0;
};

struct WorkerQueueDepthMetric {
  std::uint64_t depth = 0;
};

using ObserverMetric =
    std::variant<CommandLatencyMetric, EditBatchSizeMetric, WorkerQueueDepthMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace warden::observability
