#include "warden/observability/global.hpp"

#include <mutex>

namespace warden::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_tool_call(const std::string &tool, const std::string &session_id,
                      const std::chrono::milliseconds duration, const bool success) {
  record_event(ToolCallEvent{
      .tool = tool, .session_id = session_id, .duration = duration, .success = success});
}

void record_security_violation(const std::string &component, const std::string &kind,
                               const std::string &subject) {
  record_event(SecurityViolationEvent{.component = component, .kind = kind, .subject = subject});
}

void record_command(const std::string &program, const std::string &session_id,
                    const int exit_code, const std::chrono::milliseconds duration,
                    const bool timed_out) {
  record_event(CommandEvent{.program = program,
                            .session_id = session_id,
                            .exit_code = exit_code,
                            .duration = duration,
                            .timed_out = timed_out});
  record_metric(CommandLatencyMetric{.latency = duration});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace warden::observability
