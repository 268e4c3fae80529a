#include "warden/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace warden::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ToolCallEvent>) {
          log_line("INFO", "tool.call name=" + evt.tool + " session=" + evt.session_id +
                               " duration_ms=" + std::to_string(evt.duration.count()) +
                               " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, SecurityViolationEvent>) {
          log_line("WARN", "security.violation component=" + evt.component +
                               " kind=" + evt.kind + " subject=" + evt.subject);
        } else if constexpr (std::is_same_v<T, CommandEvent>) {
          log_line("INFO", "command.run program=" + evt.program + " session=" + evt.session_id +
                               " exit_code=" + std::to_string(evt.exit_code) +
                               " duration_ms=" + std::to_string(evt.duration.count()) +
                               " timed_out=" + bool_text(evt.timed_out));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, CommandLatencyMetric>) {
          log_line("DEBUG", "metric.command_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, EditBatchSizeMetric>) {
          log_line("DEBUG", "metric.edit_batch_size=" + std::to_string(m.edits));
        } else if constexpr (std::is_same_v<T, WorkerQueueDepthMetric>) {
          log_line("DEBUG", "metric.worker_queue_depth=" + std::to_string(m.depth));
        }
      },
      metric);
}

} // namespace warden::observability
