#pragma once

#include "warden/observability/observer.hpp"

#include <memory>

namespace warden::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_tool_call(const std::string &tool, const std::string &session_id,
                      std::chrono::milliseconds duration, bool success);
void record_security_violation(const std::string &component, const std::string &kind,
                               const std::string &subject);
void record_command(const std::string &program, const std::string &session_id, int exit_code,
                    std::chrono::milliseconds duration, bool timed_out);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace warden::observability
