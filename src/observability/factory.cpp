#include "warden/observability/factory.hpp"

#include "warden/common/fs.hpp"
#include "warden/observability/log_observer.hpp"
#include "warden/observability/noop_observer.hpp"

namespace warden::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace warden::observability
