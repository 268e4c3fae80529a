#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "warden/observability/factory.hpp"
#include "warden/observability/global.hpp"

void register_observability_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;
  namespace obs = warden::observability;

  tests.push_back({"observer_factory_selects_backend", [] {
                     auto config = warden::testing::mock_config();
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none");
                     config.observability.backend = " NOOP ";
                     require(obs::create_observer(config)->name() == "noop", "case and spaces");
                     config.observability.backend = "log";
                     require(obs::create_observer(config)->name() == "log", "log");
                   }});

  tests.push_back({"global_observer_defaults_to_none", [] {
                     obs::set_global_observer(nullptr);
                     require(obs::get_global_observer() == nullptr, "unset");
                     obs::record_warning("test", "dropped without an observer");
                   }});

  tests.push_back({"global_observer_receives_events", [] {
                     warden::testing::ObserverGuard guard;
                     require(obs::get_global_observer() == &guard.observer(), "installed");
                     obs::record_tool_call("read_file", "s", std::chrono::milliseconds(3), true);
                     obs::record_security_violation("path_validator", "path_escapes_boundary",
                                                    "../x");
                     obs::record_command("ls", "s", 0, std::chrono::milliseconds(1), false);
                     obs::record_warning("config", "careful");
                     obs::record_error("dispatcher", "boom");
                     obs::record_metric(obs::EditBatchSizeMetric{.edits = 4});

                     require(guard.observer().tool_calls().size() == 1, "tool call");
                     require(guard.observer().violations().front().subject == "../x", "violation");
                     require(guard.observer().commands().front().program == "ls", "command");
                     require(guard.observer().warnings().front().message == "careful", "warning");
                     require(guard.observer().errors().front().component == "dispatcher", "error");
                     require(guard.observer().metrics().size() == 1, "metric");
                   }});

  tests.push_back({"observer_guard_restores_default", [] {
                     {
                       warden::testing::ObserverGuard guard;
                       require(obs::get_global_observer() != nullptr, "inside");
                     }
                     require(obs::get_global_observer() == nullptr, "after");
                   }});
}
