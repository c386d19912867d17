#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "tunnels/tunnel/identity.hpp"
#include "tunnels/tunnel/lifecycle.hpp"

namespace {

namespace th = tunnels::testing;
namespace tn = tunnels::tunnel;

std::vector<tunnels::config::Tunnel> sample_tunnels() {
  return {th::local_tunnel("API Gateway", "prod"), th::local_tunnel("Reports", "prod"),
          th::dynamic_tunnel("socks")};
}

struct Harness {
  th::FakeInspector inspector;
  th::FakeProcessControl control{inspector};
  th::FakeLocator locator;
  tn::LifecycleController controller{sample_tunnels(), inspector, control, locator};
};

} // namespace

void register_lifecycle_tests(std::vector<tunnels::tests::TestCase> &tests) {
  using tunnels::tests::require;

  tests.push_back({"lifecycle_select_requires_exactly_one_selector", [] {
                     Harness h;
                     const auto none = h.controller.select({});
                     require(!none.ok(), "empty selector should fail");
                     require(none.kind() == tunnels::common::ErrorKind::Usage, "usage error");
                     require(none.error() ==
                                 "Only one of --name, --group, or --all must be specified.",
                             none.error());

                     tn::Selector two;
                     two.names = {"socks"};
                     two.all = true;
                     require(!h.controller.select(two).ok(), "name with all should fail");

                     tn::Selector group_and_all;
                     group_and_all.group = "prod";
                     group_and_all.all = true;
                     require(!h.controller.select(group_and_all).ok(), "group with all");
                   }});

  tests.push_back({"lifecycle_select_by_group_returns_subset", [] {
                     Harness h;
                     tn::Selector selector;
                     selector.group = "prod";
                     const auto selected = h.controller.select(selector);
                     require(selected.ok(), selected.error());
                     require(selected.value().size() == 2, "two prod tunnels");
                     for (const auto &tunnel : selected.value()) {
                       require(tunnel.group == std::optional<std::string>("prod"),
                               "only group members");
                     }

                     selector.group = "staging";
                     const auto missing = h.controller.select(selector);
                     require(!missing.ok(), "unknown group");
                     require(missing.error() == "Group not found: staging", missing.error());
                   }});

  tests.push_back({"lifecycle_select_by_name_and_all", [] {
                     Harness h;
                     tn::Selector selector;
                     selector.names = {"socks", "API Gateway", "socks"};
                     const auto selected = h.controller.select(selector);
                     require(selected.ok(), selected.error());
                     require(selected.value().size() == 2, "repeated names selected once");
                     require(selected.value()[0].name == "socks", "selection keeps order");

                     selector.names = {"socks", "nope", "also-nope"};
                     const auto missing = h.controller.select(selector);
                     require(!missing.ok(), "unknown name");
                     require(missing.error() == "Tunnel not found: nope", missing.error());

                     tn::Selector all;
                     all.all = true;
                     require(h.controller.select(all).value().size() == 3, "all tunnels");
                   }});

  tests.push_back({"lifecycle_start_twice_spawns_once", [] {
                     Harness h;
                     h.locator.installed = {{"autossh", "/usr/bin/autossh"}};
                     const std::vector<tunnels::config::Tunnel> selection = {
                         th::dynamic_tunnel("socks")};

                     const auto first = h.controller.start(selection, true);
                     require(first.items.size() == 1, "one item");
                     require(first.items[0].outcome == tn::StartOutcome::Started, "started");
                     require(first.items[0].launcher == "autossh", first.items[0].launcher);
                     require(first.warnings.empty(), "no warning when autossh exists");

                     const auto second = h.controller.start(selection, true);
                     require(second.items[0].outcome == tn::StartOutcome::AlreadyRunning,
                             "second start is a no-op");
                     require(first.items[0].pid == 0, "backgrounded launcher pid not reported");
                     require(second.items[0].pid == 4000, "running daemon reported");
                     require(h.control.spawned.size() == 1, "exactly one spawn");
                     require(second.classification() == tn::BatchClassification::FullSuccess,
                             "already running is not a failure");
                   }});

  tests.push_back({"lifecycle_start_reads_process_table_once_per_batch", [] {
                     Harness h;
                     const auto report = h.controller.start(sample_tunnels(), false);
                     require(report.total() == 3 && report.succeeded() == 3, "all started");
                     require(h.inspector.list_calls == 1, "single process-table read");
                     require(tn::summarize(report) == "Successfully started 3 tunnel(s)",
                             tn::summarize(report));
                   }});

  tests.push_back({"lifecycle_start_warns_when_autossh_missing", [] {
                     Harness h;
                     const auto report = h.controller.start({th::dynamic_tunnel("socks")}, true);
                     require(report.warnings.size() == 1, "one warning");
                     require(report.warnings[0] == "AutoSSH not found, using regular SSH",
                             report.warnings[0]);
                     require(report.items[0].launcher == "ssh", report.items[0].launcher);
                     require(h.control.spawned[0][0] == "ssh", h.control.spawned[0][0]);
                   }});

  tests.push_back({"lifecycle_start_spawn_failure_is_per_tunnel", [] {
                     Harness h;
                     h.control.spawn_error = "executable not found: ssh";
                     const auto report = h.controller.start(sample_tunnels(), false);
                     require(report.total() == 3, "every tunnel processed");
                     require(report.succeeded() == 0, "none started");
                     require(report.classification() == tn::BatchClassification::TotalFailure,
                             "total failure");
                     require(report.items[1].message == "executable not found: ssh",
                             report.items[1].message);
                     require(tn::summarize(report) == "Failed to start any tunnels",
                             tn::summarize(report));
                   }});

  tests.push_back({"lifecycle_stop_not_running_is_noop", [] {
                     Harness h;
                     const auto report = h.controller.stop({th::dynamic_tunnel("socks")});
                     require(report.items[0].outcome == tn::StopOutcome::NotRunning,
                             "not running");
                     require(h.control.terminated.empty(), "no signal sent");
                     require(report.classification() == tn::BatchClassification::FullSuccess,
                             "not running is not an error");
                   }});

  tests.push_back({"lifecycle_stop_partial_failure", [] {
                     Harness h;
                     h.inspector.processes = {th::tagged_process("API Gateway", 201),
                                              th::tagged_process("Reports", 202),
                                              th::tagged_process("socks", 203)};
                     h.control.deny_terminate = {202};
                     const auto report = h.controller.stop(sample_tunnels());
                     require(report.succeeded() == 2 && report.total() == 3, "2/3 stopped");
                     require(report.classification() == tn::BatchClassification::PartialSuccess,
                             "partial success");
                     require(report.items[1].outcome == tn::StopOutcome::Failed, "denied stop");
                     require(tn::summarize(report) == "Stopped 2/3 tunnel(s)",
                             tn::summarize(report));
                   }});

  tests.push_back({"lifecycle_stop_escalates_to_kill", [] {
                     Harness h;
                     h.inspector.processes = {th::tagged_process("socks", 301)};
                     h.control.ignore_terminate = {301};
                     const auto report = h.controller.stop({th::dynamic_tunnel("socks")});
                     require(report.items[0].outcome == tn::StopOutcome::ForceKilled,
                             "SIGKILL after timeout");
                     require(h.control.killed == std::vector<int>{301}, "kill sent once");
                   }});

  tests.push_back({"lifecycle_stop_kill_denied_fails", [] {
                     Harness h;
                     h.inspector.processes = {th::tagged_process("socks", 302)};
                     h.control.ignore_terminate = {302};
                     h.control.deny_kill = {302};
                     const auto report = h.controller.stop({th::dynamic_tunnel("socks")});
                     require(report.items[0].outcome == tn::StopOutcome::Failed, "kill denied");
                     require(tn::summarize(report) == "Failed to stop any tunnels",
                             tn::summarize(report));
                   }});

  tests.push_back({"lifecycle_stop_vanished_process_is_already_stopped", [] {
                     Harness h;
                     h.inspector.processes = {th::tagged_process("socks", 303)};
                     h.control.vanished = {303};
                     const auto report = h.controller.stop({th::dynamic_tunnel("socks")});
                     require(report.items[0].outcome == tn::StopOutcome::AlreadyStopped,
                             "already stopped");
                     require(report.succeeded() == 1, "counted as success");
                   }});

  tests.push_back({"lifecycle_stop_targets_autossh_supervisor", [] {
                     Harness h;
                     h.inspector.processes = {th::tagged_process("socks", 402, 401, "ssh"),
                                              th::tagged_process("socks", 401, 1, "autossh")};
                     const auto report = h.controller.stop({th::dynamic_tunnel("socks")});
                     require(h.control.terminated == std::vector<int>{401},
                             "supervisor receives SIGTERM");
                     require(h.control.killed.empty(), "child exits with its supervisor");
                     require(report.items[0].outcome == tn::StopOutcome::Stopped, "stopped");
                     require(report.items[0].pid == 401, "reported pid");
                   }});

  tests.push_back({"lifecycle_stop_kills_every_tagged_process_after_timeout", [] {
                     Harness h;
                     h.inspector.processes = {th::tagged_process("socks", 501, 1, "autossh"),
                                              th::tagged_process("socks", 502, 501, "ssh")};
                     h.control.ignore_terminate = {501, 502};
                     const auto report = h.controller.stop({th::dynamic_tunnel("socks")});
                     require(h.control.terminated == std::vector<int>{501},
                             "SIGTERM goes to the supervisor only");
                     require(h.control.killed == std::vector<int>({501, 502}),
                             "supervisor and ssh child both killed");
                     require(report.items[0].outcome == tn::StopOutcome::ForceKilled,
                             "force killed");
                     require(h.inspector.processes.empty(), "no tagged process left");
                     require(tn::summarize(report) == "Successfully stopped 1 tunnel(s)",
                             tn::summarize(report));
                   }});

  tests.push_back({"lifecycle_stop_fails_when_tagged_child_survives", [] {
                     Harness h;
                     h.inspector.processes = {th::tagged_process("socks", 511, 1, "autossh"),
                                              th::tagged_process("socks", 512, 511, "ssh")};
                     h.control.ignore_terminate = {511, 512};
                     h.control.survive_kill = {512};
                     const auto report = h.controller.stop({th::dynamic_tunnel("socks")});
                     require(report.items[0].outcome == tn::StopOutcome::Failed,
                             "surviving child is a failure");
                     require(report.items[0].message == "process 512 survived SIGKILL",
                             report.items[0].message);
                     require(tn::summarize(report) == "Failed to stop any tunnels",
                             tn::summarize(report));
                   }});

  tests.push_back({"lifecycle_stop_child_kill_denied_fails", [] {
                     Harness h;
                     h.inspector.processes = {th::tagged_process("socks", 521, 1, "autossh"),
                                              th::tagged_process("socks", 522, 521, "ssh")};
                     h.control.ignore_terminate = {521, 522};
                     h.control.deny_kill = {522};
                     const auto report = h.controller.stop({th::dynamic_tunnel("socks")});
                     require(report.items[0].outcome == tn::StopOutcome::Failed, "kill denied");
                     require(report.items[0].message == "permission denied sending SIGKILL to 522",
                             report.items[0].message);
                   }});

  tests.push_back({"lifecycle_stop_signals_duplicate_roots", [] {
                     Harness h;
                     h.inspector.processes = {th::tagged_process("socks", 531),
                                              th::tagged_process("socks", 532)};
                     const auto report = h.controller.stop({th::dynamic_tunnel("socks")});
                     require(h.control.terminated == std::vector<int>({531, 532}),
                             "both racing launches receive SIGTERM");
                     require(report.items[0].outcome == tn::StopOutcome::Stopped, "stopped");
                     require(h.inspector.processes.empty(), "no tagged process left");
                   }});

  tests.push_back({"lifecycle_empty_batch_summary", [] {
                     Harness h;
                     const auto start = h.controller.start({}, true);
                     const auto stop = h.controller.stop({});
                     require(start.classification() == tn::BatchClassification::Empty, "empty");
                     require(tn::summarize(start) == "No tunnels found matching criteria",
                             tn::summarize(start));
                     require(tn::summarize(stop) == "No tunnels found matching criteria",
                             tn::summarize(stop));
                     require(h.inspector.list_calls == 0, "no process-table read");
                   }});
}
