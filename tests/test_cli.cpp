#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "tunnels/cli/commands.hpp"

namespace {

namespace th = tunnels::testing;

constexpr const char *kCliConfig = R"(autossh = false

[[tunnels]]
name = "cli test tunnel"
group = "cli-tests"
hostname = "unreachable.invalid"
dynamic = { port = 19999 }
)";

int run_with_config(const th::TempWorkspace &workspace, std::vector<std::string> args) {
  args.insert(args.begin(), (workspace.path() / "config.toml").string());
  args.insert(args.begin(), "--config");
  return tunnels::cli::run_cli(std::move(args));
}

} // namespace

void register_cli_tests(std::vector<tunnels::tests::TestCase> &tests) {
  using tunnels::tests::require;
  namespace cli = tunnels::cli;

  tests.push_back({"cli_version_and_help", [] {
                     require(cli::run_cli(std::vector<std::string>{"version"}) == cli::kExitOk,
                             "version");
                     require(cli::run_cli(std::vector<std::string>{"--help"}) == cli::kExitOk,
                             "help");
                     require(cli::version_string().rfind("tunnels ", 0) == 0,
                             cli::version_string());
                   }});

  tests.push_back({"cli_unknown_command_is_usage_error", [] {
                     require(cli::run_cli(std::vector<std::string>{"launch"}) == cli::kExitUsage,
                             "unknown command");
                   }});

  tests.push_back({"cli_missing_config_value_is_usage_error", [] {
                     const th::ConfigOverrideGuard guard;
                     require(cli::run_cli(std::vector<std::string>{"status", "--config"}) ==
                                 cli::kExitUsage,
                             "--config without value");
                   }});

  tests.push_back({"cli_selector_usage_errors", [] {
                     th::TempWorkspace workspace;
                     workspace.create_file("config.toml", kCliConfig);
                     const th::ConfigOverrideGuard guard;
                     require(run_with_config(workspace, {"start"}) == cli::kExitUsage,
                             "no selector");
                     require(run_with_config(workspace, {"start", "--name", "cli test tunnel",
                                                         "--all"}) == cli::kExitUsage,
                             "two selectors");
                     require(run_with_config(workspace, {"stop", "-n", "missing"}) ==
                                 cli::kExitUsage,
                             "unknown tunnel");
                     require(run_with_config(workspace, {"stop", "--group", "missing"}) ==
                                 cli::kExitUsage,
                             "unknown group");
                     require(run_with_config(workspace, {"start", "--name"}) == cli::kExitUsage,
                             "dangling option");
                   }});

  tests.push_back({"cli_status_usage_errors", [] {
                     th::TempWorkspace workspace;
                     workspace.create_file("config.toml", kCliConfig);
                     const th::ConfigOverrideGuard guard;
                     require(run_with_config(workspace, {"status", "--format", "xml"}) ==
                                 cli::kExitUsage,
                             "unknown format");
                     require(run_with_config(workspace, {"status", "-c", "bogus"}) ==
                                 cli::kExitUsage,
                             "unknown column");
                   }});

  tests.push_back({"cli_status_and_stop_succeed", [] {
                     th::TempWorkspace workspace;
                     workspace.create_file("config.toml", kCliConfig);
                     const th::ConfigOverrideGuard guard;
                     require(run_with_config(workspace, {"status", "-f", "json", "-c", "name",
                                                         "-c", "status"}) == cli::kExitOk,
                             "json status");
                     require(run_with_config(workspace, {"status", "--format", "table"}) ==
                                 cli::kExitOk,
                             "table status");
                     require(run_with_config(workspace, {"stop", "--group", "cli-tests"}) ==
                                 cli::kExitOk,
                             "stopping a tunnel that is not running");
                   }});

  tests.push_back({"cli_invalid_config_exits_one", [] {
                     th::TempWorkspace workspace;
                     workspace.create_file("config.toml", "[[tunnels]]\nname = \"broken\"\n");
                     const th::ConfigOverrideGuard guard;
                     require(run_with_config(workspace, {"status"}) == cli::kExitError,
                             "config error exit code");
                   }});
}
