#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "tunnels/common/toml.hpp"
#include "tunnels/config/config.hpp"

#include <variant>

namespace {

constexpr const char *kSampleConfig = R"(# sample
autossh = false

[observability]
backend = "log"

[[tunnels]]
name = "API Gateway"
group = "prod"
hostname = "bastion.example.com"
[tunnels.local]
port = 8080
host = "db.internal"
host_port = 5432

[[tunnels]]
name = "socks"
hostname = "jump"
dynamic = { bind_address = "127.0.0.1", port = 1080 }

[[tunnels]]
name = "metrics"
group = "prod"
hostname = 'bastion.example.com'
[tunnels.local]
local_socket = "/tmp/metrics.sock"
remote_socket = "/run/metrics.sock"
)";

} // namespace

void register_config_tests(std::vector<tunnels::tests::TestCase> &tests) {
  using tunnels::tests::require;
  namespace cfg = tunnels::config;
  namespace common = tunnels::common;
  namespace th = tunnels::testing;

  tests.push_back({"toml_parses_array_tables_and_inline_tables", [] {
                     const auto parsed = common::parse_toml(kSampleConfig);
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(!doc.get_bool("autossh", true), "top-level bool");
                     require(doc.get_string("observability.backend") == "log", "section value");
                     const auto &tunnels = doc.array("tunnels");
                     require(tunnels.size() == 3, "three array elements");
                     require(tunnels[0].find_integer("local.port") == 8080, "sub-table value");
                     require(tunnels[1].get_string("dynamic.bind_address") == "127.0.0.1",
                             "inline table value");
                     require(tunnels[2].get_string("hostname") == "bastion.example.com",
                             "single-quoted string");
                   }});

  tests.push_back({"toml_rejects_malformed_line", [] {
                     const auto parsed = common::parse_toml("name \"oops\"\n");
                     require(!parsed.ok(), "line without '=' should fail");
                     require(parsed.kind() == common::ErrorKind::Config, "config error kind");
                   }});

  tests.push_back({"config_parses_sample", [] {
                     const auto parsed = cfg::parse_config(kSampleConfig);
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(!config.autossh, "autossh disabled");
                     require(config.observability.backend == "log", "backend");
                     require(config.tunnels.size() == 3, "tunnel count");

                     const auto &gateway = config.tunnels[0];
                     require(gateway.group == std::optional<std::string>("prod"), "group");
                     const auto *local = std::get_if<cfg::Local>(&gateway.forwarding);
                     require(local != nullptr, "local forwarding");
                     require(local->address() == "8080:db.internal:5432", local->address());

                     const auto &socks = config.tunnels[1];
                     require(socks.is_dynamic(), "dynamic forwarding");
                     require(std::get<cfg::Dynamic>(socks.forwarding).address() ==
                                 "[127.0.0.1:]1080",
                             "dynamic address");
                     require(!socks.group.has_value(), "no group");
                   }});

  tests.push_back({"config_groups_keep_first_seen_order", [] {
                     const auto parsed = cfg::parse_config(kSampleConfig);
                     require(parsed.ok(), parsed.error());
                     const auto groups = parsed.value().groups();
                     require(groups.size() == 1, "one group");
                     require(groups[0].name == "prod", groups[0].name);
                     require(groups[0].tunnels.size() == 2, "two prod tunnels");
                     require(groups[0].tunnels[1].name == "metrics", "order preserved");
                   }});

  tests.push_back({"config_requires_exactly_one_forwarding", [] {
                     const auto neither =
                         cfg::parse_config("[[tunnels]]\nname = \"a\"\nhostname = \"h\"\n");
                     require(!neither.ok(), "missing forwarding should fail");
                     require(neither.kind() == common::ErrorKind::Config, "config error");

                     const auto both = cfg::parse_config(
                         "[[tunnels]]\nname = \"a\"\nhostname = \"h\"\n"
                         "dynamic = { port = 1080 }\nlocal = { port = 1, remote_socket = \"/s\" }\n");
                     require(!both.ok(), "both forwardings should fail");
                   }});

  tests.push_back({"config_rejects_missing_fields_and_bad_ports", [] {
                     require(!cfg::parse_config("[[tunnels]]\nhostname = \"h\"\n"
                                                "dynamic = { port = 1 }\n")
                                  .ok(),
                             "missing name");
                     require(!cfg::parse_config("[[tunnels]]\nname = \"a\"\n"
                                                "dynamic = { port = 1 }\n")
                                  .ok(),
                             "missing hostname");
                     const auto bad_port = cfg::parse_config(
                         "[[tunnels]]\nname = \"a\"\nhostname = \"h\"\ndynamic = { port = 70000 }\n");
                     require(!bad_port.ok(), "port out of range");
                     require(bad_port.error().find("1-65535") != std::string::npos,
                             bad_port.error());
                   }});

  tests.push_back({"config_rejects_duplicate_names", [] {
                     const auto parsed = cfg::parse_config(
                         "[[tunnels]]\nname = \"a\"\nhostname = \"h\"\ndynamic = { port = 1080 }\n"
                         "[[tunnels]]\nname = \"a\"\nhostname = \"h\"\ndynamic = { port = 1081 }\n");
                     require(!parsed.ok(), "duplicate names should fail");
                     require(parsed.error().find("duplicate") != std::string::npos,
                             parsed.error());
                   }});

  tests.push_back({"config_rejects_invalid_local_combination", [] {
                     const auto parsed = cfg::parse_config(
                         "[[tunnels]]\nname = \"a\"\nhostname = \"h\"\n[tunnels.local]\n"
                         "port = 8080\nhost = \"db\"\n");
                     require(!parsed.ok(), "host without host_port should fail");
                     require(parsed.error().find("Invalid combination") != std::string::npos,
                             parsed.error());
                   }});

  tests.push_back({"config_rejects_unknown_backend", [] {
                     const auto parsed =
                         cfg::parse_config("[observability]\nbackend = \"prometheus\"\n");
                     require(!parsed.ok(), "unknown backend should fail");
                   }});

  tests.push_back({"config_load_missing_file_is_empty", [] {
                     th::TempWorkspace workspace;
                     const th::ConfigOverrideGuard guard(workspace.path() / "missing.toml");
                     const th::EnvGuard autossh("TUNNELS_AUTOSSH", std::nullopt);
                     const th::EnvGuard log("TUNNELS_LOG", std::nullopt);
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().tunnels.empty(), "no tunnels");
                     require(loaded.value().autossh, "autossh defaults on");
                   }});

  tests.push_back({"config_missing_file_still_validates_env_overrides", [] {
                     th::TempWorkspace workspace;
                     const th::ConfigOverrideGuard guard(workspace.path() / "missing.toml");
                     const th::EnvGuard env_file("TUNNELS_ENV_FILE", std::nullopt);
                     const th::EnvGuard log("TUNNELS_LOG", "bogus");
                     std::vector<std::string> warnings;
                     const auto loaded = cfg::load_config(warnings);
                     require(!loaded.ok(), "unknown backend from the environment should fail");
                     require(loaded.kind() == common::ErrorKind::Config, "config error kind");
                     require(loaded.error().find("Invalid observability.backend: bogus") !=
                                 std::string::npos,
                             loaded.error());
                   }});

  tests.push_back({"config_override_guard_keeps_env_path_out_of_override", [] {
                     th::TempWorkspace workspace;
                     const th::EnvGuard env_path("TUNNELS_CONFIG_PATH",
                                                 (workspace.path() / "env.toml").string());
                     const th::ConfigOverrideGuard outer;
                     {
                       const th::ConfigOverrideGuard guard(workspace.path() / "explicit.toml");
                       require(cfg::config_path().value() == workspace.path() / "explicit.toml",
                               "explicit override wins");
                     }
                     require(!cfg::config_path_override().has_value(),
                             "env path is not promoted to an explicit override");
                     require(cfg::config_path().value() == workspace.path() / "env.toml",
                             cfg::config_path().value().string());
                   }});

  tests.push_back({"config_path_follows_xdg_config_home", [] {
                     th::TempWorkspace workspace;
                     const th::ConfigOverrideGuard guard;
                     const th::EnvGuard env_path("TUNNELS_CONFIG_PATH", std::nullopt);
                     const th::EnvGuard xdg("XDG_CONFIG_HOME", workspace.path().string());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == workspace.path() / "tunnels" / "config.toml",
                             path.value().string());
                   }});

  tests.push_back({"config_env_path_and_overrides", [] {
                     th::TempWorkspace workspace;
                     workspace.create_file("custom.toml", kSampleConfig);
                     const th::ConfigOverrideGuard guard;
                     const th::EnvGuard env_path("TUNNELS_CONFIG_PATH",
                                                 (workspace.path() / "custom.toml").string());
                     const th::EnvGuard autossh("TUNNELS_AUTOSSH", "1");
                     const th::EnvGuard log("TUNNELS_LOG", "none");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().tunnels.size() == 3, "tunnels loaded from env path");
                     require(loaded.value().autossh, "TUNNELS_AUTOSSH overrides file");
                     require(loaded.value().observability.backend == "none",
                             "TUNNELS_LOG overrides file");
                   }});

  tests.push_back({"config_loads_dotenv_without_overriding", [] {
                     th::TempWorkspace workspace;
                     workspace.create_file("config.toml", "autossh = true\n");
                     workspace.create_file(".env", "TUNNELS_AUTOSSH=false\n");
                     const th::ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     const th::EnvGuard env_file("TUNNELS_ENV_FILE", std::nullopt);
                     {
                       const th::EnvGuard autossh("TUNNELS_AUTOSSH", std::nullopt);
                       const auto loaded = cfg::load_config();
                       require(loaded.ok(), loaded.error());
                       require(!loaded.value().autossh, ".env value should apply");
                     }
                     {
                       const th::EnvGuard autossh("TUNNELS_AUTOSSH", "true");
                       const auto loaded = cfg::load_config();
                       require(loaded.ok(), loaded.error());
                       require(loaded.value().autossh, "existing variable wins over .env");
                     }
                   }});

  tests.push_back({"config_invalid_file_reports_path", [] {
                     th::TempWorkspace workspace;
                     workspace.create_file("config.toml", "[[tunnels]]\nname = \"x\"\n");
                     const th::ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "invalid config should fail");
                     require(loaded.kind() == common::ErrorKind::Config, "config error kind");
                     require(loaded.error().find("config.toml") != std::string::npos,
                             loaded.error());
                   }});
}
