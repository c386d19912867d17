#include "tunnels/config/config.hpp"

#include "tunnels/common/fs.hpp"
#include "tunnels/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unordered_set>

#include <unistd.h>

namespace tunnels::config {

namespace {

constexpr const char *CONFIG_FOLDER = "tunnels";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr std::int64_t kMaxPort = 65535;
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TUNNELS_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::optional<std::string> expand_optional(const std::optional<std::string> &value) {
  if (!value.has_value()) {
    return std::nullopt;
  }
  return expand_config_value(*value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!is_valid_env_name(key)) {
      continue;
    }
    // overwrite=0 keeps variables already present in the environment
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("TUNNELS_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

common::Result<std::optional<std::uint16_t>> read_port(const common::TomlTable &table,
                                                       const std::string &key,
                                                       const std::string &context) {
  using PortResult = common::Result<std::optional<std::uint16_t>>;
  if (!table.has(key)) {
    return PortResult::success(std::nullopt);
  }
  const auto value = table.find_integer(key);
  if (!value.has_value() || *value < 1 || *value > kMaxPort) {
    return PortResult::failure(common::ErrorKind::Config,
                               context + ": " + key + " must be an integer in 1-65535");
  }
  return PortResult::success(static_cast<std::uint16_t>(*value));
}

common::Result<Dynamic> read_dynamic(const common::TomlTable &table, const std::string &context) {
  auto port = read_port(table, "dynamic.port", context);
  if (!port.ok()) {
    return common::Result<Dynamic>::failure(port.status());
  }
  if (!port.value().has_value()) {
    return common::Result<Dynamic>::failure(common::ErrorKind::Config,
                                            context + ": dynamic.port is required");
  }

  Dynamic dynamic;
  dynamic.port = *port.value();
  dynamic.bind_address = expand_optional(table.find_string("dynamic.bind_address"));
  return common::Result<Dynamic>::success(std::move(dynamic));
}

common::Result<Local> read_local(const common::TomlTable &table, const std::string &context) {
  auto port = read_port(table, "local.port", context);
  if (!port.ok()) {
    return common::Result<Local>::failure(port.status());
  }
  auto host_port = read_port(table, "local.host_port", context);
  if (!host_port.ok()) {
    return common::Result<Local>::failure(host_port.status());
  }

  Local local;
  local.port = port.value();
  local.host_port = host_port.value();
  local.local_socket = expand_optional(table.find_string("local.local_socket"));
  local.host = table.find_string("local.host");
  local.remote_socket = table.find_string("local.remote_socket");
  local.bind_address = table.find_string("local.bind_address");

  if (auto valid = local.validate(); !valid.ok()) {
    return common::Result<Local>::failure(common::ErrorKind::Config,
                                          context + ": " + valid.error());
  }
  return common::Result<Local>::success(std::move(local));
}

common::Result<Tunnel> read_tunnel(const common::TomlTable &table, const std::size_t index) {
  Tunnel tunnel;
  tunnel.name = common::trim(table.get_string("name"));
  const std::string context =
      tunnel.name.empty() ? "tunnels[" + std::to_string(index) + "]" : "tunnel '" + tunnel.name + "'";
  if (tunnel.name.empty()) {
    return common::Result<Tunnel>::failure(common::ErrorKind::Config,
                                           context + ": name is required");
  }

  tunnel.hostname = expand_config_value(common::trim(table.get_string("hostname")));
  if (tunnel.hostname.empty()) {
    return common::Result<Tunnel>::failure(common::ErrorKind::Config,
                                           context + ": hostname is required");
  }

  if (const auto group = table.find_string("group"); group.has_value() && !group->empty()) {
    tunnel.group = *group;
  }

  const bool has_dynamic = table.has_table("dynamic");
  const bool has_local = table.has_table("local");
  if (has_dynamic == has_local) {
    return common::Result<Tunnel>::failure(
        common::ErrorKind::Config, context + ": exactly one of 'dynamic' or 'local' is required");
  }

  if (has_dynamic) {
    auto dynamic = read_dynamic(table, context);
    if (!dynamic.ok()) {
      return common::Result<Tunnel>::failure(dynamic.status());
    }
    tunnel.forwarding = std::move(dynamic.value());
  } else {
    auto local = read_local(table, context);
    if (!local.ok()) {
      return common::Result<Tunnel>::failure(local.status());
    }
    tunnel.forwarding = std::move(local.value());
  }

  return common::Result<Tunnel>::success(std::move(tunnel));
}

std::optional<bool> parse_bool_env(const char *raw) {
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  const std::string value = common::to_lower(common::trim(raw));
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  return std::nullopt;
}

bool is_privileged(const std::optional<std::uint16_t> &port) {
  return port.has_value() && *port != 0 && *port < 1024;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }

    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto base = common::xdg_config_home();
  if (!base.ok()) {
    return common::Result<std::filesystem::path>::failure(base.status());
  }
  return common::Result<std::filesystem::path>::success(base.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.status());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void apply_env_overrides(Config &config) {
  if (const auto autossh = parse_bool_env(std::getenv("TUNNELS_AUTOSSH")); autossh.has_value()) {
    config.autossh = *autossh;
  }
  if (const char *log = std::getenv("TUNNELS_LOG"); log != nullptr && *log != '\0') {
    config.observability.backend = log;
  }
}

namespace {

common::Result<Config> read_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  Config config;
  config.autossh = doc.get_bool("autossh", config.autossh);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  const auto &tables = doc.array("tunnels");
  config.tunnels.reserve(tables.size());
  for (std::size_t i = 0; i < tables.size(); ++i) {
    auto tunnel = read_tunnel(tables[i], i);
    if (!tunnel.ok()) {
      return common::Result<Config>::failure(tunnel.status());
    }
    config.tunnels.push_back(std::move(tunnel.value()));
  }
  return common::Result<Config>::success(std::move(config));
}

} // namespace

common::Result<Config> parse_config(const std::string &content) {
  auto config = read_config(content);
  if (!config.ok()) {
    return config;
  }
  const auto validated = validate_config(config.value());
  if (!validated.ok()) {
    return common::Result<Config>::failure(validated.status());
  }
  return config;
}

common::Result<Config> load_config() {
  std::vector<std::string> warnings;
  return load_config(warnings);
}

common::Result<Config> load_config(std::vector<std::string> &warnings) {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  Config config;
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    const auto content = common::read_file(path);
    if (!content.has_value()) {
      return common::Result<Config>::failure(common::ErrorKind::Io,
                                             "Unable to open config file: " + path.string());
    }
    auto read = read_config(*content);
    if (!read.ok()) {
      return common::Result<Config>::failure(read.kind(), path.string() + ": " + read.error());
    }
    config = std::move(read.value());
  }
  apply_env_overrides(config);

  auto validated = validate_config(config);
  if (!validated.ok()) {
    return common::Result<Config>::failure(validated.kind(),
                                           path.string() + ": " + validated.error());
  }
  warnings = std::move(validated.value());
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (!backend.empty() && backend != "none" && backend != "noop" && backend != "log") {
    return Warnings::failure(common::ErrorKind::Config,
                             "Invalid observability.backend: " + config.observability.backend);
  }

  std::unordered_set<std::string> names;
  const bool superuser = geteuid() == 0;
  for (const auto &tunnel : config.tunnels) {
    if (common::trim(tunnel.name).empty()) {
      return Warnings::failure(common::ErrorKind::Config, "tunnel name must not be empty");
    }
    if (!names.insert(tunnel.name).second) {
      return Warnings::failure(common::ErrorKind::Config,
                               "duplicate tunnel name: " + tunnel.name);
    }
    if (common::trim(tunnel.hostname).empty()) {
      return Warnings::failure(common::ErrorKind::Config,
                               "tunnel '" + tunnel.name + "': hostname is required");
    }

    if (const auto *local = std::get_if<Local>(&tunnel.forwarding); local != nullptr) {
      if (auto valid = local->validate(); !valid.ok()) {
        return Warnings::failure(common::ErrorKind::Config,
                                 "tunnel '" + tunnel.name + "': " + valid.error());
      }
      if (!superuser && is_privileged(local->port)) {
        warnings.push_back("tunnel '" + tunnel.name +
                           "' forwards privileged port " + std::to_string(*local->port) +
                           " (only allowed for the superuser)");
      }
    } else if (const auto *dynamic = std::get_if<Dynamic>(&tunnel.forwarding); dynamic != nullptr) {
      if (dynamic->port == 0) {
        return Warnings::failure(common::ErrorKind::Config,
                                 "tunnel '" + tunnel.name + "': dynamic.port must be 1-65535");
      }
      if (!superuser && is_privileged(dynamic->port)) {
        warnings.push_back("tunnel '" + tunnel.name +
                           "' forwards privileged port " + std::to_string(dynamic->port) +
                           " (only allowed for the superuser)");
      }
    }
  }

  return Warnings::success(std::move(warnings));
}

} // namespace tunnels::config
