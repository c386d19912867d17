#pragma once

#include "tunnels/common/result.hpp"
#include "tunnels/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tunnels::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
/// The explicit `--config` override, without the TUNNELS_CONFIG_PATH fallback.
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Parse and validate configuration text. Does not read the environment.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

/// Load `.env` files, read the config file (a missing file is an empty
/// configuration), apply environment overrides and validate.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config(std::vector<std::string> &warnings);

/// Returns warnings on success; hard errors as a Config failure.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace tunnels::config
