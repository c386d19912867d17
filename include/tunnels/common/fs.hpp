#pragma once

#include "tunnels/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tunnels::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string title_case(const std::string &value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &separator);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> xdg_config_home();
[[nodiscard]] std::string expand_path(std::string value);

/// Read a whole file; nullopt when it cannot be opened.
[[nodiscard]] std::optional<std::string> read_file(const std::filesystem::path &path);

/// Resolve an executable name against PATH. Names containing '/' are checked as-is.
[[nodiscard]] std::optional<std::filesystem::path> find_executable(const std::string &name);

} // namespace tunnels::common
