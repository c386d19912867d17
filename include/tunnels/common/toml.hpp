#pragma once

#include "tunnels/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tunnels::common {

struct TomlTable {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] bool has_table(const std::string &name) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] std::optional<std::string> find_string(const std::string &key) const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::optional<std::int64_t> find_integer(const std::string &key) const;
};

/// Flat key/value view of a TOML file. Dotted keys address `[section]` values;
/// `[[name]]` array tables are kept per element, with their sub-tables
/// (`[name.sub]`) and inline tables flattened into the element.
struct TomlDocument : TomlTable {
  std::unordered_map<std::string, std::vector<TomlTable>> arrays;

  [[nodiscard]] const std::vector<TomlTable> &array(const std::string &name) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace tunnels::common
