#pragma once

#include "tunnels/common/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tunnels::output {

using Field = std::pair<std::string, std::string>;
using Record = std::vector<Field>;

enum class OutputFormat {
  Panel,
  Table,
  Json,
  Yaml,
  Toml,
};

[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view value);
[[nodiscard]] std::string_view output_format_name(OutputFormat format);

struct RenderOptions {
  OutputFormat format = OutputFormat::Panel;
  /// Field keys to keep, in output order. Empty keeps every field.
  std::vector<std::string> columns;
  bool color = false;
};

inline constexpr const char *kPanelTitle = "Active Tunnels";
inline constexpr const char *kTomlKey = "Tunnel";

/// Keep and reorder the named fields. Unknown names are a usage error.
[[nodiscard]] common::Result<std::vector<Record>>
select_columns(const std::vector<Record> &records, const std::vector<std::string> &columns);

/// `local_port` -> `Local Port`.
[[nodiscard]] std::string column_title(const std::string &key);

/// Status cell text: title-cased, coloured when `color` is set.
[[nodiscard]] std::string format_status(const std::string &value, bool color);

[[nodiscard]] std::string render_table(const std::vector<Record> &records, bool color);
[[nodiscard]] std::string render_panel(const std::vector<Record> &records, bool color);
[[nodiscard]] std::string render_json(const std::vector<Record> &records);
[[nodiscard]] std::string render_yaml(const std::vector<Record> &records);
[[nodiscard]] std::string render_toml(const std::vector<Record> &records);

[[nodiscard]] common::Result<std::string> render(const std::vector<Record> &records,
                                                 const RenderOptions &options);

} // namespace tunnels::output
