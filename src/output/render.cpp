#include "tunnels/output/render.hpp"

#include "tunnels/common/fs.hpp"
#include "tunnels/common/json_util.hpp"
#include "tunnels/common/toml.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace tunnels::output {

namespace {

constexpr const char *RESET = "\033[0m";
constexpr const char *BOLD = "\033[1m";
constexpr const char *DIM = "\033[2m";
constexpr const char *RED = "\033[31m";
constexpr const char *GREEN = "\033[32m";
constexpr const char *YELLOW = "\033[33m";

enum class Align { Left, Center, Right };

struct BoxChars {
  const char *top_left;
  const char *top_right;
  const char *bottom_left;
  const char *bottom_right;
  const char *horizontal;
  const char *vertical;
  const char *top_tee;
  const char *bottom_tee;
  const char *left_tee;
  const char *right_tee;
  const char *cross;
};

constexpr BoxChars kRounded{"╭", "╮", "╰", "╯", "─", "│", "┬", "┴", "├", "┤", "┼"};

struct Column {
  std::string key;
  std::string title;
  std::size_t width = 0;
  Align align = Align::Left;
};

Align column_align(const std::string &key) {
  if (key == "status") {
    return Align::Center;
  }
  if (key == "pid" || key == "port" || key.ends_with("_port")) {
    return Align::Right;
  }
  return Align::Left;
}

std::string repeat(const char *piece, const std::size_t count) {
  std::string out;
  for (std::size_t i = 0; i < count; ++i) {
    out += piece;
  }
  return out;
}

/// Terminal columns taken by UTF-8 text, counted as one per code point.
std::size_t display_width(const std::string &text) {
  std::size_t width = 0;
  for (const char ch : text) {
    if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
      ++width;
    }
  }
  return width;
}

std::string pad(const std::string &text, const std::size_t width, const Align align) {
  const std::size_t text_width = display_width(text);
  if (text_width >= width) {
    return text;
  }
  const std::size_t gap = width - text_width;
  switch (align) {
  case Align::Right:
    return std::string(gap, ' ') + text;
  case Align::Center:
    return std::string(gap / 2, ' ') + text + std::string(gap - gap / 2, ' ');
  case Align::Left:
    break;
  }
  return text + std::string(gap, ' ');
}

std::string style_cell(const std::string &key, const std::string &raw, const std::string &padded,
                       const bool color) {
  if (!color || raw.empty()) {
    return padded;
  }
  const std::size_t lead = padded.find(raw);
  const std::string before = padded.substr(0, lead);
  const std::string after = padded.substr(lead + raw.size());
  if (key == "status") {
    return before + format_status(raw, true) + after;
  }
  if (key == "name") {
    return before + GREEN + raw + RESET + after;
  }
  return before + DIM + raw + RESET + after;
}

const std::string &field_value(const Record &record, const std::string &key) {
  static const std::string kEmpty;
  for (const auto &[k, v] : record) {
    if (k == key) {
      return v;
    }
  }
  return kEmpty;
}

std::vector<Column> layout(const std::vector<Record> &records) {
  std::vector<Column> columns;
  if (records.empty()) {
    return columns;
  }
  for (const auto &[key, unused] : records.front()) {
    (void)unused;
    Column column{.key = key, .title = column_title(key), .width = 0, .align = column_align(key)};
    column.width = display_width(column.title);
    for (const auto &record : records) {
      for (const auto &line : common::split(field_value(record, key), '\n')) {
        column.width = std::max(column.width, display_width(line));
      }
    }
    columns.push_back(std::move(column));
  }
  return columns;
}

/// Cell text split into display lines; every row gets as many lines as its
/// tallest cell.
std::vector<std::vector<std::string>> row_lines(const Record &record,
                                                const std::vector<Column> &columns) {
  std::vector<std::vector<std::string>> cells;
  std::size_t height = 1;
  for (const auto &column : columns) {
    auto lines = common::split(field_value(record, column.key), '\n');
    if (lines.empty()) {
      lines.emplace_back();
    }
    height = std::max(height, lines.size());
    cells.push_back(std::move(lines));
  }
  for (auto &lines : cells) {
    lines.resize(height);
  }
  return cells;
}

std::string header_line(const std::vector<Column> &columns, const std::string &separator,
                        const bool color) {
  std::string out;
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    const std::string padded = pad(columns[i].title, columns[i].width, columns[i].align);
    out += color ? std::string(BOLD) + YELLOW + DIM + padded + RESET : padded;
  }
  return out;
}

std::vector<std::string> body_lines(const std::vector<Record> &records,
                                    const std::vector<Column> &columns,
                                    const std::string &separator, const bool color) {
  std::vector<std::string> out;
  for (const auto &record : records) {
    const auto cells = row_lines(record, columns);
    const std::size_t height = cells.empty() ? 0 : cells.front().size();
    for (std::size_t line = 0; line < height; ++line) {
      std::string text;
      for (std::size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
          text += separator;
        }
        const std::string &raw = cells[i][line];
        text += style_cell(columns[i].key, raw, pad(raw, columns[i].width, columns[i].align),
                           color);
      }
      out.push_back(std::move(text));
    }
  }
  return out;
}

std::size_t inner_width(const std::vector<Column> &columns, const std::size_t separator_width) {
  std::size_t width = 0;
  for (const auto &column : columns) {
    width += column.width;
  }
  if (!columns.empty()) {
    width += separator_width * (columns.size() - 1);
  }
  return width;
}

bool looks_numeric(const std::string &value) {
  if (value.empty()) {
    return false;
  }
  std::size_t start = (value[0] == '-' || value[0] == '+') ? 1 : 0;
  if (start == value.size()) {
    return false;
  }
  bool dot = false;
  for (std::size_t i = start; i < value.size(); ++i) {
    if (value[i] == '.' && !dot) {
      dot = true;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(value[i])) == 0) {
      return false;
    }
  }
  return true;
}

bool needs_yaml_quotes(const std::string &value) {
  static const std::array<const char *, 11> kReserved = {
      "true", "false", "yes", "no", "on", "off", "null", "~", "y", "n", ".inf"};
  if (value.empty() || looks_numeric(value)) {
    return true;
  }
  const std::string lowered = common::to_lower(value);
  for (const char *word : kReserved) {
    if (lowered == word) {
      return true;
    }
  }
  static const std::string kIndicators = "-?:,[]{}#&*!|>'\"%@`";
  if (kIndicators.find(value.front()) != std::string::npos) {
    return true;
  }
  if (std::isspace(static_cast<unsigned char>(value.front())) != 0 ||
      std::isspace(static_cast<unsigned char>(value.back())) != 0) {
    return true;
  }
  return value.find(": ") != std::string::npos || value.find(" #") != std::string::npos ||
         value.back() == ':';
}

std::string yaml_scalar(const std::string &value, const std::string &indent) {
  if (value.find('\n') != std::string::npos) {
    std::string out = "|-";
    for (const auto &line : common::split(value, '\n')) {
      out += "\n" + indent + "  " + line;
    }
    return out;
  }
  if (!needs_yaml_quotes(value)) {
    return value;
  }
  std::string out = "'";
  for (const char ch : value) {
    if (ch == '\'') {
      out += "''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

bool bare_toml_key(const std::string &key) {
  return !key.empty() && std::all_of(key.begin(), key.end(), [](unsigned char c) {
    return std::isalnum(c) != 0 || c == '_' || c == '-';
  });
}

} // namespace

std::optional<OutputFormat> parse_output_format(std::string_view value) {
  const std::string lowered = common::to_lower(common::trim(std::string(value)));
  if (lowered == "panel") {
    return OutputFormat::Panel;
  }
  if (lowered == "table") {
    return OutputFormat::Table;
  }
  if (lowered == "json") {
    return OutputFormat::Json;
  }
  if (lowered == "yaml" || lowered == "yml") {
    return OutputFormat::Yaml;
  }
  if (lowered == "toml") {
    return OutputFormat::Toml;
  }
  return std::nullopt;
}

std::string_view output_format_name(const OutputFormat format) {
  switch (format) {
  case OutputFormat::Panel:
    return "panel";
  case OutputFormat::Table:
    return "table";
  case OutputFormat::Json:
    return "json";
  case OutputFormat::Yaml:
    return "yaml";
  case OutputFormat::Toml:
    return "toml";
  }
  return "panel";
}

common::Result<std::vector<Record>> select_columns(const std::vector<Record> &records,
                                                   const std::vector<std::string> &columns) {
  using R = common::Result<std::vector<Record>>;
  if (columns.empty() || records.empty()) {
    return R::success(records);
  }

  std::vector<std::string> available;
  for (const auto &[key, unused] : records.front()) {
    (void)unused;
    available.push_back(key);
  }
  for (const auto &column : columns) {
    if (std::find(available.begin(), available.end(), column) == available.end()) {
      return R::failure(common::ErrorKind::Usage, "Unknown column: " + column +
                                                      " (available: " +
                                                      common::join(available, ", ") + ")");
    }
  }

  std::vector<Record> out;
  out.reserve(records.size());
  for (const auto &record : records) {
    Record selected;
    for (const auto &column : columns) {
      const bool seen = std::any_of(selected.begin(), selected.end(),
                                    [&](const Field &field) { return field.first == column; });
      if (!seen) {
        selected.emplace_back(column, field_value(record, column));
      }
    }
    out.push_back(std::move(selected));
  }
  return R::success(std::move(out));
}

std::string column_title(const std::string &key) {
  std::string spaced = key;
  std::replace(spaced.begin(), spaced.end(), '_', ' ');
  return common::title_case(spaced);
}

std::string format_status(const std::string &value, const bool color) {
  const std::string lowered = common::to_lower(value);
  if (lowered == "running") {
    return color ? std::string(BOLD) + GREEN + "Running" + RESET : "Running";
  }
  if (lowered == "inactive") {
    return color ? std::string(BOLD) + RED + "Inactive" + RESET : "Inactive";
  }
  if (lowered == "connecting") {
    return color ? std::string(BOLD) + DIM + "Connecting" + RESET : "Connecting";
  }
  return color ? std::string(DIM) + value + RESET : value;
}

std::string render_table(const std::vector<Record> &records, const bool color) {
  const auto columns = layout(records);
  if (columns.empty()) {
    return "";
  }
  const BoxChars &box = kRounded;
  const std::string separator = std::string(" ") + box.vertical + " ";

  const auto rule = [&](const char *left, const char *mid, const char *right) {
    std::string out = left;
    for (std::size_t i = 0; i < columns.size(); ++i) {
      if (i > 0) {
        out += mid;
      }
      out += repeat(box.horizontal, columns[i].width + 2);
    }
    return out + right + "\n";
  };

  std::ostringstream out;
  out << rule(box.top_left, box.top_tee, box.top_right);
  out << box.vertical << ' ' << header_line(columns, separator, color) << ' ' << box.vertical
      << "\n";
  out << rule(box.left_tee, box.cross, box.right_tee);
  for (const auto &line : body_lines(records, columns, separator, color)) {
    out << box.vertical << ' ' << line << ' ' << box.vertical << "\n";
  }
  out << rule(box.bottom_left, box.bottom_tee, box.bottom_right);
  return out.str();
}

std::string render_panel(const std::vector<Record> &records, const bool color) {
  const BoxChars &box = kRounded;
  const auto columns = layout(records);
  const std::string separator = "  ";
  const std::string title = std::string(" ") + kPanelTitle + " ";
  const std::size_t width = std::max(inner_width(columns, separator.size()), title.size() + 1);

  const std::string border_open = color ? DIM : "";
  const std::string border_close = color ? RESET : "";
  const std::string styled_title =
      color ? std::string(RESET) + BOLD + title + RESET + DIM : title;

  std::ostringstream out;
  out << border_open << box.top_left << box.horizontal << styled_title
      << repeat(box.horizontal, width + 1 - title.size()) << box.top_right << border_close
      << "\n";

  const auto framed = [&](const std::string &text, const std::size_t visible) {
    out << border_open << box.vertical << border_close << ' ' << text
        << std::string(width - visible, ' ') << ' ' << border_open << box.vertical
        << border_close << "\n";
  };

  if (!columns.empty()) {
    framed(header_line(columns, separator, color), inner_width(columns, separator.size()));
    for (const auto &line : body_lines(records, columns, separator, color)) {
      framed(line, inner_width(columns, separator.size()));
    }
  }
  out << border_open << box.bottom_left << repeat(box.horizontal, width + 2) << box.bottom_right
      << border_close << "\n";
  return out.str();
}

std::string render_json(const std::vector<Record> &records) {
  if (records.empty()) {
    return "[]\n";
  }
  std::ostringstream out;
  out << "[\n";
  for (std::size_t i = 0; i < records.size(); ++i) {
    out << "  {";
    const auto &record = records[i];
    for (std::size_t j = 0; j < record.size(); ++j) {
      out << (j == 0 ? "\n" : ",\n") << "    " << common::json_quote(record[j].first) << ": "
          << common::json_quote(record[j].second);
    }
    out << (record.empty() ? "}" : "\n  }") << (i + 1 < records.size() ? ",\n" : "\n");
  }
  out << "]\n";
  return out.str();
}

std::string render_yaml(const std::vector<Record> &records) {
  if (records.empty()) {
    return "[]\n";
  }
  std::ostringstream out;
  for (const auto &record : records) {
    if (record.empty()) {
      out << "- {}\n";
      continue;
    }
    bool first = true;
    for (const auto &[key, value] : record) {
      out << (first ? "- " : "  ") << key << ": " << yaml_scalar(value, "  ") << "\n";
      first = false;
    }
  }
  return out.str();
}

std::string render_toml(const std::vector<Record> &records) {
  if (records.empty()) {
    return std::string(kTomlKey) + " = []\n";
  }
  std::ostringstream out;
  for (std::size_t i = 0; i < records.size(); ++i) {
    if (i > 0) {
      out << "\n";
    }
    out << "[[" << kTomlKey << "]]\n";
    for (const auto &[key, value] : records[i]) {
      out << (bare_toml_key(key) ? key : common::quote_toml_string(key)) << " = "
          << common::quote_toml_string(value) << "\n";
    }
  }
  return out.str();
}

common::Result<std::string> render(const std::vector<Record> &records,
                                   const RenderOptions &options) {
  auto selected = select_columns(records, options.columns);
  if (!selected.ok()) {
    return common::Result<std::string>::failure(selected.status());
  }
  const auto &rows = selected.value();

  switch (options.format) {
  case OutputFormat::Panel:
    return common::Result<std::string>::success(render_panel(rows, options.color));
  case OutputFormat::Table:
    return common::Result<std::string>::success(render_table(rows, options.color));
  case OutputFormat::Json:
    return common::Result<std::string>::success(render_json(rows));
  case OutputFormat::Yaml:
    return common::Result<std::string>::success(render_yaml(rows));
  case OutputFormat::Toml:
    return common::Result<std::string>::success(render_toml(rows));
  }
  return common::Result<std::string>::failure(common::ErrorKind::Usage, "unsupported format");
}

} // namespace tunnels::output
