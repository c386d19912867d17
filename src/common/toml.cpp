#include "tunnels/common/toml.hpp"

#include "tunnels/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace tunnels::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  char quote = '\0';
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if ((ch == '"' || ch == '\'') && (i == 0 || line[i - 1] != '\\')) {
      if (!in_quotes) {
        in_quotes = true;
        quote = ch;
      } else if (ch == quote) {
        in_quotes = false;
      }
    }
    if (!in_quotes && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::vector<std::string> split_elements(const std::string &body) {
  std::vector<std::string> result;
  std::string current;
  bool in_quotes = false;
  char quote = '\0';

  for (std::size_t i = 0; i < body.size(); ++i) {
    const char ch = body[i];
    if ((ch == '"' || ch == '\'') && (i == 0 || body[i - 1] != '\\')) {
      if (!in_quotes) {
        in_quotes = true;
        quote = ch;
      } else if (ch == quote) {
        in_quotes = false;
      }
      current.push_back(ch);
      continue;
    }

    if (!in_quotes && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }

    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  bool escaped = false;
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
      } else {
        out.push_back(ch);
      }
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

bool is_bracketed(const std::string &value, const char open, const char close) {
  return value.size() >= 2 && value.front() == open && value.back() == close;
}

Status store_value(TomlTable &table, const std::string &key, const std::string &value,
                   const std::size_t line_number) {
  if (!is_bracketed(value, '{', '}')) {
    table.values[key] = value;
    return Status::success();
  }

  for (const auto &element : split_elements(value.substr(1, value.size() - 2))) {
    const std::size_t equals_index = element.find('=');
    if (equals_index == std::string::npos) {
      return Status::error(ErrorKind::Config,
                           "Invalid inline table at line " + std::to_string(line_number));
    }
    const std::string inner_key = trim(element.substr(0, equals_index));
    const std::string inner_value = trim(element.substr(equals_index + 1));
    if (inner_key.empty()) {
      return Status::error(ErrorKind::Config,
                           "Missing key in inline table at line " + std::to_string(line_number));
    }
    table.values[key + "." + inner_key] = inner_value;
  }
  return Status::success();
}

} // namespace

bool TomlTable::has(const std::string &key) const { return values.contains(key); }

bool TomlTable::has_table(const std::string &name) const {
  const std::string prefix = name + ".";
  for (const auto &[key, _] : values) {
    if (starts_with(key, prefix)) {
      return true;
    }
  }
  return false;
}

std::string TomlTable::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

std::optional<std::string> TomlTable::find_string(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  return unquote(it->second);
}

bool TomlTable::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::optional<std::int64_t> TomlTable::find_integer(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }

  const std::string normalized = trim(it->second);
  std::int64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }

  return parsed;
}

const std::vector<TomlTable> &TomlDocument::array(const std::string &name) const {
  static const std::vector<TomlTable> kEmpty;
  const auto it = arrays.find(name);
  return it == arrays.end() ? kEmpty : it->second;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_array;
  std::string current_prefix;
  std::size_t line_number = 0;

  const auto target = [&]() -> TomlTable & {
    if (current_array.empty()) {
      return document;
    }
    return document.arrays[current_array].back();
  };

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (is_bracketed(clean_line, '[', ']') && clean_line.size() >= 4 && clean_line[1] == '[' &&
        clean_line[clean_line.size() - 2] == ']') {
      const std::string name = trim(clean_line.substr(2, clean_line.size() - 4));
      if (name.empty()) {
        return Result<TomlDocument>::failure(
            ErrorKind::Config, "Invalid empty array table at line " + std::to_string(line_number));
      }
      document.arrays[name].emplace_back();
      current_array = name;
      current_prefix.clear();
      continue;
    }

    if (is_bracketed(clean_line, '[', ']')) {
      const std::string section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (section.empty()) {
        return Result<TomlDocument>::failure(
            ErrorKind::Config, "Invalid empty section at line " + std::to_string(line_number));
      }
      if (!current_array.empty() && starts_with(section, current_array + ".")) {
        current_prefix = section.substr(current_array.size() + 1) + ".";
      } else {
        current_array.clear();
        current_prefix = section + ".";
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure(
          ErrorKind::Config, "Invalid key/value at line " + std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure(ErrorKind::Config,
                                           "Missing key at line " + std::to_string(line_number));
    }

    auto stored = store_value(target(), current_prefix + key, value, line_number);
    if (!stored.ok()) {
      return Result<TomlDocument>::failure(stored);
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    switch (ch) {
    case '"':
    case '\\':
      escaped.push_back('\\');
      escaped.push_back(ch);
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      escaped.push_back(ch);
      break;
    }
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace tunnels::common
