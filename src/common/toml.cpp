#include "julesbot/common/toml.hpp"

#include "julesbot/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace julesbot::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (in_quotes && ch == '\\') {
      ++i;
      continue;
    }
    if (ch == '"') {
      in_quotes = !in_quotes;
    } else if (ch == '#' && !in_quotes) {
      return line.substr(0, i);
    }
  }
  return line;
}

std::vector<std::string> split_array_elements(const std::string &body) {
  std::vector<std::string> elements;
  std::string current;
  bool in_quotes = false;
  for (std::size_t i = 0; i < body.size(); ++i) {
    const char ch = body[i];
    if (in_quotes && ch == '\\' && i + 1 < body.size()) {
      current.push_back(ch);
      current.push_back(body[++i]);
      continue;
    }
    if (ch == '"') {
      in_quotes = !in_quotes;
    }
    if (ch == ',' && !in_quotes) {
      elements.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  if (!trim(current).empty()) {
    elements.push_back(trim(current));
  }
  return elements;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2) {
    return value;
  }
  if (value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (ch != '\\' || i + 2 >= value.size()) {
      out.push_back(ch);
      continue;
    }
    const char code = value[++i];
    switch (code) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    default:
      out.push_back(code);
      break;
    }
  }
  return out;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
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

std::int64_t TomlDocument::get_int(const std::string &key, const std::int64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = unquote(it->second);
  std::int64_t parsed = 0;
  const char *first = normalized.data();
  const char *last = first + normalized.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last || first == last) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  std::vector<std::string> out;
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      out.push_back(unquote(element));
    }
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(strip_comment(line));
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[') {
      if (clean.back() != ']') {
        return Result<TomlDocument>::failure(ErrorKind::Configuration,
                                             "Unterminated section header at line " +
                                                 std::to_string(line_number));
      }
      section = trim(clean.substr(1, clean.size() - 2));
      if (section.empty()) {
        return Result<TomlDocument>::failure(ErrorKind::Configuration,
                                             "Empty section name at line " +
                                                 std::to_string(line_number));
      }
      continue;
    }

    const auto equals = clean.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(ErrorKind::Configuration,
                                           "Expected key = value at line " +
                                               std::to_string(line_number));
    }
    const std::string key = trim(clean.substr(0, equals));
    if (key.empty()) {
      return Result<TomlDocument>::failure(ErrorKind::Configuration,
                                           "Missing key at line " + std::to_string(line_number));
    }
    document.values[section.empty() ? key : section + "." + key] =
        trim(clean.substr(equals + 1));
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace julesbot::common
