#include "julesbot/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <optional>

namespace julesbot::common {

namespace {

struct JsonMember {
  std::string key;
  std::string raw;
  bool is_string = false;
};

void append_utf8(std::string &out, const std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

std::optional<std::uint32_t> read_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    value <<= 4;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

// End (exclusive) of the scalar starting at pos: number, true, false or null.
std::size_t scalar_end(const std::string &json, std::size_t pos) {
  while (pos < json.size()) {
    const char ch = json[pos];
    if (ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0) {
      break;
    }
    ++pos;
  }
  return pos;
}

std::vector<JsonMember> parse_members(const std::string &json) {
  std::vector<JsonMember> members;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return members;
  }
  ++pos;

  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      break;
    }

    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    JsonMember member;
    member.key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      break;
    }

    const char lead = json[pos];
    if (lead == '"') {
      const auto end = json_find_string_end(json, pos);
      if (end == std::string::npos) {
        break;
      }
      member.raw = json_unescape(json.substr(pos + 1, end - pos - 1));
      member.is_string = true;
      pos = end + 1;
    } else if (lead == '{' || lead == '[') {
      const auto end = json_find_matching_token(json, pos, lead, lead == '{' ? '}' : ']');
      if (end == std::string::npos) {
        break;
      }
      member.raw = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const auto end = scalar_end(json, pos);
      member.raw = json.substr(pos, end - pos);
      pos = end;
    }
    members.push_back(std::move(member));
  }
  return members;
}

std::optional<JsonMember> find_member(const std::string &json, const std::string &field) {
  for (auto &member : parse_members(json)) {
    if (member.key == field) {
      return member;
    }
  }
  return std::nullopt;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char code = raw[++i];
    switch (code) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      auto unit = read_hex4(raw, i + 1);
      if (!unit.has_value()) {
        out += "\\u";
        break;
      }
      i += 4;
      std::uint32_t code_point = *unit;
      if (code_point >= 0xD800 && code_point <= 0xDBFF && i + 2 < raw.size() &&
          raw[i + 1] == '\\' && raw[i + 2] == 'u') {
        if (auto low = read_hex4(raw, i + 3); low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          code_point = 0x10000 + ((code_point - 0xD800) << 10) + (*low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code_point);
      break;
    }
    default:
      out.push_back(code);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, const std::size_t quote_pos) {
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    if (json[i] == '\\') {
      ++i;
      continue;
    }
    if (json[i] == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, const std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = json_find_string_end(json, i);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      i = end;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  for (auto &member : parse_members(json)) {
    result[member.key] = std::move(member.raw);
  }
  return result;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto member = find_member(json, field);
  if (!member.has_value() || !member->is_string) {
    return "";
  }
  return member->raw;
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto member = find_member(json, field);
  if (!member.has_value() || member->is_string || member->raw.empty() ||
      member->raw.front() != '{') {
    return "";
  }
  return member->raw;
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto member = find_member(json, field);
  if (!member.has_value() || member->is_string || member->raw.empty() ||
      member->raw.front() != '[') {
    return "";
  }
  return member->raw;
}

bool json_get_bool(const std::string &json, const std::string &field) {
  const auto member = find_member(json, field);
  return member.has_value() && !member->is_string && member->raw == "true";
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }
  ++pos;

  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    const char ch = array_json[pos];
    if (ch == '{') {
      const auto end = json_find_matching_token(array_json, pos, '{', '}');
      if (end == std::string::npos) {
        break;
      }
      out.push_back(array_json.substr(pos, end - pos + 1));
      pos = end + 1;
    } else if (ch == '[') {
      const auto end = json_find_matching_token(array_json, pos, '[', ']');
      if (end == std::string::npos) {
        break;
      }
      pos = end + 1;
    } else if (ch == '"') {
      const auto end = json_find_string_end(array_json, pos);
      if (end == std::string::npos) {
        break;
      }
      pos = end + 1;
    } else {
      ++pos;
    }
  }
  return out;
}

} // namespace julesbot::common
