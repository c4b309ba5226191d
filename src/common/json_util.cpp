#include "codespaces/common/json_util.hpp"

#include "codespaces/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>
#include <sstream>

namespace codespaces::common {

namespace {

void append_utf8(std::string &out, std::uint32_t code_point) {
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

std::optional<std::uint32_t> parse_hex4(const std::string &raw, std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  const auto *begin = raw.data() + pos;
  const auto [ptr, ec] = std::from_chars(begin, begin + 4, value, 16);
  if (ec != std::errc() || ptr != begin + 4) {
    return std::nullopt;
  }
  return value;
}

void write_indent(std::ostringstream &out, int depth, int indent) {
  out << '\n';
  for (int i = 0; i < depth * indent; ++i) {
    out << ' ';
  }
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

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
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
      auto code_point = parse_hex4(raw, i + 1);
      if (!code_point.has_value()) {
        out.push_back(next);
        break;
      }
      i += 4;
      if (*code_point >= 0xD800 && *code_point <= 0xDBFF && i + 2 < raw.size() &&
          raw[i + 1] == '\\' && raw[i + 2] == 'u') {
        const auto low = parse_hex4(raw, i + 3);
        if (low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          *code_point = 0x10000 + ((*code_point - 0xD800) << 10) + (*low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, *code_point);
      break;
    }
    default:
      out.push_back(next);
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

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
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
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return result;
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

    // expect key
    if (json[pos] != '"') {
      ++pos;
      continue;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = key_end + 1;

    // expect colon
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    ++pos;
    pos = json_skip_ws(json, pos);
    if (pos >= json.size()) {
      break;
    }

    // read value
    if (json[pos] == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, val_end - pos + 1);
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const char close = (open == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open, close);
      if (end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      // number, true, false, null
      const std::size_t start = pos;
      while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
             std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
        ++pos;
      }
      result[key] = json.substr(start, pos - start);
    }
  }

  return result;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  const std::string trimmed = trim(array_json);
  if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
    return out;
  }

  bool in_string = false;
  bool escaped = false;
  std::size_t depth = 0;
  std::size_t current_start = std::string::npos;
  for (std::size_t i = 1; i + 1 < trimmed.size(); ++i) {
    const char ch = trimmed[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == '{') {
      if (depth == 0) {
        current_start = i;
      }
      ++depth;
      continue;
    }
    if (ch == '}') {
      if (depth == 0) {
        continue;
      }
      --depth;
      if (depth == 0 && current_start != std::string::npos) {
        out.push_back(trimmed.substr(current_start, i - current_start + 1));
        current_start = std::string::npos;
      }
    }
  }
  return out;
}

std::optional<std::string> json_as_string(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return std::nullopt;
  }
  return json_unescape(value.substr(1, value.size() - 2));
}

std::optional<bool> json_as_bool(const std::string &raw) {
  const std::string value = trim(raw);
  if (value == "true") {
    return true;
  }
  if (value == "false") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::int64_t> json_as_integer(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.empty()) {
    return std::nullopt;
  }
  std::int64_t parsed = 0;
  const auto *end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return parsed;
}

std::string json_append_fields(const std::string &object_json,
                               const std::vector<std::pair<std::string, std::string>> &fields) {
  const auto open = object_json.find('{');
  const auto close = object_json.rfind('}');
  if (open == std::string::npos || close == std::string::npos || close < open) {
    return object_json;
  }

  bool has_members = json_skip_ws(object_json, open + 1) < close;
  std::string extra;
  for (const auto &[key, value] : fields) {
    if (has_members) {
      extra += ", ";
    }
    extra += json_quote(key) + ": " + value;
    has_members = true;
  }
  return object_json.substr(0, close) + extra + object_json.substr(close);
}

std::string json_pretty(const std::string &json, const int indent) {
  std::ostringstream out;
  int depth = 0;
  bool in_string = false;
  bool escaped = false;

  for (std::size_t i = 0; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      out << ch;
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_string = false;
      }
      continue;
    }

    switch (ch) {
    case '"':
      in_string = true;
      out << ch;
      break;
    case '{':
    case '[': {
      const char close = ch == '{' ? '}' : ']';
      const auto next = json_skip_ws(json, i + 1);
      if (next < json.size() && json[next] == close) {
        out << ch << close;
        i = next;
        break;
      }
      out << ch;
      ++depth;
      write_indent(out, depth, indent);
      break;
    }
    case '}':
    case ']':
      --depth;
      write_indent(out, depth, indent);
      out << ch;
      break;
    case ',':
      out << ch;
      write_indent(out, depth, indent);
      break;
    case ':':
      out << ": ";
      break;
    default:
      if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
        out << ch;
      }
      break;
    }
  }
  return out.str();
}

} // namespace codespaces::common
