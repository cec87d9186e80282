#include "conductor/common/json_util.hpp"

#include <cctype>
#include <cstdio>
#include <sstream>

namespace conductor::common {

namespace {

void append_utf8(std::string &out, unsigned int code_point) {
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

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

std::size_t scalar_end(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
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
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(ch));
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
      unsigned int code_point = 0;
      bool valid = i + 4 < raw.size();
      for (std::size_t k = 1; valid && k <= 4; ++k) {
        const int digit = hex_value(raw[i + k]);
        if (digit < 0) {
          valid = false;
          break;
        }
        code_point = (code_point << 4) | static_cast<unsigned int>(digit);
      }
      if (!valid) {
        out.push_back('u');
        break;
      }
      i += 4;
      if (code_point >= 0xD800 && code_point <= 0xDBFF) {
        // High surrogate: combine with the low surrogate escape that must follow.
        unsigned int low = 0;
        bool paired = i + 6 < raw.size() && raw[i + 1] == '\\' && raw[i + 2] == 'u';
        for (std::size_t k = 3; paired && k <= 6; ++k) {
          const int digit = hex_value(raw[i + k]);
          if (digit < 0) {
            paired = false;
            break;
          }
          low = (low << 4) | static_cast<unsigned int>(digit);
        }
        if (paired && low >= 0xDC00 && low <= 0xDFFF) {
          code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        } else {
          code_point = 0xFFFD;
        }
      } else if (code_point >= 0xDC00 && code_point <= 0xDFFF) {
        code_point = 0xFFFD;
      }
      append_utf8(out, code_point);
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

Result<JsonObject> json_parse_object(const std::string &json) {
  const std::size_t open = json_skip_ws(json, 0);
  if (open >= json.size() || json[open] != '{') {
    return Result<JsonObject>::failure("expected JSON object");
  }
  const std::size_t close = json_find_matching_token(json, open, '{', '}');
  if (close == std::string::npos) {
    return Result<JsonObject>::failure("unterminated JSON object");
  }
  if (json_skip_ws(json, close + 1) != json.size()) {
    return Result<JsonObject>::failure("trailing data after JSON object");
  }

  JsonObject members;
  std::size_t pos = open + 1;
  bool after_comma = false;
  while (true) {
    pos = json_skip_ws(json, pos);
    if (pos >= close) {
      if (after_comma) {
        return Result<JsonObject>::failure("trailing ',' in JSON object");
      }
      break;
    }
    if (json[pos] != '"') {
      return Result<JsonObject>::failure("expected member name at offset " + std::to_string(pos));
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos || key_end >= close) {
      return Result<JsonObject>::failure("unterminated member name");
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= close || json[pos] != ':') {
      return Result<JsonObject>::failure("expected ':' after \"" + key + "\"");
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= close) {
      return Result<JsonObject>::failure("missing value for \"" + key + "\"");
    }

    JsonMember member;
    if (json[pos] == '"') {
      const auto end = json_find_string_end(json, pos);
      if (end == std::string::npos || end >= close) {
        return Result<JsonObject>::failure("unterminated string for \"" + key + "\"");
      }
      member.raw = json_unescape(json.substr(pos + 1, end - pos - 1));
      member.is_string = true;
      pos = end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open_ch = json[pos];
      const char close_ch = open_ch == '{' ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open_ch, close_ch);
      if (end == std::string::npos || end >= close) {
        return Result<JsonObject>::failure("unbalanced value for \"" + key + "\"");
      }
      member.raw = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const auto end = scalar_end(json, pos);
      if (end == pos) {
        return Result<JsonObject>::failure("empty value for \"" + key + "\"");
      }
      member.raw = json.substr(pos, end - pos);
      pos = end;
    }
    members[key] = std::move(member);

    pos = json_skip_ws(json, pos);
    if (pos < close && json[pos] == ',') {
      ++pos;
      after_comma = true;
      continue;
    }
    if (pos != close) {
      return Result<JsonObject>::failure("expected ',' or '}' at offset " + std::to_string(pos));
    }
    after_comma = false;
  }

  return Result<JsonObject>::success(std::move(members));
}

Result<std::vector<std::string>> json_parse_string_array(const std::string &json) {
  const std::size_t open = json_skip_ws(json, 0);
  if (open >= json.size() || json[open] != '[') {
    return Result<std::vector<std::string>>::failure("expected JSON array");
  }
  const std::size_t close = json_find_matching_token(json, open, '[', ']');
  if (close == std::string::npos) {
    return Result<std::vector<std::string>>::failure("unterminated JSON array");
  }

  if (json_skip_ws(json, close + 1) != json.size()) {
    return Result<std::vector<std::string>>::failure("trailing data after JSON array");
  }

  std::vector<std::string> out;
  std::size_t pos = open + 1;
  bool after_comma = false;
  while (true) {
    pos = json_skip_ws(json, pos);
    if (pos >= close) {
      if (after_comma) {
        return Result<std::vector<std::string>>::failure("trailing ',' in JSON array");
      }
      break;
    }
    if (json[pos] != '"') {
      return Result<std::vector<std::string>>::failure("array element is not a string");
    }
    const auto end = json_find_string_end(json, pos);
    if (end == std::string::npos || end >= close) {
      return Result<std::vector<std::string>>::failure("unterminated array element");
    }
    out.push_back(json_unescape(json.substr(pos + 1, end - pos - 1)));
    pos = json_skip_ws(json, end + 1);
    if (pos < close && json[pos] == ',') {
      ++pos;
      after_comma = true;
      continue;
    }
    if (pos != close) {
      return Result<std::vector<std::string>>::failure("expected ',' or ']' at offset " +
                                                       std::to_string(pos));
    }
    after_comma = false;
  }
  return Result<std::vector<std::string>>::success(std::move(out));
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << json_quote(values[i]);
  }
  out << "]";
  return out.str();
}

} // namespace conductor::common
