#pragma once

#include "conductor/common/result.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace conductor::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string body (no surrounding quotes).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Top-level members of a JSON object. String values are unescaped; nested objects,
/// arrays and scalars are kept as raw JSON text.
struct JsonMember {
  std::string raw;
  bool is_string = false;
};
using JsonObject = std::map<std::string, JsonMember>;

/// Parse the members of a JSON object. Fails on unbalanced or truncated input.
[[nodiscard]] Result<JsonObject> json_parse_object(const std::string &json);

/// Parse a raw JSON array of strings like ["a","b"].
[[nodiscard]] Result<std::vector<std::string>> json_parse_string_array(const std::string &json);

[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

} // namespace conductor::common
