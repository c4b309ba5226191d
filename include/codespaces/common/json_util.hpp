#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codespaces::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string body (no surrounding quotes). \uXXXX
/// sequences, including surrogate pairs, are decoded to UTF-8.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Parse the top level of a JSON object into key -> raw value text. Nested
/// keys are never visited, so a "name" inside "repository" cannot shadow a
/// top-level "name". String values keep their quotes; use json_as_string.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

[[nodiscard]] std::optional<std::string> json_as_string(const std::string &raw);
[[nodiscard]] std::optional<bool> json_as_bool(const std::string &raw);
[[nodiscard]] std::optional<std::int64_t> json_as_integer(const std::string &raw);

/// Insert extra members before the closing brace of an object. Values are raw
/// JSON text.
[[nodiscard]] std::string
json_append_fields(const std::string &object_json,
                   const std::vector<std::pair<std::string, std::string>> &fields);

/// Re-indent compact or arbitrarily formatted JSON, preserving member order.
[[nodiscard]] std::string json_pretty(const std::string &json, int indent = 2);

} // namespace codespaces::common
