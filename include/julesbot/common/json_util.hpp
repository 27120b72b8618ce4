#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace julesbot::common {

/// Escape a string for embedding inside a JSON string literal. Control
/// characters without a short form are written as \u00XX.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Decode the body of a JSON string literal. \uXXXX escapes (including
/// surrogate pairs) are re-encoded as UTF-8.
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Position of the closing quote for the string opening at quote_pos, or npos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Position of the bracket closing the one at open_pos, or npos. Brackets
/// inside string literals are ignored.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Top-level members of a JSON object. String values are unescaped; objects,
/// arrays, numbers and literals are kept as raw JSON text. Nested members are
/// never visible here, so a "state" key inside a sub-object cannot shadow the
/// outer one.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Top-level string member, or empty when absent or not a string.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Top-level object member including braces, or empty.
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Top-level array member including brackets, or empty.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// True when the top-level member is the literal true.
[[nodiscard]] bool json_get_bool(const std::string &json, const std::string &field);

/// Split a JSON array of objects into the individual object texts.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace julesbot::common
