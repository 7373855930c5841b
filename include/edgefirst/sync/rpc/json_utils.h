/**
 * @file json_utils.h
 * @brief Minimal JSON scanning helpers for RPC payloads
 *
 * The helpers work on raw JSON text and return views into it. They do not
 * build a document tree: a caller looks up the member it needs, then parses
 * that value as a string, integer, array or object.
 */

#ifndef EDGEFIRST_SYNC_RPC_JSON_UTILS_H
#define EDGEFIRST_SYNC_RPC_JSON_UTILS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace edgefirst::sync::json {

/**
 * @brief Quote and escape a string for embedding in JSON output
 */
[[nodiscard]] auto quote(std::string_view value) -> std::string;

/**
 * @brief Strip surrounding whitespace
 */
[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

/**
 * @brief Find the end of the value starting at @p pos
 * @return Offset one past the value, or nullopt if the text is malformed
 */
[[nodiscard]] auto scan_value(std::string_view text, std::size_t pos)
    -> std::optional<std::size_t>;

/**
 * @brief Members of a JSON object, in document order
 *
 * Keys are unescaped; values are raw views into @p object.
 */
[[nodiscard]] auto object_members(std::string_view object)
    -> std::optional<std::vector<std::pair<std::string, std::string_view>>>;

/**
 * @brief Raw value of a top-level member of @p object
 */
[[nodiscard]] auto find_member(std::string_view object, std::string_view key)
    -> std::optional<std::string_view>;

/**
 * @brief Raw elements of a JSON array
 */
[[nodiscard]] auto array_elements(std::string_view array)
    -> std::optional<std::vector<std::string_view>>;

/**
 * @brief Decode a JSON string literal (quotes included in @p raw)
 */
[[nodiscard]] auto parse_string(std::string_view raw) -> std::optional<std::string>;

[[nodiscard]] auto parse_int(std::string_view raw) -> std::optional<int64_t>;

[[nodiscard]] auto parse_string_array(std::string_view raw)
    -> std::optional<std::vector<std::string>>;

[[nodiscard]] auto is_null(std::string_view raw) -> bool;

}  // namespace edgefirst::sync::json

#endif  // EDGEFIRST_SYNC_RPC_JSON_UTILS_H
