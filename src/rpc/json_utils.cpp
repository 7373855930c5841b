/**
 * @file json_utils.cpp
 * @brief Minimal JSON scanning helpers for RPC payloads
 */

#include "edgefirst/sync/rpc/json_utils.h"

#include "edgefirst/sync/core/logging.h"

#include <charconv>

namespace edgefirst::sync::json {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

auto skip_ws(std::string_view text, std::size_t pos) -> std::size_t {
    while (pos < text.size() && is_space(text[pos])) {
        ++pos;
    }
    return pos;
}

auto scan_string(std::string_view text, std::size_t pos) -> std::optional<std::size_t> {
    // pos is at the opening quote
    for (std::size_t i = pos + 1; i < text.size(); ++i) {
        if (text[i] == '\\') {
            ++i;
        } else if (text[i] == '"') {
            return i + 1;
        }
    }
    return std::nullopt;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

auto parse_hex4(std::string_view text, std::size_t pos) -> std::optional<uint32_t> {
    if (pos + 4 > text.size()) {
        return std::nullopt;
    }
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + 4, value, 16);
    if (ec != std::errc{} || ptr != text.data() + pos + 4) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto quote(std::string_view value) -> std::string {
    return "\"" + escape_json(value) + "\"";
}

auto trim(std::string_view text) -> std::string_view {
    auto begin = skip_ws(text, 0);
    auto end = text.size();
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

auto scan_value(std::string_view text, std::size_t pos) -> std::optional<std::size_t> {
    pos = skip_ws(text, pos);
    if (pos >= text.size()) {
        return std::nullopt;
    }

    if (text[pos] == '"') {
        return scan_string(text, pos);
    }

    if (text[pos] == '{' || text[pos] == '[') {
        int depth = 0;
        for (std::size_t i = pos; i < text.size(); ++i) {
            char c = text[i];
            if (c == '"') {
                auto end = scan_string(text, i);
                if (!end) return std::nullopt;
                i = *end - 1;
            } else if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                if (--depth == 0) {
                    return i + 1;
                }
            }
        }
        return std::nullopt;
    }

    // number, true, false, null
    auto end = pos;
    while (end < text.size() && text[end] != ',' && text[end] != '}' &&
           text[end] != ']' && !is_space(text[end])) {
        ++end;
    }
    if (end == pos) {
        return std::nullopt;
    }
    return end;
}

auto object_members(std::string_view object)
    -> std::optional<std::vector<std::pair<std::string, std::string_view>>> {
    object = trim(object);
    if (object.size() < 2 || object.front() != '{' || object.back() != '}') {
        return std::nullopt;
    }

    std::vector<std::pair<std::string, std::string_view>> members;
    auto pos = skip_ws(object, 1);
    if (object[pos] == '}') {
        return members;
    }

    while (pos < object.size()) {
        if (object[pos] != '"') {
            return std::nullopt;
        }
        auto key_end = scan_string(object, pos);
        if (!key_end) return std::nullopt;
        auto key = parse_string(object.substr(pos, *key_end - pos));
        if (!key) return std::nullopt;

        pos = skip_ws(object, *key_end);
        if (pos >= object.size() || object[pos] != ':') {
            return std::nullopt;
        }
        auto value_begin = skip_ws(object, pos + 1);
        auto value_end = scan_value(object, value_begin);
        if (!value_end) return std::nullopt;
        members.emplace_back(std::move(*key),
                             object.substr(value_begin, *value_end - value_begin));

        pos = skip_ws(object, *value_end);
        if (pos >= object.size()) return std::nullopt;
        if (object[pos] == '}') {
            return members;
        }
        if (object[pos] != ',') {
            return std::nullopt;
        }
        pos = skip_ws(object, pos + 1);
    }
    return std::nullopt;
}

auto find_member(std::string_view object, std::string_view key)
    -> std::optional<std::string_view> {
    auto members = object_members(object);
    if (!members) {
        return std::nullopt;
    }
    for (const auto& [name, value] : *members) {
        if (name == key) {
            return value;
        }
    }
    return std::nullopt;
}

auto array_elements(std::string_view array)
    -> std::optional<std::vector<std::string_view>> {
    array = trim(array);
    if (array.size() < 2 || array.front() != '[' || array.back() != ']') {
        return std::nullopt;
    }

    std::vector<std::string_view> elements;
    auto pos = skip_ws(array, 1);
    if (array[pos] == ']') {
        return elements;
    }

    while (pos < array.size()) {
        auto end = scan_value(array, pos);
        if (!end) return std::nullopt;
        elements.push_back(array.substr(pos, *end - pos));

        pos = skip_ws(array, *end);
        if (pos >= array.size()) return std::nullopt;
        if (array[pos] == ']') {
            return elements;
        }
        if (array[pos] != ',') {
            return std::nullopt;
        }
        pos = skip_ws(array, pos + 1);
    }
    return std::nullopt;
}

auto parse_string(std::string_view raw) -> std::optional<std::string> {
    raw = trim(raw);
    if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
        return std::nullopt;
    }

    std::string out;
    out.reserve(raw.size() - 2);
    for (std::size_t i = 1; i + 1 < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (++i + 1 > raw.size() - 1) {
            return std::nullopt;
        }
        switch (raw[i]) {
            case '"':  out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/':  out.push_back('/'); break;
            case 'b':  out.push_back('\b'); break;
            case 'f':  out.push_back('\f'); break;
            case 'n':  out.push_back('\n'); break;
            case 'r':  out.push_back('\r'); break;
            case 't':  out.push_back('\t'); break;
            case 'u': {
                auto cp = parse_hex4(raw, i + 1);
                if (!cp) return std::nullopt;
                i += 4;
                // surrogate pair
                if (*cp >= 0xD800 && *cp <= 0xDBFF && i + 6 < raw.size() &&
                    raw[i + 1] == '\\' && raw[i + 2] == 'u') {
                    if (auto low = parse_hex4(raw, i + 3); low && *low >= 0xDC00 && *low <= 0xDFFF) {
                        *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                        i += 6;
                    }
                }
                append_utf8(out, *cp);
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return out;
}

auto parse_int(std::string_view raw) -> std::optional<int64_t> {
    raw = trim(raw);
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        return std::nullopt;
    }
    return value;
}

auto parse_string_array(std::string_view raw) -> std::optional<std::vector<std::string>> {
    auto elements = array_elements(raw);
    if (!elements) {
        return std::nullopt;
    }
    std::vector<std::string> out;
    out.reserve(elements->size());
    for (auto element : *elements) {
        auto value = parse_string(element);
        if (!value) return std::nullopt;
        out.push_back(std::move(*value));
    }
    return out;
}

auto is_null(std::string_view raw) -> bool {
    return trim(raw) == "null";
}

}  // namespace edgefirst::sync::json
