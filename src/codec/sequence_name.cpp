/**
 * @file sequence_name.cpp
 * @brief Splits image file names into (name, frame) and rebuilds them
 */

#include "edgefirst/sync/codec/sequence_name.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace edgefirst::sync {

namespace {

auto parse_frame(std::string_view digits) -> std::optional<uint32_t> {
    if (digits.empty() ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    uint32_t frame = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), frame);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return frame;
}

}  // namespace

sequence_resolver::sequence_resolver(sequence_options options)
    : options_(std::move(options)) {}

auto sequence_resolver::stem(std::string_view filename) const -> std::string {
    if (auto sep = filename.find_last_of("/\\"); sep != std::string_view::npos) {
        filename = filename.substr(sep + 1);
    }
    if (auto dot = filename.rfind('.'); dot != std::string_view::npos) {
        filename = filename.substr(0, dot);
    }
    if (!options_.sensor_suffix.empty()) {
        if (auto marker = filename.rfind(options_.sensor_suffix);
            marker != std::string_view::npos) {
            filename = filename.substr(0, marker);
        }
    }
    return std::string(filename);
}

auto sequence_resolver::split(std::string_view filename,
                              const std::optional<std::string>& known_sequence) const
    -> split_name {
    auto base = stem(filename);

    if (known_sequence && !known_sequence->empty() &&
        base.size() > known_sequence->size() + 1 &&
        base.compare(0, known_sequence->size(), *known_sequence) == 0 &&
        base[known_sequence->size()] == '_') {
        auto digits = std::string_view(base).substr(known_sequence->size() + 1);
        if (auto frame = parse_frame(digits)) {
            return split_name{*known_sequence, frame};
        }
    }

    if (options_.detect_sequences) {
        auto underscore = base.rfind('_');
        if (underscore != std::string::npos && underscore > 0) {
            if (auto frame = parse_frame(std::string_view(base).substr(underscore + 1))) {
                return split_name{base.substr(0, underscore), frame};
            }
        }
    }

    return split_name{std::move(base), std::nullopt};
}

auto sequence_resolver::join(std::string_view name, std::optional<uint32_t> frame) const
    -> std::string {
    std::ostringstream out;
    out << name;
    if (frame) {
        out << '_' << std::setw(3) << std::setfill('0') << *frame;
    }
    out << options_.sensor_suffix << options_.extension;
    return out.str();
}

auto sequence_resolver::join_path(std::string_view name, std::optional<uint32_t> frame) const
    -> std::filesystem::path {
    if (frame) {
        return std::filesystem::path(std::string(name)) / join(name, frame);
    }
    return std::filesystem::path(join(name, frame));
}

}  // namespace edgefirst::sync
