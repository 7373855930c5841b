/**
 * @file sequence_name.h
 * @brief Splits image file names into (name, frame) and rebuilds them
 */

#ifndef EDGEFIRST_SYNC_CODEC_SEQUENCE_NAME_H
#define EDGEFIRST_SYNC_CODEC_SEQUENCE_NAME_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace edgefirst::sync {

struct sequence_options {
    /**
     * @brief Treat a trailing "_<digits>" as a frame number
     *
     * Names that end in digits for other reasons (a version suffix, say) are
     * then read as sequence frames. Off by default; names are only split
     * against a known sequence name.
     */
    bool detect_sequences = false;

    /// Sensor marker removed from the stem
    std::string sensor_suffix = ".camera";

    /// Extension appended by join()
    std::string extension = ".jpeg";
};

struct split_name {
    std::string name;
    std::optional<uint32_t> frame;

    auto operator==(const split_name&) const -> bool = default;
};

/**
 * @brief Maps between image file names and (name, frame) pairs
 *
 * @code
 * sequence_resolver resolver;
 * auto parts = resolver.split("deer_003.camera.jpeg", "deer");  // {"deer", 3}
 * auto file = resolver.join("deer", 3);                        // "deer_003.camera.jpeg"
 * @endcode
 */
class sequence_resolver {
public:
    explicit sequence_resolver(sequence_options options = sequence_options{});

    /**
     * @brief Split a file name
     *
     * The directory, final extension and sensor suffix are dropped. When
     * @p known_sequence is given and the stem is "<known>_<digits>", that is
     * the answer. Otherwise, with detection enabled, a trailing "_<digits>"
     * after a non-empty prefix is the frame.
     */
    [[nodiscard]] auto split(std::string_view filename,
                             const std::optional<std::string>& known_sequence = std::nullopt) const
        -> split_name;

    /**
     * @brief "name_<frame:03>.camera.jpeg", or "name.camera.jpeg" without a frame
     *
     * The result is a normalized name. The original padding width and
     * extension are not recoverable from (name, frame).
     */
    [[nodiscard]] auto join(std::string_view name, std::optional<uint32_t> frame) const
        -> std::string;

    /**
     * @brief Container path: sequence frames are nested under "name/"
     */
    [[nodiscard]] auto join_path(std::string_view name, std::optional<uint32_t> frame) const
        -> std::filesystem::path;

    /**
     * @brief File name without directory, extension or sensor suffix
     */
    [[nodiscard]] auto stem(std::string_view filename) const -> std::string;

    [[nodiscard]] auto options() const noexcept -> const sequence_options& { return options_; }

private:
    sequence_options options_;
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_CODEC_SEQUENCE_NAME_H
