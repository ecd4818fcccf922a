#ifndef IMGINFO_IMAGE_METADATA_HPP_
#define IMGINFO_IMAGE_METADATA_HPP_

#include <imginfo/imginfo_export.h>
#include <imginfo/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace imginfo {

// ============================================================================
// Image Metadata
// ============================================================================

/**
 * Structural information extracted from an image header.
 * Instances are created once per successful detection and never change.
 */
class IMGINFO_EXPORT image_metadata {
public:
    /**
     * Field accumulator filled by a checker during a single detection.
     */
    struct fields {
        image_format format = image_format::unknown;
        int width = 0;
        int height = 0;
        int bits_per_pixel = 0;
        bool progressive = false;
        int number_of_images = 1;
        std::optional<int> physical_width_dpi;
        std::optional<int> physical_height_dpi;
        std::vector<std::string> comments;
    };

    image_metadata() = default;

    explicit image_metadata(fields f)
        : fields_(std::move(f)) {}

    [[nodiscard]] image_format format() const noexcept { return fields_.format; }
    [[nodiscard]] int width() const noexcept { return fields_.width; }
    [[nodiscard]] int height() const noexcept { return fields_.height; }
    [[nodiscard]] int bits_per_pixel() const noexcept { return fields_.bits_per_pixel; }
    [[nodiscard]] bool progressive() const noexcept { return fields_.progressive; }
    [[nodiscard]] int number_of_images() const noexcept { return fields_.number_of_images; }

    [[nodiscard]] std::optional<int> physical_width_dpi() const noexcept {
        return fields_.physical_width_dpi;
    }

    [[nodiscard]] std::optional<int> physical_height_dpi() const noexcept {
        return fields_.physical_height_dpi;
    }

    /**
     * Physical width in inches.
     * @return width / dpi, or nullopt if the DPI is unknown or not positive
     */
    [[nodiscard]] std::optional<float> physical_width_inch() const noexcept;

    /**
     * Physical height in inches.
     * @return height / dpi, or nullopt if the DPI is unknown or not positive
     */
    [[nodiscard]] std::optional<float> physical_height_inch() const noexcept;

    [[nodiscard]] const std::vector<std::string>& comments() const noexcept {
        return fields_.comments;
    }

    [[nodiscard]] std::string_view format_name() const noexcept;
    [[nodiscard]] std::string_view mime_type() const noexcept;

private:
    fields fields_;
};

// ============================================================================
// Detection Result
// ============================================================================

struct detect_result {
    bool ok = false;
    detect_error error = detect_error::none;
    std::string message;
    image_metadata metadata;

    [[nodiscard]] static detect_result success(image_metadata::fields f) {
        return {true, detect_error::none, {}, image_metadata(std::move(f))};
    }

    [[nodiscard]] static detect_result failure(detect_error err, std::string msg = {}) {
        return {false, err, std::move(msg), {}};
    }

    explicit operator bool() const noexcept { return ok; }
};

} // namespace imginfo

#endif // IMGINFO_IMAGE_METADATA_HPP_
