#include <imginfo/checkers/jpeg.hpp>
#include "byte_io.hpp"
#include "check_helpers.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace imginfo {

namespace {

constexpr std::uint16_t MARKER_APP0 = 0xffe0;
constexpr std::uint16_t MARKER_COM = 0xfffe;
constexpr std::uint16_t MARKER_SOF0 = 0xffc0;
constexpr std::uint16_t MARKER_SOF15 = 0xffcf;
constexpr std::uint16_t MARKER_DHT = 0xffc4;
constexpr std::uint16_t MARKER_JPG = 0xffc8;

constexpr std::uint8_t JFIF_ID[] = {0x4a, 0x46, 0x49, 0x46, 0x00};  // "JFIF\0"

// Identifier (5), version (2), units (1), densities (4)
constexpr std::size_t APP0_BODY_SIZE = 12;
// Segment length field plus APP0 body
constexpr std::uint16_t APP0_MIN_LENGTH = 14;

// Precision (1), height (2), width (2), components (1)
constexpr std::size_t SOF_BODY_SIZE = 6;

constexpr std::uint8_t DENSITY_DOTS_PER_INCH = 1;
constexpr std::uint8_t DENSITY_DOTS_PER_CM = 2;
constexpr float CM_PER_INCH = 2.54f;

bool is_frame_marker(std::uint16_t marker) {
    return marker >= MARKER_SOF0 && marker <= MARKER_SOF15 &&
           marker != MARKER_DHT && marker != MARKER_JPG;
}

bool is_progressive_frame(std::uint16_t marker) {
    return marker == 0xffc2 || marker == 0xffc6 || marker == 0xffca || marker == 0xffce;
}

void set_density(std::optional<int>& dpi, int value) {
    if (value > 0) {
        dpi = value;
    }
}

void apply_density(std::span<const std::uint8_t> body, image_metadata::fields& info) {
    const int x_density = read_be16(body, 8);
    const int y_density = read_be16(body, 10);
    switch (body[7]) {
        case DENSITY_DOTS_PER_INCH:
            set_density(info.physical_width_dpi, x_density);
            set_density(info.physical_height_dpi, y_density);
            break;
        case DENSITY_DOTS_PER_CM:
            set_density(info.physical_width_dpi, static_cast<int>(x_density * CM_PER_INCH));
            set_density(info.physical_height_dpi, static_cast<int>(y_density * CM_PER_INCH));
            break;
        default:
            break;  // aspect ratio only
    }
}

} // namespace

bool jpeg_checker::sniff(const magic_bytes& magic) noexcept {
    return magic[0] == 0xff && magic[1] == 0xd8;
}

detect_result jpeg_checker::check(byte_source& src,
                                  const magic_bytes& /*magic*/,
                                  const detect_options& options) {
    image_metadata::fields info;
    info.format = image_format::jpeg;

    std::array<std::uint8_t, APP0_BODY_SIZE> data{};
    while (true) {
        if (!src.read_exact(std::span(data).first(4))) {
            return truncated("JPEG marker segment truncated");
        }
        const std::uint16_t marker = read_be16(data, 0);
        const std::uint16_t length = read_be16(data, 2);
        if ((marker & 0xff00) != 0xff00) {
            return malformed("Invalid JPEG marker");
        }
        if (length < 2) {
            return malformed("Invalid JPEG segment length");
        }

        if (marker == MARKER_APP0) {
            if (length < APP0_MIN_LENGTH) {
                src.skip(length - 2);
                continue;
            }
            if (!src.read_exact(data)) {
                return truncated("JPEG APP0 segment truncated");
            }
            if (matches(data, 0, JFIF_ID)) {
                apply_density(data, info);
            }
            src.skip(length - APP0_MIN_LENGTH);
        } else if (options.collect_comments && marker == MARKER_COM && length > 2) {
            std::vector<std::uint8_t> payload(length - 2u);
            if (!src.read_exact(payload)) {
                return truncated("JPEG comment truncated");
            }
            info.comments.emplace_back(trim(std::string_view(
                reinterpret_cast<const char*>(payload.data()), payload.size())));
        } else if (is_frame_marker(marker)) {
            if (!src.read_exact(std::span(data).first(SOF_BODY_SIZE))) {
                return truncated("JPEG frame header truncated");
            }
            info.bits_per_pixel = data[0] * data[5];
            info.progressive = is_progressive_frame(marker);
            // Frame header stores the number of lines before samples per line
            info.height = read_be16(data, 1);
            info.width = read_be16(data, 3);
            return finish(info);
        } else {
            src.skip(length - 2);
        }
    }
}

} // namespace imginfo
