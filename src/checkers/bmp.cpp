#include <imginfo/checkers/bmp.hpp>
#include "byte_io.hpp"
#include "check_helpers.hpp"

#include <array>

namespace imginfo {

namespace {

// Bytes following the "BM" signature that carry all fields we report:
// rest of BITMAPFILEHEADER (12) and the first 32 bytes of BITMAPINFOHEADER
constexpr std::size_t BMP_HEADER_TAIL = 44;

constexpr std::size_t OFF_WIDTH = 16;
constexpr std::size_t OFF_HEIGHT = 20;
constexpr std::size_t OFF_BIT_COUNT = 26;
constexpr std::size_t OFF_X_PELS_PER_METER = 36;
constexpr std::size_t OFF_Y_PELS_PER_METER = 40;

constexpr double INCHES_PER_METER = 0.0254;

bool valid_bit_count(int bits) {
    return bits == 1 || bits == 4 || bits == 8 || bits == 16 || bits == 24 || bits == 32;
}

} // namespace

bool bmp_checker::sniff(const magic_bytes& magic) noexcept {
    return magic[0] == 0x42 && magic[1] == 0x4d;
}

detect_result bmp_checker::check(byte_source& src,
                                 const magic_bytes& /*magic*/,
                                 const detect_options& /*options*/) {
    std::array<std::uint8_t, BMP_HEADER_TAIL> a{};
    if (!src.read_exact(a)) {
        return truncated("BMP header truncated");
    }

    image_metadata::fields info;
    info.format = image_format::bmp;
    info.width = read_le32(a, OFF_WIDTH);
    info.height = read_le32(a, OFF_HEIGHT);
    if (info.width < 1 || info.height < 1) {
        return malformed("Invalid image dimensions");
    }

    info.bits_per_pixel = read_le16(a, OFF_BIT_COUNT);
    if (!valid_bit_count(info.bits_per_pixel)) {
        return malformed("Unsupported bit depth: " + std::to_string(info.bits_per_pixel));
    }

    const int x_dpi = static_cast<int>(read_le32(a, OFF_X_PELS_PER_METER) * INCHES_PER_METER);
    if (x_dpi > 0) {
        info.physical_width_dpi = x_dpi;
    }
    const int y_dpi = static_cast<int>(read_le32(a, OFF_Y_PELS_PER_METER) * INCHES_PER_METER);
    if (y_dpi > 0) {
        info.physical_height_dpi = y_dpi;
    }

    return finish(info);
}

} // namespace imginfo
