#include <imginfo/checkers/pcx.hpp>
#include "byte_io.hpp"
#include "check_helpers.hpp"

#include <array>

namespace imginfo {

namespace {

// Header bytes 2..65 (encoding through plane count)
constexpr std::size_t PCX_HEADER_TAIL = 64;

constexpr std::uint8_t PCX_MANUFACTURER = 0x0a;
constexpr std::uint8_t PCX_MAX_VERSION = 5;
constexpr std::uint8_t PCX_ENCODING_RLE = 1;

constexpr std::size_t OFF_ENCODING = 0;
constexpr std::size_t OFF_BITS_PER_PLANE = 1;
constexpr std::size_t OFF_X_MIN = 2;
constexpr std::size_t OFF_Y_MIN = 4;
constexpr std::size_t OFF_X_MAX = 6;
constexpr std::size_t OFF_Y_MAX = 8;
constexpr std::size_t OFF_H_DPI = 10;
constexpr std::size_t OFF_PLANES = 63;

} // namespace

bool pcx_checker::sniff(const magic_bytes& magic) noexcept {
    return magic[0] == PCX_MANUFACTURER && magic[1] <= PCX_MAX_VERSION;
}

detect_result pcx_checker::check(byte_source& src,
                                 const magic_bytes& /*magic*/,
                                 const detect_options& /*options*/) {
    std::array<std::uint8_t, PCX_HEADER_TAIL> a{};
    if (!src.read_exact(a)) {
        return truncated("PCX header truncated");
    }
    if (a[OFF_ENCODING] != PCX_ENCODING_RLE) {
        return malformed("Unsupported PCX encoding");
    }

    const int x1 = read_le16(a, OFF_X_MIN);
    const int y1 = read_le16(a, OFF_Y_MIN);
    const int x2 = read_le16(a, OFF_X_MAX);
    const int y2 = read_le16(a, OFF_Y_MAX);
    if (x2 < x1 || y2 < y1) {
        return malformed("Invalid PCX bounding box");
    }

    image_metadata::fields info;
    info.format = image_format::pcx;
    info.width = x2 - x1 + 1;
    info.height = y2 - y1 + 1;

    const int bits = a[OFF_BITS_PER_PLANE];
    const int planes = a[OFF_PLANES];
    if (planes == 1 && (bits == 1 || bits == 2 || bits == 4 || bits == 8)) {
        info.bits_per_pixel = bits;
    } else if (planes == 3 && bits == 8) {
        info.bits_per_pixel = 24;
    } else {
        return malformed("Unsupported PCX color depth: " + std::to_string(planes) +
                         " planes of " + std::to_string(bits) + " bits");
    }

    // Both axes are read from the horizontal DPI field; the vertical DPI
    // field is not consulted
    const int dpi = read_le16(a, OFF_H_DPI);
    if (dpi > 0) {
        info.physical_width_dpi = dpi;
        info.physical_height_dpi = dpi;
    }

    return finish(info);
}

} // namespace imginfo
