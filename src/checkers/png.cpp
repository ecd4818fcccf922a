#include <imginfo/checkers/png.hpp>
#include "byte_io.hpp"
#include "check_helpers.hpp"

#include <array>

namespace imginfo {

namespace {

// "NG\r\n\x1a\n": the PNG signature after 0x89 'P'
constexpr std::uint8_t PNG_SIGNATURE_TAIL[] = {0x4e, 0x47, 0x0d, 0x0a, 0x1a, 0x0a};

// Signature tail (6), IHDR length and type (8), IHDR data (13)
constexpr std::size_t PNG_HEADER_TAIL = 27;

constexpr std::uint8_t COLOR_TYPE_RGB = 2;
constexpr std::uint8_t COLOR_TYPE_RGBA = 6;

} // namespace

bool png_checker::sniff(const magic_bytes& magic) noexcept {
    return magic[0] == 0x89 && magic[1] == 0x50;
}

detect_result png_checker::check(byte_source& src,
                                 const magic_bytes& /*magic*/,
                                 const detect_options& /*options*/) {
    std::array<std::uint8_t, PNG_HEADER_TAIL> a{};
    if (!src.read_exact(a)) {
        return truncated("PNG header truncated");
    }
    if (!matches(a, 0, PNG_SIGNATURE_TAIL)) {
        return malformed("Invalid PNG signature");
    }

    image_metadata::fields info;
    info.format = image_format::png;
    info.width = read_be32_signed(a, 14);
    info.height = read_be32_signed(a, 18);
    info.bits_per_pixel = a[22];
    const std::uint8_t color_type = a[23];
    if (color_type == COLOR_TYPE_RGB || color_type == COLOR_TYPE_RGBA) {
        info.bits_per_pixel *= 3;
    }
    info.progressive = a[26] != 0;

    return finish(info);
}

} // namespace imginfo
