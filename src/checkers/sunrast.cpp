#include <imginfo/checkers/sunrast.hpp>
#include "byte_io.hpp"
#include "check_helpers.hpp"

#include <array>

namespace imginfo {

namespace {

// Sun Raster magic is 0x59a66a95; the probe consumed the first two bytes
constexpr std::uint8_t RAS_MAGIC_TAIL[] = {0x6a, 0x95};

// Magic tail (2), width, height, depth (4 each)
constexpr std::size_t RAS_HEADER_TAIL = 14;

constexpr int RAS_MAX_DEPTH = 24;

} // namespace

bool sunrast_checker::sniff(const magic_bytes& magic) noexcept {
    return magic[0] == 0x59 && magic[1] == 0xa6;
}

detect_result sunrast_checker::check(byte_source& src,
                                     const magic_bytes& /*magic*/,
                                     const detect_options& /*options*/) {
    std::array<std::uint8_t, RAS_HEADER_TAIL> a{};
    if (!src.read_exact(a)) {
        return truncated("Sun Raster header truncated");
    }
    if (!matches(a, 0, RAS_MAGIC_TAIL)) {
        return malformed("Invalid Sun Raster magic");
    }

    image_metadata::fields info;
    info.format = image_format::ras;
    info.width = read_be32_signed(a, 2);
    info.height = read_be32_signed(a, 6);
    info.bits_per_pixel = read_be32_signed(a, 10);
    if (info.bits_per_pixel > RAS_MAX_DEPTH) {
        return malformed("Unsupported bit depth: " + std::to_string(info.bits_per_pixel));
    }

    return finish(info);
}

} // namespace imginfo
