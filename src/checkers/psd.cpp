#include <imginfo/checkers/psd.hpp>
#include "byte_io.hpp"
#include "check_helpers.hpp"

#include <array>

namespace imginfo {

namespace {

// "PS" completing "8BPS" after the "8B" magic
constexpr std::uint8_t PSD_SIGNATURE_TAIL[] = {0x50, 0x53};

// Signature tail (2), version (2), reserved (6), channels (2),
// height (4), width (4), depth (2), color mode (2)
constexpr std::size_t PSD_HEADER_TAIL = 24;

constexpr std::size_t OFF_CHANNELS = 10;
constexpr std::size_t OFF_HEIGHT = 12;
constexpr std::size_t OFF_WIDTH = 16;
constexpr std::size_t OFF_DEPTH = 20;

constexpr std::uint32_t PSD_MAX_BITS_PER_PIXEL = 64;

} // namespace

bool psd_checker::sniff(const magic_bytes& magic) noexcept {
    return magic[0] == 0x38 && magic[1] == 0x42;
}

detect_result psd_checker::check(byte_source& src,
                                 const magic_bytes& /*magic*/,
                                 const detect_options& /*options*/) {
    std::array<std::uint8_t, PSD_HEADER_TAIL> a{};
    if (!src.read_exact(a)) {
        return truncated("PSD header truncated");
    }
    if (!matches(a, 0, PSD_SIGNATURE_TAIL)) {
        return malformed("Invalid PSD signature");
    }

    image_metadata::fields info;
    info.format = image_format::psd;
    info.height = read_be32_signed(a, OFF_HEIGHT);
    info.width = read_be32_signed(a, OFF_WIDTH);
    const std::uint32_t bits = static_cast<std::uint32_t>(read_be16(a, OFF_CHANNELS)) *
                               read_be16(a, OFF_DEPTH);
    if (bits > PSD_MAX_BITS_PER_PIXEL) {
        return malformed("Unsupported bit depth: " + std::to_string(bits));
    }
    info.bits_per_pixel = static_cast<int>(bits);

    return finish(info);
}

} // namespace imginfo
