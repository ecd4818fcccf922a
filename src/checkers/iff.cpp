#include <imginfo/checkers/iff.hpp>
#include "byte_io.hpp"
#include "check_helpers.hpp"

#include <array>

namespace imginfo {

namespace {

constexpr std::uint32_t make_id(char a, char b, char c, char d) {
    return (static_cast<std::uint32_t>(static_cast<std::uint8_t>(a)) << 24) |
           (static_cast<std::uint32_t>(static_cast<std::uint8_t>(b)) << 16) |
           (static_cast<std::uint32_t>(static_cast<std::uint8_t>(c)) << 8) |
           static_cast<std::uint32_t>(static_cast<std::uint8_t>(d));
}

constexpr std::uint32_t ID_ILBM = make_id('I', 'L', 'B', 'M');
constexpr std::uint32_t ID_PBM = make_id('P', 'B', 'M', ' ');
constexpr std::uint32_t ID_BMHD = make_id('B', 'M', 'H', 'D');

// "RM" completing "FORM" after the "FO" magic
constexpr std::uint8_t FORM_TAIL[] = {0x52, 0x4d};

// "RM" (2), FORM size (4), FORM type (4)
constexpr std::size_t FORM_HEADER_TAIL = 10;
constexpr std::size_t CHUNK_HEADER_SIZE = 8;

// width, height, x, y (2 each), nPlanes (1)
constexpr std::size_t BMHD_PREFIX_SIZE = 9;

constexpr int MAX_PLANES = 32;

} // namespace

bool iff_checker::sniff(const magic_bytes& magic) noexcept {
    return magic[0] == 0x46 && magic[1] == 0x4f;
}

detect_result iff_checker::check(byte_source& src,
                                 const magic_bytes& /*magic*/,
                                 const detect_options& /*options*/) {
    std::array<std::uint8_t, FORM_HEADER_TAIL> a{};
    if (!src.read_exact(a)) {
        return truncated("IFF FORM header truncated");
    }
    if (!matches(a, 0, FORM_TAIL)) {
        return malformed("Not an IFF FORM");
    }
    const std::uint32_t type = read_be32(a, 6);
    if (type != ID_ILBM && type != ID_PBM) {
        return malformed("Unsupported IFF FORM type");
    }

    // Walk chunks until the bitmap header
    while (true) {
        if (!src.read_exact(std::span(a).first(CHUNK_HEADER_SIZE))) {
            return truncated("IFF stream ended before BMHD chunk");
        }
        const std::uint32_t chunk_id = read_be32(a, 0);
        std::uint64_t size = read_be32(a, 4);
        if (size & 1) {
            ++size;  // chunks are padded to even length
        }

        if (chunk_id != ID_BMHD) {
            src.skip(size);
            continue;
        }

        if (!src.read_exact(std::span(a).first(BMHD_PREFIX_SIZE))) {
            return truncated("IFF BMHD chunk truncated");
        }

        image_metadata::fields info;
        info.format = image_format::iff;
        info.width = read_be16(a, 0);
        info.height = read_be16(a, 2);
        info.bits_per_pixel = a[8];
        if (info.bits_per_pixel > MAX_PLANES) {
            return malformed("Unsupported IFF plane count: " + std::to_string(info.bits_per_pixel));
        }
        return finish(info);
    }
}

} // namespace imginfo
