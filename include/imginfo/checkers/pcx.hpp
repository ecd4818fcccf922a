#ifndef IMGINFO_CHECKERS_PCX_HPP_
#define IMGINFO_CHECKERS_PCX_HPP_

#include <imginfo/imginfo_export.h>
#include <imginfo/types.hpp>
#include <imginfo/image_metadata.hpp>
#include <imginfo/byte_source.hpp>

#include <string_view>

namespace imginfo {

// ============================================================================
// PCX Header Checker
// ============================================================================

class IMGINFO_EXPORT pcx_checker {
public:
    static constexpr std::string_view name = "pcx";

    /**
     * Check for the ZSoft manufacturer byte followed by a version below 6.
     */
    [[nodiscard]] static bool sniff(const magic_bytes& magic) noexcept;

    /**
     * Parse the 128 byte PCX header.
     * Only RLE encoded images are accepted. Paletted images with one plane
     * of 1, 2, 4 or 8 bits and truecolor images with three 8-bit planes
     * are recognized.
     */
    [[nodiscard]] static detect_result check(byte_source& src,
                                             const magic_bytes& magic,
                                             const detect_options& options = {});
};

} // namespace imginfo

#endif // IMGINFO_CHECKERS_PCX_HPP_
