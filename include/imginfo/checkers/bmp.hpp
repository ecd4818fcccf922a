#ifndef IMGINFO_CHECKERS_BMP_HPP_
#define IMGINFO_CHECKERS_BMP_HPP_

#include <imginfo/imginfo_export.h>
#include <imginfo/types.hpp>
#include <imginfo/image_metadata.hpp>
#include <imginfo/byte_source.hpp>

#include <string_view>

namespace imginfo {

// ============================================================================
// BMP Header Checker
// ============================================================================

class IMGINFO_EXPORT bmp_checker {
public:
    static constexpr std::string_view name = "bmp";

    /**
     * Check if the magic bytes are the BMP "BM" signature.
     */
    [[nodiscard]] static bool sniff(const magic_bytes& magic) noexcept;

    /**
     * Parse the BITMAPFILEHEADER tail and BITMAPINFOHEADER.
     * Reports dimensions, bit depth (1, 4, 8, 16, 24 or 32) and the
     * physical resolution when the pixels-per-metre fields are set.
     *
     * @param src Source positioned right after the magic bytes
     * @param magic The magic bytes already consumed
     * @param options Detection options
     * @return Detection result
     */
    [[nodiscard]] static detect_result check(byte_source& src,
                                             const magic_bytes& magic,
                                             const detect_options& options = {});
};

} // namespace imginfo

#endif // IMGINFO_CHECKERS_BMP_HPP_
