#ifndef IMGINFO_CHECKERS_JPEG_HPP_
#define IMGINFO_CHECKERS_JPEG_HPP_

#include <imginfo/imginfo_export.h>
#include <imginfo/types.hpp>
#include <imginfo/image_metadata.hpp>
#include <imginfo/byte_source.hpp>

#include <string_view>

namespace imginfo {

// ============================================================================
// JPEG Header Checker
// ============================================================================

class IMGINFO_EXPORT jpeg_checker {
public:
    static constexpr std::string_view name = "jpeg";

    [[nodiscard]] static bool sniff(const magic_bytes& magic) noexcept;

    /**
     * Walk JPEG marker segments up to the first start-of-frame marker.
     * Supports:
     *   - JFIF APP0 density (dots per inch and dots per centimetre)
     *   - COM segments as comments
     *   - baseline, extended, progressive and lossless frames
     *
     * @param src Source positioned right after the SOI marker
     * @param magic The magic bytes already consumed
     * @param options Detection options
     * @return Detection result
     */
    [[nodiscard]] static detect_result check(byte_source& src,
                                             const magic_bytes& magic,
                                             const detect_options& options = {});
};

} // namespace imginfo

#endif // IMGINFO_CHECKERS_JPEG_HPP_
