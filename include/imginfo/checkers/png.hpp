#ifndef IMGINFO_CHECKERS_PNG_HPP_
#define IMGINFO_CHECKERS_PNG_HPP_

#include <imginfo/imginfo_export.h>
#include <imginfo/types.hpp>
#include <imginfo/image_metadata.hpp>
#include <imginfo/byte_source.hpp>

#include <string_view>

namespace imginfo {

// ============================================================================
// PNG Header Checker
// ============================================================================

class IMGINFO_EXPORT png_checker {
public:
    static constexpr std::string_view name = "png";

    [[nodiscard]] static bool sniff(const magic_bytes& magic) noexcept;

    /**
     * Parse the PNG signature and IHDR chunk.
     * Truecolor images report bit depth times three; the interlace
     * method maps to the progressive flag.
     */
    [[nodiscard]] static detect_result check(byte_source& src,
                                             const magic_bytes& magic,
                                             const detect_options& options = {});
};

} // namespace imginfo

#endif // IMGINFO_CHECKERS_PNG_HPP_
