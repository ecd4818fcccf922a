#ifndef IMGINFO_CHECKERS_SUNRAST_HPP_
#define IMGINFO_CHECKERS_SUNRAST_HPP_

#include <imginfo/imginfo_export.h>
#include <imginfo/types.hpp>
#include <imginfo/image_metadata.hpp>
#include <imginfo/byte_source.hpp>

#include <string_view>

namespace imginfo {

// ============================================================================
// Sun Raster Header Checker
// ============================================================================

class IMGINFO_EXPORT sunrast_checker {
public:
    static constexpr std::string_view name = "sunrast";

    [[nodiscard]] static bool sniff(const magic_bytes& magic) noexcept;

    /**
     * Parse the Sun Raster header. Depths above 24 bits are rejected.
     */
    [[nodiscard]] static detect_result check(byte_source& src,
                                             const magic_bytes& magic,
                                             const detect_options& options = {});
};

} // namespace imginfo

#endif // IMGINFO_CHECKERS_SUNRAST_HPP_
