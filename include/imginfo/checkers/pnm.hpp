#ifndef IMGINFO_CHECKERS_PNM_HPP_
#define IMGINFO_CHECKERS_PNM_HPP_

#include <imginfo/imginfo_export.h>
#include <imginfo/types.hpp>
#include <imginfo/image_metadata.hpp>
#include <imginfo/byte_source.hpp>

#include <string_view>

namespace imginfo {

// ============================================================================
// PNM Header Checker (PBM, PGM, PPM)
// ============================================================================

class IMGINFO_EXPORT pnm_checker {
public:
    static constexpr std::string_view name = "pnm";

    /**
     * Check for "P1" through "P6".
     */
    [[nodiscard]] static bool sniff(const magic_bytes& magic) noexcept;

    /**
     * Parse the line oriented PNM header.
     * The format (PBM, PGM or PPM) is selected by the digit of the magic.
     * Lines starting with '#' are comments.
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

#endif // IMGINFO_CHECKERS_PNM_HPP_
