#ifndef IMGINFO_CHECKERS_IFF_HPP_
#define IMGINFO_CHECKERS_IFF_HPP_

#include <imginfo/imginfo_export.h>
#include <imginfo/types.hpp>
#include <imginfo/image_metadata.hpp>
#include <imginfo/byte_source.hpp>

#include <string_view>

namespace imginfo {

// ============================================================================
// IFF ILBM/PBM Header Checker
// ============================================================================

class IMGINFO_EXPORT iff_checker {
public:
    static constexpr std::string_view name = "iff";

    [[nodiscard]] static bool sniff(const magic_bytes& magic) noexcept;

    /**
     * Parse the FORM header and walk chunks until BMHD is found.
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

#endif // IMGINFO_CHECKERS_IFF_HPP_
