#ifndef IMGINFO_CHECKERS_PSD_HPP_
#define IMGINFO_CHECKERS_PSD_HPP_

#include <imginfo/imginfo_export.h>
#include <imginfo/types.hpp>
#include <imginfo/image_metadata.hpp>
#include <imginfo/byte_source.hpp>

#include <string_view>

namespace imginfo {

// ============================================================================
// Photoshop PSD Header Checker
// ============================================================================

class IMGINFO_EXPORT psd_checker {
public:
    static constexpr std::string_view name = "psd";

    [[nodiscard]] static bool sniff(const magic_bytes& magic) noexcept;

    [[nodiscard]] static detect_result check(byte_source& src,
                                             const magic_bytes& magic,
                                             const detect_options& options = {});
};

} // namespace imginfo

#endif // IMGINFO_CHECKERS_PSD_HPP_
