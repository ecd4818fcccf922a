#ifndef IMGINFO_CHECKERS_GIF_HPP_
#define IMGINFO_CHECKERS_GIF_HPP_

#include <imginfo/imginfo_export.h>
#include <imginfo/types.hpp>
#include <imginfo/image_metadata.hpp>
#include <imginfo/byte_source.hpp>

#include <string_view>

namespace imginfo {

// ============================================================================
// GIF Header Checker
// ============================================================================

class IMGINFO_EXPORT gif_checker {
public:
    static constexpr std::string_view name = "gif";

    [[nodiscard]] static bool sniff(const magic_bytes& magic) noexcept;

    /**
     * Parse the GIF signature and logical screen descriptor.
     * When images are counted the block stream is walked up to the trailer:
     *   - image descriptors raise the image count and update the interlace flag
     *   - comment extensions are gathered one comment per extension
     * Without counting the screen descriptor alone is reported; collected
     * comments are read up to the first block that cannot be followed.
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

#endif // IMGINFO_CHECKERS_GIF_HPP_
