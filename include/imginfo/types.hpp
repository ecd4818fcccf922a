#ifndef IMGINFO_TYPES_HPP_
#define IMGINFO_TYPES_HPP_

#include <imginfo/imginfo_export.h>

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace imginfo {

// ============================================================================
// Image Formats
// ============================================================================

enum class image_format {
    jpeg,
    gif,
    png,
    bmp,
    pcx,
    iff,    // IFF ILBM / PBM
    ras,    // Sun Raster
    pbm,
    pgm,
    ppm,
    psd,
    unknown
};

/**
 * Canonical short name of a format ("JPEG", "GIF", ...).
 * Returns "?" for image_format::unknown.
 */
[[nodiscard]] IMGINFO_EXPORT std::string_view format_name(image_format fmt) noexcept;

/**
 * MIME type of a format. Progressive JPEG maps to "image/pjpeg".
 * Returns an empty view for image_format::unknown.
 */
[[nodiscard]] IMGINFO_EXPORT std::string_view mime_type(image_format fmt,
                                                        bool progressive = false) noexcept;

/**
 * File extensions commonly used for a format, with leading dot.
 */
[[nodiscard]] IMGINFO_EXPORT std::span<const std::string_view> format_extensions(image_format fmt) noexcept;

// The two leading bytes of a stream
using magic_bytes = std::array<std::uint8_t, 2>;

// ============================================================================
// Detection Errors
// ============================================================================

enum class detect_error {
    none,
    unrecognized_format,
    malformed_header,
    truncated,
    io_error
};

[[nodiscard]] IMGINFO_EXPORT const char* to_string(detect_error err) noexcept;

// ============================================================================
// Detection Options
// ============================================================================

struct detect_options {
    // Gather textual comments (GIF comment extensions, JPEG COM, PNM '#')
    bool collect_comments = false;

    // Walk all GIF blocks to count embedded images
    bool count_images = false;
};

} // namespace imginfo

#endif // IMGINFO_TYPES_HPP_
