#ifndef IMGINFO_PROBE_HPP_
#define IMGINFO_PROBE_HPP_

#include <imginfo/imginfo_export.h>
#include <imginfo/types.hpp>
#include <imginfo/image_metadata.hpp>
#include <imginfo/byte_source.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>

namespace imginfo {

// ============================================================================
// Checker Table
// ============================================================================

/**
 * Entry of the static magic byte dispatch table.
 */
struct checker_entry {
    std::string_view name;
    bool (*sniff)(const magic_bytes& magic) noexcept;
    detect_result (*check)(byte_source& src, const magic_bytes& magic,
                           const detect_options& options);
};

/**
 * All built-in checkers in dispatch order.
 */
[[nodiscard]] IMGINFO_EXPORT std::span<const checker_entry> checkers() noexcept;

/**
 * Find the checker accepting the magic bytes.
 * @return Pointer to the table entry, or nullptr if no format matches
 */
[[nodiscard]] IMGINFO_EXPORT const checker_entry* find_checker(const magic_bytes& magic) noexcept;

/**
 * Find a checker by name.
 * @param name Checker name (e.g., "gif")
 * @return Pointer to the table entry, or nullptr if not found
 */
[[nodiscard]] IMGINFO_EXPORT const checker_entry* find_checker(std::string_view name) noexcept;

// ============================================================================
// Detection
// ============================================================================

/**
 * Identify the image format of a byte source and extract its header metadata.
 * The source is consumed; it is not closed.
 *
 * @param src Byte source positioned at the start of the image
 * @param options Detection options
 * @return Result holding the metadata, or the failure kind and a message
 */
[[nodiscard]] IMGINFO_EXPORT detect_result detect(byte_source& src,
                                                  const detect_options& options = {});

/**
 * Detect from an in-memory buffer.
 */
[[nodiscard]] IMGINFO_EXPORT detect_result detect(std::span<const std::uint8_t> data,
                                                  const detect_options& options = {});

/**
 * Detect from a file.
 * A file that cannot be opened is reported as detect_error::io_error.
 */
[[nodiscard]] IMGINFO_EXPORT detect_result detect_file(const std::filesystem::path& path,
                                                       const detect_options& options = {});

/**
 * @return true if the source holds a recognizable image header
 */
[[nodiscard]] IMGINFO_EXPORT bool is_image(byte_source& src);

// ============================================================================
// Extensions
// ============================================================================

/**
 * Map a file extension to a format.
 * Matching is case insensitive and the leading dot is optional.
 * @return The format, or image_format::unknown
 */
[[nodiscard]] IMGINFO_EXPORT image_format format_from_extension(std::string_view ext) noexcept;

[[nodiscard]] IMGINFO_EXPORT bool is_valid_image_extension(std::string_view ext) noexcept;

} // namespace imginfo

#endif // IMGINFO_PROBE_HPP_
