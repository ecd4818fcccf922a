#include <imginfo/probe.hpp>
#include <imginfo/checkers/gif.hpp>
#include <imginfo/checkers/png.hpp>
#include <imginfo/checkers/jpeg.hpp>
#include <imginfo/checkers/bmp.hpp>
#include <imginfo/checkers/pcx.hpp>
#include <imginfo/checkers/iff.hpp>
#include <imginfo/checkers/sunrast.hpp>
#include <imginfo/checkers/pnm.hpp>
#include <imginfo/checkers/psd.hpp>
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <ios>
#include <string>

namespace imginfo {

// ============================================================================
// Dispatch Table
// ============================================================================

namespace {

template <typename Checker>
constexpr checker_entry entry_for() {
    return {Checker::name, &Checker::sniff, &Checker::check};
}

// Magic byte pairs of the entries are mutually exclusive; the order only
// fixes which checker is tried first
constexpr checker_entry CHECKERS[] = {
    entry_for<gif_checker>(),
    entry_for<png_checker>(),
    entry_for<jpeg_checker>(),
    entry_for<bmp_checker>(),
    entry_for<pcx_checker>(),
    entry_for<iff_checker>(),
    entry_for<sunrast_checker>(),
    entry_for<pnm_checker>(),
    entry_for<psd_checker>(),
};

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

detect_result run_checker(const checker_entry& entry, byte_source& src,
                          const magic_bytes& magic, const detect_options& options) {
    try {
        return entry.check(src, magic, options);
    } catch (const premature_end_of_input& e) {
        return detect_result::failure(detect_error::truncated, e.what());
    } catch (const std::ios_base::failure& e) {
        return detect_result::failure(detect_error::truncated, e.what());
    }
}

} // namespace

std::span<const checker_entry> checkers() noexcept {
    return CHECKERS;
}

const checker_entry* find_checker(const magic_bytes& magic) noexcept {
    for (const auto& entry : CHECKERS) {
        if (entry.sniff(magic)) {
            return &entry;
        }
    }
    return nullptr;
}

const checker_entry* find_checker(std::string_view name) noexcept {
    for (const auto& entry : CHECKERS) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

// ============================================================================
// Detection
// ============================================================================

detect_result detect(byte_source& src, const detect_options& options) {
    magic_bytes magic{};
    try {
        if (!src.read_exact(magic)) {
            return detect_result::failure(detect_error::truncated,
                "Input too short for magic bytes");
        }
    } catch (const std::ios_base::failure& e) {
        return detect_result::failure(detect_error::truncated, e.what());
    }

    const checker_entry* entry = find_checker(magic);
    if (!entry) {
        detail::logger().debug("unrecognized magic bytes {:02x} {:02x}", magic[0], magic[1]);
        return detect_result::failure(detect_error::unrecognized_format,
            "Unrecognized image format");
    }

    auto result = run_checker(*entry, src, magic, options);
    if (!result) {
        detail::logger().debug("{} header rejected: {} ({})",
                               entry->name, to_string(result.error), result.message);
    } else {
        detail::logger().trace("{}: {}x{}, {} bpp", entry->name,
                               result.metadata.width(), result.metadata.height(),
                               result.metadata.bits_per_pixel());
    }
    return result;
}

detect_result detect(std::span<const std::uint8_t> data, const detect_options& options) {
    memory_byte_source src(data);
    return detect(src, options);
}

detect_result detect_file(const std::filesystem::path& path, const detect_options& options) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        detail::logger().warn("cannot open {}", path.string());
        return detect_result::failure(detect_error::io_error,
            "Cannot open file: " + path.string());
    }
    stream_byte_source src(file);
    return detect(src, options);
}

bool is_image(byte_source& src) {
    return detect(src).ok;
}

// ============================================================================
// Extensions
// ============================================================================

image_format format_from_extension(std::string_view ext) noexcept {
    if (!ext.empty() && ext.front() == '.') {
        ext.remove_prefix(1);
    }
    if (ext.empty()) {
        return image_format::unknown;
    }

    for (int i = 0; i < static_cast<int>(image_format::unknown); ++i) {
        const auto fmt = static_cast<image_format>(i);
        for (const auto& candidate : format_extensions(fmt)) {
            if (iequals(candidate.substr(1), ext)) {
                return fmt;
            }
        }
    }
    return image_format::unknown;
}

bool is_valid_image_extension(std::string_view ext) noexcept {
    return format_from_extension(ext) != image_format::unknown;
}

} // namespace imginfo
