#include <imginfo/types.hpp>

#include <cstddef>
#include <iterator>

namespace imginfo {

namespace {

struct format_traits {
    std::string_view name;
    std::string_view mime;
    std::span<const std::string_view> extensions;
};

constexpr std::string_view JPEG_EXTENSIONS[] = {".jpg", ".jpeg", ".jpe", ".jfif"};
constexpr std::string_view GIF_EXTENSIONS[] = {".gif"};
constexpr std::string_view PNG_EXTENSIONS[] = {".png"};
constexpr std::string_view BMP_EXTENSIONS[] = {".bmp", ".dib"};
constexpr std::string_view PCX_EXTENSIONS[] = {".pcx"};
constexpr std::string_view IFF_EXTENSIONS[] = {".iff", ".ilbm", ".lbm"};
constexpr std::string_view RAS_EXTENSIONS[] = {".ras", ".sun"};
constexpr std::string_view PBM_EXTENSIONS[] = {".pbm"};
constexpr std::string_view PGM_EXTENSIONS[] = {".pgm"};
constexpr std::string_view PPM_EXTENSIONS[] = {".ppm"};
constexpr std::string_view PSD_EXTENSIONS[] = {".psd"};

// Indexed by image_format
constexpr format_traits FORMAT_TRAITS[] = {
    {"JPEG", "image/jpeg", JPEG_EXTENSIONS},
    {"GIF",  "image/gif",  GIF_EXTENSIONS},
    {"PNG",  "image/png",  PNG_EXTENSIONS},
    {"BMP",  "image/bmp",  BMP_EXTENSIONS},
    {"PCX",  "image/pcx",  PCX_EXTENSIONS},
    {"IFF",  "image/iff",  IFF_EXTENSIONS},
    {"RAS",  "image/ras",  RAS_EXTENSIONS},
    {"PBM",  "image/x-portable-bitmap",  PBM_EXTENSIONS},
    {"PGM",  "image/x-portable-graymap", PGM_EXTENSIONS},
    {"PPM",  "image/x-portable-pixmap",  PPM_EXTENSIONS},
    {"PSD",  "image/psd",  PSD_EXTENSIONS},
};

static_assert(std::size(FORMAT_TRAITS) == static_cast<std::size_t>(image_format::unknown));

const format_traits* traits_of(image_format fmt) noexcept {
    const auto index = static_cast<std::size_t>(fmt);
    return index < std::size(FORMAT_TRAITS) ? &FORMAT_TRAITS[index] : nullptr;
}

} // namespace

std::string_view format_name(image_format fmt) noexcept {
    const auto* traits = traits_of(fmt);
    return traits ? traits->name : "?";
}

std::string_view mime_type(image_format fmt, bool progressive) noexcept {
    if (fmt == image_format::jpeg && progressive) {
        return "image/pjpeg";
    }
    const auto* traits = traits_of(fmt);
    return traits ? traits->mime : std::string_view{};
}

std::span<const std::string_view> format_extensions(image_format fmt) noexcept {
    const auto* traits = traits_of(fmt);
    return traits ? traits->extensions : std::span<const std::string_view>{};
}

const char* to_string(detect_error err) noexcept {
    switch (err) {
        case detect_error::none:                return "none";
        case detect_error::unrecognized_format: return "unrecognized_format";
        case detect_error::malformed_header:    return "malformed_header";
        case detect_error::truncated:           return "truncated";
        case detect_error::io_error:            return "io_error";
    }
    return "unknown";
}

} // namespace imginfo
