#include <imginfo/image_metadata.hpp>

namespace imginfo {

namespace {

std::optional<float> inches(int pixels, const std::optional<int>& dpi) noexcept {
    if (pixels > 0 && dpi && *dpi > 0) {
        return static_cast<float>(pixels) / static_cast<float>(*dpi);
    }
    return std::nullopt;
}

} // namespace

std::optional<float> image_metadata::physical_width_inch() const noexcept {
    return inches(fields_.width, fields_.physical_width_dpi);
}

std::optional<float> image_metadata::physical_height_inch() const noexcept {
    return inches(fields_.height, fields_.physical_height_dpi);
}

std::string_view image_metadata::format_name() const noexcept {
    return imginfo::format_name(fields_.format);
}

std::string_view image_metadata::mime_type() const noexcept {
    return imginfo::mime_type(fields_.format, fields_.progressive);
}

} // namespace imginfo
