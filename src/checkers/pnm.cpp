#include <imginfo/checkers/pnm.hpp>
#include "check_helpers.hpp"

#include <string>

namespace imginfo {

namespace {

// P1/P4 bitmap, P2/P5 graymap, P3/P6 pixmap
constexpr image_format PNM_FORMATS[] = {image_format::pbm, image_format::pgm, image_format::ppm};

// Upper bound on the bits needed to hold the maximum sample value
constexpr int PNM_MAX_SAMPLE_BITS = 25;

// Longest accepted header line, line feed excluded
constexpr std::size_t PNM_MAX_LINE_LENGTH = 4096;

// Split "W H" at the first and last space
bool parse_dimensions(std::string_view line, int& width, int& height) {
    const auto first = line.find(' ');
    if (first == std::string_view::npos) {
        return false;
    }
    const auto last = line.rfind(' ');
    return parse_int(line.substr(0, first), width) &&
           parse_int(line.substr(last + 1), height);
}

} // namespace

bool pnm_checker::sniff(const magic_bytes& magic) noexcept {
    return magic[0] == 0x50 && magic[1] >= 0x31 && magic[1] <= 0x36;
}

detect_result pnm_checker::check(byte_source& src,
                                 const magic_bytes& magic,
                                 const detect_options& options) {
    const int id = magic[1] - '0';
    if (id < 1 || id > 6) {
        return malformed("Invalid PNM type");
    }

    image_metadata::fields info;
    info.format = PNM_FORMATS[(id - 1) % 3];

    bool have_dimensions = false;
    while (true) {
        // Header lines always end with a line feed; anything else is a cut stream
        bool terminated = false;
        auto raw = src.read_line(terminated, PNM_MAX_LINE_LENGTH + 1);
        if (raw && raw->size() > PNM_MAX_LINE_LENGTH) {
            return malformed("PNM header line too long");
        }
        if (!raw || !terminated) {
            return truncated("PNM header truncated");
        }
        const std::string_view line = trim(*raw);
        if (line.empty()) {
            continue;
        }
        if (line.front() == '#') {
            if (options.collect_comments && line.size() > 1) {
                info.comments.emplace_back(line.substr(1));
            }
            continue;
        }

        if (!have_dimensions) {
            if (!parse_dimensions(line, info.width, info.height)) {
                return malformed("Invalid PNM dimensions");
            }
            if (info.width < 1 || info.height < 1) {
                return malformed("Invalid image dimensions");
            }
            if (info.format == image_format::pbm) {
                info.bits_per_pixel = 1;
                return finish(info);
            }
            have_dimensions = true;
            continue;
        }

        int max_sample = 0;
        if (!parse_int(line, max_sample) || max_sample < 0) {
            return malformed("Invalid PNM maximum sample value");
        }
        for (int i = 0; i < PNM_MAX_SAMPLE_BITS; ++i) {
            if (max_sample < (1 << (i + 1))) {
                info.bits_per_pixel = i + 1;
                if (info.format == image_format::ppm) {
                    info.bits_per_pixel *= 3;
                }
                return finish(info);
            }
        }
        return malformed("PNM maximum sample value out of range");
    }
}

} // namespace imginfo
