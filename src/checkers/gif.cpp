#include <imginfo/checkers/gif.hpp>
#include "byte_io.hpp"
#include "check_helpers.hpp"
#include "logger.hpp"

#include <array>
#include <string>

namespace imginfo {

namespace {

// "F87a" / "F89a": the signature after the "GI" magic
constexpr std::uint8_t GIF87A_TAIL[] = {0x46, 0x38, 0x37, 0x61};
constexpr std::uint8_t GIF89A_TAIL[] = {0x46, 0x38, 0x39, 0x61};

// Signature tail (4) and logical screen descriptor (7)
constexpr std::size_t GIF_HEADER_TAIL = 11;

// Image descriptor without its separator byte
constexpr std::size_t IMAGE_DESCRIPTOR_SIZE = 9;

constexpr std::uint8_t BLOCK_IMAGE = 0x2c;
constexpr std::uint8_t BLOCK_EXTENSION = 0x21;
constexpr std::uint8_t BLOCK_TRAILER = 0x3b;
constexpr std::uint8_t EXT_COMMENT = 0xfe;

constexpr std::uint8_t FLAG_COLOR_TABLE = 0x80;
constexpr std::uint8_t FLAG_INTERLACED = 0x40;

std::size_t color_table_size(int bits) {
    return (static_cast<std::size_t>(1) << bits) * 3;
}

// Collect the data sub-blocks of a comment extension into one string
bool read_comment(byte_source& src, std::string& comment) {
    while (true) {
        auto n = src.read_byte();
        if (!n) {
            return false;
        }
        if (*n == 0) {
            return true;
        }
        for (int i = 0; i < *n; ++i) {
            auto ch = src.read_byte();
            if (!ch) {
                return false;
            }
            comment.push_back(static_cast<char>(*ch));
        }
    }
}

enum class walk_end {
    trailer,
    end_of_input,
    unknown_block
};

struct block_walk {
    int images = 0;
    std::uint8_t unknown_block = 0;
};

// Walk the block stream after the logical screen descriptor up to the trailer.
// Complete comment extensions are appended to info when collected; image
// descriptors update the interlace flag and depth only when describe_images
// is set.
walk_end walk_blocks(byte_source& src, std::uint8_t screen_flags, bool collect_comments,
                     bool describe_images, image_metadata::fields& info, block_walk& walk) {
    if ((screen_flags & FLAG_COLOR_TABLE) &&
        !src.try_skip(color_table_size((screen_flags & 0x07) + 1))) {
        return walk_end::end_of_input;
    }

    while (true) {
        auto block = src.read_byte();
        if (!block) {
            return walk_end::end_of_input;
        }

        switch (*block) {
            case BLOCK_IMAGE: {
                std::array<std::uint8_t, IMAGE_DESCRIPTOR_SIZE> d{};
                if (!src.read_exact(d)) {
                    return walk_end::end_of_input;
                }
                const std::uint8_t local_flags = d[8];
                const int local_bits = (local_flags & 0x07) + 1;
                if (describe_images) {
                    info.progressive = (local_flags & FLAG_INTERLACED) != 0;
                    if (local_bits > info.bits_per_pixel) {
                        info.bits_per_pixel = local_bits;
                    }
                }
                if ((local_flags & FLAG_COLOR_TABLE) && !src.try_skip(color_table_size(local_bits))) {
                    return walk_end::end_of_input;
                }
                // LZW minimum code size, then the image data
                if (!src.try_skip(1) || !skip_sub_blocks(src)) {
                    return walk_end::end_of_input;
                }
                ++walk.images;
                break;
            }
            case BLOCK_EXTENSION: {
                auto type = src.read_byte();
                if (!type) {
                    return walk_end::end_of_input;
                }
                if (collect_comments && *type == EXT_COMMENT) {
                    std::string comment;
                    if (!read_comment(src, comment)) {
                        return walk_end::end_of_input;
                    }
                    info.comments.push_back(std::move(comment));
                } else if (!skip_sub_blocks(src)) {
                    return walk_end::end_of_input;
                }
                break;
            }
            case BLOCK_TRAILER:
                return walk_end::trailer;
            default:
                walk.unknown_block = *block;
                return walk_end::unknown_block;
        }
    }
}

} // namespace

bool gif_checker::sniff(const magic_bytes& magic) noexcept {
    return magic[0] == 0x47 && magic[1] == 0x49;
}

detect_result gif_checker::check(byte_source& src,
                                 const magic_bytes& /*magic*/,
                                 const detect_options& options) {
    std::array<std::uint8_t, GIF_HEADER_TAIL> a{};
    if (!src.read_exact(a)) {
        return truncated("GIF header truncated");
    }
    if (!matches(a, 0, GIF89A_TAIL) && !matches(a, 0, GIF87A_TAIL)) {
        return malformed("Not a GIF87a or GIF89a signature");
    }

    image_metadata::fields info;
    info.format = image_format::gif;
    info.width = read_le16(a, 4);
    info.height = read_le16(a, 6);
    const std::uint8_t flags = a[8];
    info.bits_per_pixel = ((flags >> 4) & 0x07) + 1;

    block_walk walk;
    if (!options.count_images) {
        // Without counting the record is the screen descriptor alone; comments
        // are gathered up to the first block that cannot be followed
        if (options.collect_comments &&
            walk_blocks(src, flags, true, false, info, walk) != walk_end::trailer) {
            detail::logger().debug("gif: comment scan stopped before the trailer");
        }
        return finish(info);
    }

    switch (walk_blocks(src, flags, options.collect_comments, true, info, walk)) {
        case walk_end::trailer:
            break;
        case walk_end::end_of_input:
            return truncated("GIF block stream ended before the trailer");
        case walk_end::unknown_block:
            return malformed("Unexpected GIF block type: " + std::to_string(walk.unknown_block));
    }

    if (walk.images == 0) {
        return malformed("GIF stream contains no image");
    }
    info.number_of_images = walk.images;

    return finish(info);
}

} // namespace imginfo
