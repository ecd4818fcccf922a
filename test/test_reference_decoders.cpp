// Cross-checks header detection against full image codecs: lodepng writes
// real PNG files and stb_image reports the dimensions it decodes.

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_PNG
#define STBI_ONLY_GIF
#define STBI_ONLY_JPEG
#define STBI_ONLY_PSD
#define STBI_ONLY_PNM
#include <stb_image.h>

#include <lodepng.h>

#include <doctest/doctest.h>
#include <imginfo/imginfo.hpp>

#include "helpers/byte_writer.hpp"

#include <string>
#include <vector>

namespace {

using test_helpers::byte_writer;
using test_helpers::detect_bytes;

struct stb_header {
    int width = 0;
    int height = 0;
    int components = 0;
};

bool stb_info(const std::vector<std::uint8_t>& data, stb_header& out) {
    return stbi_info_from_memory(data.data(), static_cast<int>(data.size()),
                                 &out.width, &out.height, &out.components) != 0;
}

std::vector<std::uint8_t> encode_png(unsigned width, unsigned height, LodePNGColorType color_type,
                                     unsigned bit_depth, bool interlaced) {
    const unsigned channels = color_type == LCT_RGBA ? 4 : color_type == LCT_RGB ? 3 : 1;
    const std::size_t row_bytes = (static_cast<std::size_t>(width) * channels * bit_depth + 7) / 8;
    std::vector<unsigned char> pixels(row_bytes * height);
    for (std::size_t i = 0; i < pixels.size(); ++i) {
        pixels[i] = static_cast<unsigned char>(i * 37);
    }

    lodepng::State state;
    state.info_raw.colortype = color_type;
    state.info_raw.bitdepth = bit_depth;
    state.info_png.color.colortype = color_type;
    state.info_png.color.bitdepth = bit_depth;
    state.info_png.interlace_method = interlaced ? 1 : 0;
    state.encoder.auto_convert = 0;

    std::vector<unsigned char> png;
    const unsigned error = lodepng::encode(png, pixels, width, height, state);
    REQUIRE_MESSAGE(error == 0, lodepng_error_text(error));
    return {png.begin(), png.end()};
}

std::vector<std::uint8_t> make_gif(std::uint16_t width, std::uint16_t height) {
    byte_writer w;
    w.text("GIF89a").le16(width).le16(height).u8(0xf0).u8(0).u8(0);
    w.fill(6);                      // two color global table
    w.u8(0x2c).le16(0).le16(0).le16(width).le16(height).u8(0);
    w.u8(2).u8(2).u8(0x4c).u8(0x01).u8(0);
    w.u8(0x3b);
    return w.data();
}

std::vector<std::uint8_t> make_jpeg(std::uint16_t width, std::uint16_t height) {
    byte_writer w;
    w.u8(0xff).u8(0xd8);
    w.be16(0xffe0).be16(16).text("JFIF").u8(0).u8(1).u8(1).u8(1).be16(96).be16(96).u8(0).u8(0);
    w.be16(0xffdb).be16(67).u8(0).fill(64, 1);
    w.be16(0xffc0).be16(17).u8(8).be16(height).be16(width).u8(3);
    for (std::uint8_t c = 1; c <= 3; ++c) {
        w.u8(c).u8(0x11).u8(0);
    }
    return w.data();
}

std::vector<std::uint8_t> make_psd(std::uint32_t width, std::uint32_t height,
                                   std::uint16_t channels) {
    byte_writer w;
    w.text("8BPS").be16(1).fill(6).be16(channels).be32(height).be32(width).be16(8).be16(3);
    w.be32(0).be32(0).be32(0);      // mode data, resources, layers
    w.be16(0);                      // raw image data
    w.fill(static_cast<std::size_t>(width) * height * channels, 0x80);
    return w.data();
}

std::vector<std::uint8_t> make_pnm(std::string_view magic, int width, int height, int max_value) {
    byte_writer w;
    w.text(magic).text("\n")
     .text(std::to_string(width)).text(" ").text(std::to_string(height)).text("\n")
     .text(std::to_string(max_value)).text("\n");
    const int samples = magic == "P6" ? 3 : 1;
    w.fill(static_cast<std::size_t>(width) * height * samples);
    return w.data();
}

} // namespace

TEST_CASE("Reference decoders: PNG files written by lodepng") {
    struct png_case {
        unsigned width;
        unsigned height;
        LodePNGColorType color_type;
        unsigned bit_depth;
        bool interlaced;
        int expected_bpp;
    };

    const png_case cases[] = {
        {17, 5, LCT_RGB, 8, false, 24},
        {3, 40, LCT_RGBA, 8, true, 24},
        {64, 64, LCT_GREY, 1, false, 1},
        {9, 9, LCT_GREY, 16, true, 16},
        {12, 7, LCT_RGBA, 16, false, 48},
    };

    for (const auto& c : cases) {
        INFO("PNG ", c.width, "x", c.height, " color type ", static_cast<int>(c.color_type));
        const auto png = encode_png(c.width, c.height, c.color_type, c.bit_depth, c.interlaced);

        auto result = detect_bytes(png);
        REQUIRE(result.ok);
        CHECK(result.metadata.format() == imginfo::image_format::png);
        CHECK(result.metadata.width() == static_cast<int>(c.width));
        CHECK(result.metadata.height() == static_cast<int>(c.height));
        CHECK(result.metadata.bits_per_pixel() == c.expected_bpp);
        CHECK(result.metadata.progressive() == c.interlaced);

        stb_header stb;
        REQUIRE(stb_info(png, stb));
        CHECK(stb.width == result.metadata.width());
        CHECK(stb.height == result.metadata.height());
    }
}

TEST_CASE("Reference decoders: lodepng reads what was detected") {
    const auto png = encode_png(31, 13, LCT_RGB, 8, true);
    auto result = detect_bytes(png);
    REQUIRE(result.ok);

    std::vector<unsigned char> pixels;
    unsigned width = 0;
    unsigned height = 0;
    const std::vector<unsigned char> file(png.begin(), png.end());
    REQUIRE(lodepng::decode(pixels, width, height, file, LCT_RGB, 8) == 0);
    CHECK(static_cast<int>(width) == result.metadata.width());
    CHECK(static_cast<int>(height) == result.metadata.height());
}

TEST_CASE("Reference decoders: stb_image agrees on dimensions") {
    SUBCASE("GIF") {
        const auto gif = make_gif(21, 34);
        imginfo::detect_options options;
        options.count_images = true;
        auto result = detect_bytes(gif, options);
        REQUIRE(result.ok);
        CHECK(result.metadata.number_of_images() == 1);

        stb_header stb;
        REQUIRE(stb_info(gif, stb));
        CHECK(stb.width == result.metadata.width());
        CHECK(stb.height == result.metadata.height());
    }

    SUBCASE("JPEG") {
        const auto jpeg = make_jpeg(320, 240);
        auto result = detect_bytes(jpeg);
        REQUIRE(result.ok);
        CHECK(result.metadata.physical_width_dpi() == 96);

        stb_header stb;
        REQUIRE(stb_info(jpeg, stb));
        CHECK(stb.width == result.metadata.width());
        CHECK(stb.height == result.metadata.height());
        CHECK(stb.components * 8 == result.metadata.bits_per_pixel());
    }

    SUBCASE("PSD") {
        const auto psd = make_psd(6, 4, 3);
        auto result = detect_bytes(psd);
        REQUIRE(result.ok);

        stb_header stb;
        REQUIRE(stb_info(psd, stb));
        CHECK(stb.width == result.metadata.width());
        CHECK(stb.height == result.metadata.height());
        CHECK(result.metadata.bits_per_pixel() == 24);
    }

    SUBCASE("Binary pixmap") {
        const auto ppm = make_pnm("P6", 11, 3, 255);
        auto result = detect_bytes(ppm);
        REQUIRE(result.ok);
        CHECK(result.metadata.format() == imginfo::image_format::ppm);

        stb_header stb;
        REQUIRE(stb_info(ppm, stb));
        CHECK(stb.width == result.metadata.width());
        CHECK(stb.height == result.metadata.height());
        CHECK(stb.components * 8 == result.metadata.bits_per_pixel());
    }

    SUBCASE("Binary graymap") {
        const auto pgm = make_pnm("P5", 5, 8, 255);
        auto result = detect_bytes(pgm);
        REQUIRE(result.ok);

        stb_header stb;
        REQUIRE(stb_info(pgm, stb));
        CHECK(stb.width == result.metadata.width());
        CHECK(stb.height == result.metadata.height());
        CHECK(stb.components == 1);
    }
}
