#include <doctest/doctest.h>
#include <imginfo/imginfo.hpp>

#include "helpers/byte_writer.hpp"

#include <vector>

namespace {

using test_helpers::byte_writer;
using test_helpers::detect_bytes;

std::vector<std::uint8_t> make_psd(std::uint32_t width, std::uint32_t height,
                                   std::uint16_t channels, std::uint16_t depth,
                                   std::uint16_t mode = 3) {
    byte_writer w;
    w.text("8BPS").be16(1).fill(6)
     .be16(channels)
     .be32(height)
     .be32(width)
     .be16(depth)
     .be16(mode);
    w.be32(0);  // color mode data length
    return w.data();
}

} // namespace

TEST_CASE("PSD checker: sniff") {
    CHECK(imginfo::psd_checker::sniff({'8', 'B'}));
    CHECK_FALSE(imginfo::psd_checker::sniff({'8', 'C'}));
}

TEST_CASE("PSD checker: header fields") {
    SUBCASE("RGB") {
        auto result = detect_bytes(make_psd(1920, 1080, 3, 8));
        REQUIRE(result.ok);
        CHECK(result.metadata.format() == imginfo::image_format::psd);
        CHECK(result.metadata.width() == 1920);
        CHECK(result.metadata.height() == 1080);
        CHECK(result.metadata.bits_per_pixel() == 24);
        CHECK(result.metadata.mime_type() == "image/psd");
    }

    SUBCASE("Width and height are stored height first") {
        auto result = detect_bytes(make_psd(30, 20, 1, 8, 1));
        REQUIRE(result.ok);
        CHECK(result.metadata.width() == 30);
        CHECK(result.metadata.height() == 20);
        CHECK(result.metadata.bits_per_pixel() == 8);
    }

    SUBCASE("CMYK with alpha at 16 bits") {
        auto result = detect_bytes(make_psd(10, 10, 4, 16, 4));
        REQUIRE(result.ok);
        CHECK(result.metadata.bits_per_pixel() == 64);
    }

    SUBCASE("Bitmap mode") {
        auto result = detect_bytes(make_psd(10, 10, 1, 1, 0));
        REQUIRE(result.ok);
        CHECK(result.metadata.bits_per_pixel() == 1);
    }
}

TEST_CASE("PSD checker: malformed headers") {
    SUBCASE("Broken signature") {
        byte_writer w;
        w.text("8BIM").fill(22);
        CHECK(detect_bytes(w.data()).error == imginfo::detect_error::malformed_header);
    }

    SUBCASE("Depth above 64 bits per pixel") {
        CHECK(detect_bytes(make_psd(10, 10, 5, 16)).error ==
              imginfo::detect_error::malformed_header);
    }

    SUBCASE("Huge channel count does not wrap") {
        CHECK(detect_bytes(make_psd(10, 10, 0xffff, 0xffff)).error ==
              imginfo::detect_error::malformed_header);
    }

    SUBCASE("Zero channels") {
        CHECK(detect_bytes(make_psd(10, 10, 0, 8)).error ==
              imginfo::detect_error::malformed_header);
    }
}

TEST_CASE("PSD checker: truncated header") {
    const auto data = make_psd(4, 4, 3, 8);
    CHECK(test_helpers::consumed_bytes(data) == 26);
    CHECK(test_helpers::all_prefixes_truncated(data));
}
