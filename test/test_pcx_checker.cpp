#include <doctest/doctest.h>
#include <imginfo/imginfo.hpp>

#include "helpers/byte_writer.hpp"

#include <vector>

namespace {

using test_helpers::byte_writer;
using test_helpers::detect_bytes;

struct pcx_header {
    std::uint8_t version = 5;
    std::uint8_t encoding = 1;
    std::uint8_t bits_per_plane = 8;
    std::uint16_t x_min = 0;
    std::uint16_t y_min = 0;
    std::uint16_t x_max = 319;
    std::uint16_t y_max = 199;
    std::uint16_t h_dpi = 0;
    std::uint16_t v_dpi = 0;
    std::uint8_t planes = 1;
};

std::vector<std::uint8_t> make_pcx(const pcx_header& h) {
    byte_writer w;
    w.u8(0x0a).u8(h.version).u8(h.encoding).u8(h.bits_per_plane);
    w.le16(h.x_min).le16(h.y_min).le16(h.x_max).le16(h.y_max);
    w.le16(h.h_dpi).le16(h.v_dpi);
    w.fill(48);         // 16 color EGA palette
    w.u8(0);            // reserved
    w.u8(h.planes);
    w.le16(320);        // bytes per line
    w.le16(1);          // palette info
    w.fill(58);
    return w.data();
}

} // namespace

TEST_CASE("PCX checker: sniff") {
    CHECK(imginfo::pcx_checker::sniff({0x0a, 0x00}));
    CHECK(imginfo::pcx_checker::sniff({0x0a, 0x05}));
    CHECK_FALSE(imginfo::pcx_checker::sniff({0x0a, 0x06}));
    CHECK_FALSE(imginfo::pcx_checker::sniff({0x0b, 0x05}));
}

TEST_CASE("PCX checker: header fields") {
    SUBCASE("256 color") {
        auto result = detect_bytes(make_pcx({}));
        REQUIRE(result.ok);
        CHECK(result.metadata.format() == imginfo::image_format::pcx);
        CHECK(result.metadata.width() == 320);
        CHECK(result.metadata.height() == 200);
        CHECK(result.metadata.bits_per_pixel() == 8);
        CHECK(result.metadata.mime_type() == "image/pcx");
    }

    SUBCASE("Offset bounding box") {
        pcx_header h;
        h.x_min = 10;
        h.y_min = 20;
        h.x_max = 10;
        h.y_max = 29;
        auto result = detect_bytes(make_pcx(h));
        REQUIRE(result.ok);
        CHECK(result.metadata.width() == 1);
        CHECK(result.metadata.height() == 10);
    }

    SUBCASE("Single plane depths") {
        for (std::uint8_t bits : {1, 2, 4, 8}) {
            INFO("bits = ", static_cast<int>(bits));
            pcx_header h;
            h.bits_per_plane = bits;
            auto result = detect_bytes(make_pcx(h));
            REQUIRE(result.ok);
            CHECK(result.metadata.bits_per_pixel() == bits);
        }
    }

    SUBCASE("Three plane truecolor") {
        pcx_header h;
        h.planes = 3;
        auto result = detect_bytes(make_pcx(h));
        REQUIRE(result.ok);
        CHECK(result.metadata.bits_per_pixel() == 24);
    }
}

TEST_CASE("PCX checker: resolution") {
    SUBCASE("Horizontal DPI applies to both axes") {
        pcx_header h;
        h.h_dpi = 150;
        h.v_dpi = 300;
        auto result = detect_bytes(make_pcx(h));
        REQUIRE(result.ok);
        CHECK(result.metadata.physical_width_dpi() == 150);
        CHECK(result.metadata.physical_height_dpi() == 150);
        CHECK(*result.metadata.physical_width_inch() == doctest::Approx(320.0f / 150.0f));
    }

    SUBCASE("Zero DPI is absent") {
        pcx_header h;
        h.v_dpi = 300;
        auto result = detect_bytes(make_pcx(h));
        REQUIRE(result.ok);
        CHECK_FALSE(result.metadata.physical_width_dpi().has_value());
        CHECK_FALSE(result.metadata.physical_height_dpi().has_value());
        CHECK_FALSE(result.metadata.physical_width_inch().has_value());
        CHECK_FALSE(result.metadata.physical_height_inch().has_value());
    }
}

TEST_CASE("PCX checker: malformed headers") {
    SUBCASE("Uncompressed encoding") {
        pcx_header h;
        h.encoding = 0;
        CHECK(detect_bytes(make_pcx(h)).error == imginfo::detect_error::malformed_header);
    }

    SUBCASE("Inverted bounding box") {
        pcx_header h;
        h.x_min = 100;
        h.x_max = 99;
        CHECK(detect_bytes(make_pcx(h)).error == imginfo::detect_error::malformed_header);
    }

    SUBCASE("Unsupported plane layout") {
        pcx_header h;
        h.planes = 4;
        CHECK(detect_bytes(make_pcx(h)).error == imginfo::detect_error::malformed_header);

        h.planes = 3;
        h.bits_per_plane = 4;
        CHECK(detect_bytes(make_pcx(h)).error == imginfo::detect_error::malformed_header);

        h.planes = 1;
        h.bits_per_plane = 3;
        CHECK(detect_bytes(make_pcx(h)).error == imginfo::detect_error::malformed_header);
    }
}

TEST_CASE("PCX checker: truncated header") {
    const auto data = make_pcx({});
    CHECK(test_helpers::consumed_bytes(data) == 66);
    CHECK(test_helpers::all_prefixes_truncated(data));
}
