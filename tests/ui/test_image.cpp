/// @file test_image.cpp
/// @brief Tests for image decoding and the image view

#include <catch2/catch_test_macros.hpp>

#include "test_views.hpp"

#include <string>

using namespace loom_ui;
using loom_core::ErrorCode;

namespace {

/// 2x1 binary PPM: one red and one blue pixel
EncodedImage two_pixel_ppm() {
    const std::string header = "P6\n2 1\n255\n";
    std::vector<std::uint8_t> bytes(header.begin(), header.end());
    for (std::uint8_t value : {255, 0, 0, 0, 0, 255}) {
        bytes.push_back(value);
    }
    return EncodedImage{std::move(bytes)};
}

} // namespace

// =============================================================================
// Decoding
// =============================================================================

TEST_CASE("Decode images", "[ui][image]") {
    SECTION("encoded bytes") {
        auto decoded = decode_image(two_pixel_ppm());
        REQUIRE(decoded.is_ok());
        const auto& image = decoded.value();
        REQUIRE(image.size() == Size{2, 1});
        REQUIRE(image.pixels.size() == 8);
        // Expanded to RGBA with opaque alpha
        REQUIRE(image.pixels[0] == 255);
        REQUIRE(image.pixels[3] == 255);
        REQUIRE(image.pixels[6] == 255);
    }

    SECTION("garbage bytes") {
        auto decoded = decode_image(EncodedImage{{1, 2, 3, 4}});
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.error().code() == ErrorCode::ParseError);
    }

    SECTION("missing file") {
        auto decoded = decode_image(ImageFile{"/nonexistent/loom/picture.png"});
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.error().code() == ErrorCode::NotFound);
    }

    SECTION("raw pixels are checked") {
        RgbaImage short_image{2, 2, std::vector<std::uint8_t>(4, 0)};
        REQUIRE(decode_image(short_image).is_err());

        RgbaImage image{1, 1, {1, 2, 3, 4}};
        auto decoded = decode_image(image);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value() == image);
    }
}

// =============================================================================
// Image view
// =============================================================================

TEST_CASE("Image view sizing", "[ui][image]") {
    HeadlessBackend backend;

    SECTION("pixel size by default") {
        ViewGraph graph(Image(two_pixel_ppm()), backend);
        const auto result = graph.update(SizeProposal{50, 40});
        REQUIRE(result.size.size == Size{2, 1});
        REQUIRE(result.size.maximum_width == 2);
    }

    SECTION("resizable images take the proposal") {
        ViewGraph graph(Image(two_pixel_ppm()).resizable(), backend);
        const auto result = graph.update(SizeProposal{50, 40});
        REQUIRE(result.size.size == Size{50, 40});
        REQUIRE(result.size.ideal_size == Size{2, 1});
        REQUIRE_FALSE(result.size.maximum_width.has_value());

        const auto& container = backend.widget(graph.root_widget());
        REQUIRE(container.children.size() == 1);
        const auto& image = backend.widget(container.children.front());
        REQUIRE(image.kind == HeadlessWidgetKind::ImageView);
        REQUIRE(image.image_size == Size{2, 1});
        REQUIRE(image.size == Size{50, 40});
    }

    SECTION("undecodable images lay out empty") {
        ViewGraph graph(Image(EncodedImage{{9, 9, 9}}).resizable(), backend);
        const auto result = graph.update(SizeProposal{50, 40});
        REQUIRE(result.size.size == Size{0, 0});
        REQUIRE(result.size.maximum_width == 0);
        REQUIRE(backend.widget(graph.root_widget()).children.empty());
    }
}

TEST_CASE("Image view updates the widget only when needed", "[ui][image]") {
    HeadlessBackend backend;
    ViewGraph graph(Image(two_pixel_ppm()).resizable(), backend);
    graph.update(SizeProposal{50, 40});
    const auto image = backend.widget(graph.root_widget()).children.front();

    graph.update(Image(two_pixel_ppm()).resizable(), SizeProposal{50, 40});
    REQUIRE(backend.widget(image).image_updates == 1);

    SECTION("resizing") {
        graph.update(SizeProposal{60, 40});
        REQUIRE(backend.widget(image).image_updates == 2);
    }

    SECTION("scale factor change") {
        backend.set_scale_factor(2.0);
        REQUIRE(backend.widget(image).image_updates == 2);
        REQUIRE(backend.widget(image).image_scale_factor == 2.0);
    }

    SECTION("a failing source removes the image widget") {
        graph.update(Image(EncodedImage{{0}}).resizable(), SizeProposal{50, 40});
        REQUIRE(backend.widget(graph.root_widget()).children.empty());
    }
}
