#include <doctest/doctest.h>

#include "anvilerror.h"
#include "anvilspec.h"

#include <cmath>

TEST_SUITE("AnvilSpec") {

TEST_CASE("Defaults are valid") {
    AnvilSpec spec;
    QString error;
    CHECK(spec.validate(&error));
    CHECK(error.isEmpty());
    CHECK(spec.scale == doctest::Approx(0.7));
    CHECK(spec.color == RgbColor(0x00, 0x70, 0xF2));
    CHECK(spec.aspectRatio == AspectRatio::Landscape16x9);
}

TEST_CASE("Validation rejects out of range fields") {
    AnvilSpec spec;
    QString error;

    SUBCASE("Scale below the minimum") {
        spec.scale = 0.49;
        CHECK_FALSE(spec.validate(&error));
        CHECK(error.contains("scale"));
    }
    SUBCASE("Scale above the maximum") {
        spec.scale = 1.01;
        CHECK_FALSE(spec.validate(&error));
    }
    SUBCASE("Offsets") {
        spec.offsetY = -1.5;
        CHECK_FALSE(spec.validate(&error));
        CHECK(error.contains("offsetY"));
    }
    SUBCASE("Opacity") {
        spec.opacity = 2.0;
        CHECK_FALSE(spec.validate(&error));
        CHECK(error.contains("opacity"));
    }
    SUBCASE("Not a number") {
        spec.offsetX = std::nan("");
        CHECK_FALSE(spec.validate(&error));
    }
    SUBCASE("Bounds are inclusive") {
        spec.scale = 0.5;
        spec.offsetX = -1.0;
        spec.offsetY = 1.0;
        spec.opacity = 0.0;
        CHECK(spec.validate(&error));
    }
}

TEST_CASE("Building a spec from request parameters") {
    AnvilSpec spec;
    QString error;

    SUBCASE("All keys") {
        QVariantMap params;
        params["scale"] = "0.9";
        params["offsetX"] = -0.25;
        params["offsetY"] = "0.5";
        params["opacity"] = 0.8;
        params["color"] = "#aa0843";
        params["ratio"] = "9:16";
        REQUIRE(AnvilSpec::fromParameters(params, spec, &error));
        CHECK(spec.scale == doctest::Approx(0.9));
        CHECK(spec.offsetX == doctest::Approx(-0.25));
        CHECK(spec.offsetY == doctest::Approx(0.5));
        CHECK(spec.opacity == doctest::Approx(0.8));
        CHECK(spec.color == RgbColor(0xAA, 0x08, 0x43));
        CHECK(spec.aspectRatio == AspectRatio::Portrait9x16);
    }
    SUBCASE("Missing keys keep defaults") {
        REQUIRE(AnvilSpec::fromParameters(QVariantMap(), spec, &error));
        CHECK(spec.opacity == doctest::Approx(0.5));
        CHECK(spec.color.toHex() == "#0070F2");
    }
    SUBCASE("Non-numeric value") {
        QVariantMap params;
        params["scale"] = "large";
        CHECK_FALSE(AnvilSpec::fromParameters(params, spec, &error));
        CHECK(error.contains("scale"));
    }
    SUBCASE("Bad colour") {
        QVariantMap params;
        params["color"] = "#12345";
        CHECK_FALSE(AnvilSpec::fromParameters(params, spec, &error));
    }
    SUBCASE("Unsupported ratio") {
        QVariantMap params;
        params["ratio"] = "4:3";
        CHECK_FALSE(AnvilSpec::fromParameters(params, spec, &error));
        CHECK(error.contains("4:3"));
    }
    SUBCASE("Out of range value leaves the output untouched") {
        spec.scale = 0.6;
        QVariantMap params;
        params["scale"] = 0.2;
        CHECK_FALSE(AnvilSpec::fromParameters(params, spec, &error));
        CHECK(spec.scale == doctest::Approx(0.6));
    }
}

TEST_CASE("Colour parsing and formatting") {
    RgbColor color;
    CHECK(RgbColor::fromHex("0070f2", color));
    CHECK(color == RgbColor(0, 0x70, 0xF2));
    CHECK(color.toHex() == "#0070F2");
    CHECK_FALSE(RgbColor::fromHex("#GG0000", color));
    CHECK_FALSE(RgbColor::fromHex("", color));

    cv::Vec4b bgra = RgbColor(1, 2, 3).toBgra(200);
    CHECK(bgra == cv::Vec4b(3, 2, 1, 200));
}

TEST_CASE("Tints mix towards white and black") {
    const RgbColor blue(0x00, 0x70, 0xF2);
    CHECK(blue.tinted(0.0) == blue);
    CHECK(blue.tinted(0.5) == RgbColor(127, 183, 248));
    CHECK(blue.tinted(0.25) == RgbColor(63, 147, 245));
    CHECK(blue.tinted(-0.25) == RgbColor(0, 84, 181));
    CHECK(blue.tinted(1.0) == RgbColor(255, 255, 255));
    CHECK(blue.tinted(-1.0) == RgbColor(0, 0, 0));
}

TEST_CASE("Aspect ratios") {
    AspectRatio ratio = AspectRatio::Landscape16x9;
    CHECK(AnvilSpec::aspectRatioFromString("1:1", ratio));
    CHECK(ratio == AspectRatio::Square1x1);
    CHECK(AnvilSpec::aspectRatioToString(AspectRatio::Portrait9x16) == "9:16");
    CHECK(AnvilSpec::aspectRatioValue(AspectRatio::Landscape16x9) == doctest::Approx(16.0 / 9.0));
    CHECK_FALSE(AnvilSpec::aspectRatioFromString("16x9", ratio));
}

TEST_CASE("Palette names") {
    CHECK(ColorPalette::entries().size() == 27);
    CHECK(ColorPalette::nameFor(RgbColor(0x00, 0x70, 0xF2)) == "Blue 2");
    CHECK(ColorPalette::slugFor(RgbColor(0xED, 0xEF, 0xF0)) == "LightGray");
    CHECK(ColorPalette::nameFor(RgbColor(1, 2, 3)) == "Custom");
}

TEST_CASE("Error kind names") {
    CHECK(AnvilError::kindToString(ErrorKind::Validation) == "ValidationError");
    CHECK(AnvilError::kindToString(ErrorKind::QueueOverflow) == "QueueOverflow");

    AnvilError error(ErrorKind::Timeout, QString("took too long"));
    CHECK(error.kind() == ErrorKind::Timeout);
    CHECK(QString(error.what()).contains("took too long"));
}

}
