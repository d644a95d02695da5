// SPDX-FileCopyrightText: 2025 Vista Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "core/color.hpp"
#include <cmath>
#include <gtest/gtest.h>

namespace vista::core {

    namespace {
        void expect_rgb(const Result<glm::dvec3>& result, const glm::dvec3& expected) {
            ASSERT_TRUE(result.has_value()) << result.error().format();
            EXPECT_NEAR(result->r, expected.r, 1e-12);
            EXPECT_NEAR(result->g, expected.g, 1e-12);
            EXPECT_NEAR(result->b, expected.b, 1e-12);
        }
    } // namespace

    TEST(ColorTest, NamedColors) {
        expect_rgb(parse_color(std::string("white")), {1, 1, 1});
        expect_rgb(parse_color(std::string("Black")), {0, 0, 0});
        expect_rgb(parse_color(std::string("GREY")), glm::dvec3(128.0 / 255.0));
        expect_rgb(parse_color(std::string("gray")), glm::dvec3(128.0 / 255.0));
    }

    TEST(ColorTest, SingleLetterShorthands) {
        expect_rgb(parse_color(std::string("w")), {1, 1, 1});
        expect_rgb(parse_color(std::string("k")), {0, 0, 0});
        expect_rgb(parse_color(std::string("b")), {0, 0, 1});
        EXPECT_FALSE(parse_color(std::string("q")).has_value());
    }

    TEST(ColorTest, HexWithAndWithoutHash) {
        expect_rgb(parse_color(std::string("#ff8000")), {1, 128.0 / 255.0, 0});
        expect_rgb(parse_color(std::string("FF8000")), {1, 128.0 / 255.0, 0});
    }

    TEST(ColorTest, RejectsMalformedStrings) {
        for (const char* bad : {"#ff80", "notacolor", "#gg0000", ""}) {
            const auto result = parse_color(std::string(bad));
            ASSERT_FALSE(result.has_value()) << bad;
            EXPECT_EQ(result.error().code, ErrorCode::INVALID_COLOR);
            EXPECT_TRUE(result.error().is_validation_error());
        }
    }

    TEST(ColorTest, RgbComponentsMustBeInUnitRange) {
        expect_rgb(parse_color(glm::dvec3(0.2, 0.4, 1.0)), {0.2, 0.4, 1.0});
        EXPECT_FALSE(parse_color(glm::dvec3(1.5, 0, 0)).has_value());
        EXPECT_FALSE(parse_color(glm::dvec3(0, -0.1, 0)).has_value());
        EXPECT_FALSE(parse_color(glm::dvec3(std::nan(""), 0, 0)).has_value());
    }

    TEST(ColorTest, FontFamilies) {
        EXPECT_EQ(parse_font_family("Courier").value(), FontFamily::Courier);
        EXPECT_EQ(parse_font_family("ARIAL").value(), FontFamily::Arial);
        EXPECT_EQ(parse_font_family("times").value(), FontFamily::Times);

        const auto bad = parse_font_family("comic sans");
        ASSERT_FALSE(bad.has_value());
        EXPECT_EQ(bad.error().code, ErrorCode::INVALID_FONT_FAMILY);
        EXPECT_EQ(font_family_name(FontFamily::Courier), "courier");
    }

    TEST(ColorTest, HexFormatting) {
        EXPECT_EQ(color_to_hex({1.0, 0.5, 0.0}), "#ff8000");
        EXPECT_EQ(color_to_hex({0.0, 0.0, 0.0}), "#000000");
        EXPECT_EQ(color_to_hex({2.0, -1.0, 1.0}), "#ff00ff");
    }

} // namespace vista::core
