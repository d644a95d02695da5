// SPDX-FileCopyrightText: 2025 Vista Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "core/parameters.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace vista::core::param {

    class RendererParametersTest : public ::testing::Test {
    protected:
        void SetUp() override {
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            dir_ = std::filesystem::temp_directory_path() / ("vista_params_" + std::to_string(stamp));
            std::filesystem::create_directories(dir_);
        }

        void TearDown() override {
            std::error_code ec;
            std::filesystem::remove_all(dir_, ec);
        }

        std::filesystem::path writeJson(const std::string& name, const std::string& text) const {
            const auto path = dir_ / name;
            std::ofstream out(path);
            out << text;
            return path;
        }

        std::filesystem::path dir_;
    };

    TEST_F(RendererParametersTest, DefaultsMatchTheme) {
        const RendererParameters params;
        EXPECT_EQ(params.camera.position, glm::dvec3(1, 1, 1));
        EXPECT_EQ(params.camera.viewup, glm::dvec3(0, 0, 1));
        EXPECT_DOUBLE_EQ(params.camera.view_angle, 30.0);
        EXPECT_EQ(params.font.family, "arial");
        EXPECT_EQ(params.font.size, 12);
        EXPECT_FALSE(params.font.label_format.has_value());
        EXPECT_EQ(params.outline_color, "white");
        EXPECT_EQ(params.max_n_color_bars, 10);
        EXPECT_TRUE(params.border);
        EXPECT_DOUBLE_EQ(params.scale_tolerance, 1e-5);
    }

    TEST_F(RendererParametersTest, MissingKeysKeepDefaults) {
        const auto params = RendererParameters::from_json(nlohmann::json{{"lighting", false}});
        EXPECT_FALSE(params.lighting);
        EXPECT_EQ(params.outline_color, "white");
        EXPECT_EQ(params.camera.position, glm::dvec3(1, 1, 1));
    }

    TEST_F(RendererParametersTest, InvalidValuesFallBack) {
        const nlohmann::json json = {
            {"outline_color", "not-a-color"},
            {"max_n_color_bars", -4},
            {"font", {{"family", "wingdings"}, {"color", "red"}, {"fmt", "%.3e"}}},
        };
        const auto params = RendererParameters::from_json(json);
        EXPECT_EQ(params.outline_color, "white");
        EXPECT_EQ(params.max_n_color_bars, 0);
        EXPECT_EQ(params.font.family, "arial");
        EXPECT_EQ(params.font.color, "red");
        ASSERT_TRUE(params.font.label_format.has_value());
        EXPECT_EQ(*params.font.label_format, "%.3e");
    }

    TEST_F(RendererParametersTest, SaveWritesNestedFileIntoDirectory) {
        RendererParameters params;
        params.camera.position = {-1, 2, 0.5};
        params.border_color = "#102030";
        params.font.label_format = "%.2f";

        ASSERT_TRUE(save_renderer_params_to_json(params, dir_ / "out").has_value());
        const auto written = dir_ / "out" / "renderer_config.json";
        ASSERT_TRUE(std::filesystem::exists(written));

        std::ifstream in(written);
        const auto json = nlohmann::json::parse(in);
        EXPECT_TRUE(json.contains("renderer"));
        EXPECT_TRUE(json.contains("timestamp"));

        const auto loaded = read_renderer_params_from_json(written);
        ASSERT_TRUE(loaded.has_value()) << loaded.error().format();
        EXPECT_EQ(loaded->camera.position, glm::dvec3(-1, 2, 0.5));
        EXPECT_EQ(loaded->border_color, "#102030");
        EXPECT_EQ(loaded->font.label_format, std::optional<std::string>("%.2f"));
    }

    TEST_F(RendererParametersTest, ReadsFlatFiles) {
        const auto path = writeJson("flat.json", R"({"camera": {"view_angle": 45.0}, "border": false})");
        const auto loaded = read_renderer_params_from_json(path);
        ASSERT_TRUE(loaded.has_value()) << loaded.error().format();
        EXPECT_DOUBLE_EQ(loaded->camera.view_angle, 45.0);
        EXPECT_FALSE(loaded->border);
    }

    TEST_F(RendererParametersTest, ReportsMissingAndMalformedFiles) {
        const auto missing = read_renderer_params_from_json(dir_ / "absent.json");
        ASSERT_FALSE(missing.has_value());
        EXPECT_TRUE(missing.error().is(ErrorCode::CONFIG_NOT_FOUND));
        EXPECT_TRUE(missing.error().is_config_error());
        EXPECT_NE(missing.error().message.find("not found"), std::string::npos);

        const auto broken = read_renderer_params_from_json(writeJson("broken.json", "{ not json"));
        ASSERT_FALSE(broken.has_value());
        EXPECT_TRUE(broken.error().is(ErrorCode::MALFORMED_CONFIG));

        const auto wrong_shape = read_renderer_params_from_json(
            writeJson("shape.json", R"({"camera": {"position": [1, 2]}})"));
        ASSERT_FALSE(wrong_shape.has_value());
        EXPECT_TRUE(wrong_shape.error().is(ErrorCode::MALFORMED_CONFIG));
    }

    TEST_F(RendererParametersTest, ReportsUnwritableTarget) {
        // A regular file where the output directory should be
        const auto blocker = writeJson("blocker", "");
        const auto saved = save_renderer_params_to_json(RendererParameters{}, blocker / "nested");
        ASSERT_FALSE(saved.has_value());
        EXPECT_TRUE(saved.error().is(ErrorCode::WRITE_FAILURE));
        EXPECT_TRUE(saved.error().is_config_error());
        EXPECT_FALSE(saved.error().is_validation_error());
    }

} // namespace vista::core::param
