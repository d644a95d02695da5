/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/export.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <glm/glm.hpp>
#include <nlohmann/json_fwd.hpp>

namespace vista::core {
    namespace param {

        struct VISTA_CORE_API CameraDefaults {
            glm::dvec3 position{1.0, 1.0, 1.0}; // Isometric offset direction from the focal point
            glm::dvec3 viewup{0.0, 0.0, 1.0};
            double view_angle = 30.0; // Degrees

            nlohmann::json to_json() const;
            static CameraDefaults from_json(const nlohmann::json& json);
        };

        struct VISTA_CORE_API FontDefaults {
            std::string family = "arial";
            int size = 12;
            std::string color = "white";
            std::optional<std::string> label_format; // Printf-style label format for bounds axes, "fmt" in JSON

            nlohmann::json to_json() const;
            static FontDefaults from_json(const nlohmann::json& json);
        };

        struct VISTA_CORE_API RendererParameters {
            CameraDefaults camera;
            FontDefaults font;
            std::string outline_color = "white";
            bool lighting = true;
            int max_n_color_bars = 10;

            // Viewport border
            bool border = true;
            std::string border_color = "white";
            double border_width = 2.0;

            // Relative tolerance for identity-scale and bounds-drift tests
            double scale_tolerance = 1e-5;

            nlohmann::json to_json() const;
            static RendererParameters from_json(const nlohmann::json& json);
        };

        VISTA_CORE_API Result<RendererParameters> read_renderer_params_from_json(const std::filesystem::path& path);

        VISTA_CORE_API Result<void> save_renderer_params_to_json(
            const RendererParameters& params,
            const std::filesystem::path& output_path);

    } // namespace param
} // namespace vista::core
