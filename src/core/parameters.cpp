/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/color.hpp"
#include "core/logger.hpp"
#include "path_utils.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace vista::core {
    namespace param {
        namespace {
            Result<nlohmann::json> read_json_file(const std::filesystem::path& path) {
                if (!std::filesystem::exists(path)) {
                    return make_error(ErrorCode::CONFIG_NOT_FOUND,
                                      fmt::format("Config file not found: {}", path_to_utf8(path)));
                }

                std::ifstream file;
                if (!open_file_for_read(path, file)) {
                    return make_error(ErrorCode::CONFIG_NOT_FOUND,
                                      fmt::format("Cannot open config: {}", path_to_utf8(path)));
                }

                try {
                    std::stringstream buffer;
                    buffer << file.rdbuf();
                    return nlohmann::json::parse(buffer.str());
                } catch (const nlohmann::json::parse_error& e) {
                    return make_error(ErrorCode::MALFORMED_CONFIG,
                                      fmt::format("JSON parse error in {}: {}", path_to_utf8(path), e.what()));
                }
            }

            nlohmann::json vec3_to_json(const glm::dvec3& v) {
                return nlohmann::json::array({v.x, v.y, v.z});
            }

            glm::dvec3 vec3_from_json(const nlohmann::json& json) {
                if (!json.is_array() || json.size() != 3) {
                    throw std::invalid_argument("expected an array of three numbers");
                }
                return {json[0].get<double>(), json[1].get<double>(), json[2].get<double>()};
            }

            // Keeps the default when the stored color cannot be parsed
            std::string color_or_default(const nlohmann::json& json, const char* key, const std::string& fallback) {
                if (!json.contains(key)) {
                    return fallback;
                }
                auto value = json[key].get<std::string>();
                if (!parse_color(ColorSpec{value})) {
                    LOG_WARN("Ignoring invalid color '{}' for '{}', keeping '{}'", value, key, fallback);
                    return fallback;
                }
                return value;
            }
        } // namespace

        nlohmann::json CameraDefaults::to_json() const {
            nlohmann::json json;
            json["position"] = vec3_to_json(position);
            json["viewup"] = vec3_to_json(viewup);
            json["view_angle"] = view_angle;
            return json;
        }

        CameraDefaults CameraDefaults::from_json(const nlohmann::json& json) {
            CameraDefaults params;
            if (json.contains("position")) {
                params.position = vec3_from_json(json["position"]);
            }
            if (json.contains("viewup")) {
                params.viewup = vec3_from_json(json["viewup"]);
            }
            if (json.contains("view_angle")) {
                params.view_angle = json["view_angle"];
            }
            return params;
        }

        nlohmann::json FontDefaults::to_json() const {
            nlohmann::json json;
            json["family"] = family;
            json["size"] = size;
            json["color"] = color;
            if (label_format) {
                json["fmt"] = *label_format;
            } else {
                json["fmt"] = nullptr;
            }
            return json;
        }

        FontDefaults FontDefaults::from_json(const nlohmann::json& json) {
            FontDefaults params;
            if (json.contains("family")) {
                const auto family = json["family"].get<std::string>();
                if (parse_font_family(family)) {
                    params.family = family;
                } else {
                    LOG_WARN("Unknown font family '{}', using '{}'", family, params.family);
                }
            }
            if (json.contains("size")) {
                params.size = json["size"];
            }
            params.color = color_or_default(json, "color", params.color);
            if (json.contains("fmt") && !json["fmt"].is_null()) {
                params.label_format = json["fmt"].get<std::string>();
            }
            return params;
        }

        nlohmann::json RendererParameters::to_json() const {
            nlohmann::json json;
            json["camera"] = camera.to_json();
            json["font"] = font.to_json();
            json["outline_color"] = outline_color;
            json["lighting"] = lighting;
            json["max_n_color_bars"] = max_n_color_bars;
            json["border"] = border;
            json["border_color"] = border_color;
            json["border_width"] = border_width;
            json["scale_tolerance"] = scale_tolerance;
            return json;
        }

        RendererParameters RendererParameters::from_json(const nlohmann::json& json) {
            RendererParameters params;
            if (json.contains("camera")) {
                params.camera = CameraDefaults::from_json(json["camera"]);
            }
            if (json.contains("font")) {
                params.font = FontDefaults::from_json(json["font"]);
            }
            params.outline_color = color_or_default(json, "outline_color", params.outline_color);
            if (json.contains("lighting")) {
                params.lighting = json["lighting"];
            }
            if (json.contains("max_n_color_bars")) {
                params.max_n_color_bars = json["max_n_color_bars"];
                if (params.max_n_color_bars < 0) {
                    LOG_WARN("max_n_color_bars cannot be negative, clamping to 0");
                    params.max_n_color_bars = 0;
                }
            }
            if (json.contains("border")) {
                params.border = json["border"];
            }
            params.border_color = color_or_default(json, "border_color", params.border_color);
            if (json.contains("border_width")) {
                params.border_width = json["border_width"];
            }
            if (json.contains("scale_tolerance")) {
                params.scale_tolerance = json["scale_tolerance"];
            }
            return params;
        }

        Result<RendererParameters> read_renderer_params_from_json(const std::filesystem::path& path) {
            auto json_result = read_json_file(path);
            if (!json_result) {
                return std::unexpected(json_result.error());
            }

            const auto& json = *json_result;
            // Support both flat and nested {"renderer": {...}} formats
            const auto& renderer_json = json.contains("renderer") ? json["renderer"] : json;

            try {
                auto params = RendererParameters::from_json(renderer_json);
                LOG_DEBUG("Loaded renderer parameters from {}", path_to_utf8(path));
                return params;
            } catch (const std::exception& e) {
                return make_error(ErrorCode::MALFORMED_CONFIG,
                                  fmt::format("Error parsing renderer parameters: {}", e.what()));
            }
        }

        Result<void> save_renderer_params_to_json(
            const RendererParameters& params,
            const std::filesystem::path& output_path) {
            try {
                nlohmann::json json;
                json["renderer"] = params.to_json();

                const auto now = std::chrono::system_clock::now();
                const auto time_t = std::chrono::system_clock::to_time_t(now);
                std::stringstream ss;
                ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
                json["timestamp"] = ss.str();

                const std::filesystem::path filepath = (output_path.extension() == ".json")
                                                           ? output_path
                                                           : output_path / "renderer_config.json";
                std::ofstream file;
                if (!open_file_for_write(filepath, file)) {
                    return make_error(ErrorCode::WRITE_FAILURE,
                                      fmt::format("Cannot write: {}", path_to_utf8(filepath)));
                }

                file << json.dump(4);
                LOG_INFO("Saved config: {}", path_to_utf8(filepath));
                return {};
            } catch (const std::exception& e) {
                return make_error(ErrorCode::WRITE_FAILURE,
                                  fmt::format("Error saving renderer parameters: {}", e.what()));
            }
        }

    } // namespace param
} // namespace vista::core
