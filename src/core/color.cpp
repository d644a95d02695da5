/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/color.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <optional>
#include <utility>

namespace vista::core {

    namespace {
        struct NamedColor {
            std::string_view name;
            std::string_view hex;
        };

        constexpr std::array NAMED_COLORS = {
            NamedColor{"black", "000000"},
            NamedColor{"white", "ffffff"},
            NamedColor{"red", "ff0000"},
            NamedColor{"green", "008000"},
            NamedColor{"lime", "00ff00"},
            NamedColor{"blue", "0000ff"},
            NamedColor{"cyan", "00ffff"},
            NamedColor{"magenta", "ff00ff"},
            NamedColor{"yellow", "ffff00"},
            NamedColor{"orange", "ffa500"},
            NamedColor{"purple", "800080"},
            NamedColor{"pink", "ffc0cb"},
            NamedColor{"brown", "a52a2a"},
            NamedColor{"grey", "808080"},
            NamedColor{"gray", "808080"},
            NamedColor{"lightgrey", "d3d3d3"},
            NamedColor{"lightgray", "d3d3d3"},
            NamedColor{"darkgrey", "a9a9a9"},
            NamedColor{"darkgray", "a9a9a9"},
            NamedColor{"silver", "c0c0c0"},
            NamedColor{"gold", "ffd700"},
            NamedColor{"navy", "000080"},
            NamedColor{"teal", "008080"},
            NamedColor{"olive", "808000"},
            NamedColor{"maroon", "800000"},
            NamedColor{"tan", "d2b48c"},
            NamedColor{"salmon", "fa8072"},
            NamedColor{"violet", "ee82ee"},
            NamedColor{"indigo", "4b0082"},
            NamedColor{"beige", "f5f5dc"},
            NamedColor{"paraview", "52576e"},
        };

        // Single-letter shorthands
        constexpr std::array SHORT_COLORS = {
            std::pair{'k', std::string_view{"black"}},
            std::pair{'w', std::string_view{"white"}},
            std::pair{'r', std::string_view{"red"}},
            std::pair{'g', std::string_view{"green"}},
            std::pair{'b', std::string_view{"blue"}},
            std::pair{'c', std::string_view{"cyan"}},
            std::pair{'m', std::string_view{"magenta"}},
            std::pair{'y', std::string_view{"yellow"}},
        };

        std::string to_lower(const std::string_view text) {
            std::string out(text);
            std::ranges::transform(out, out.begin(), [](const unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return out;
        }

        int hex_digit(const char c) {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        std::optional<glm::dvec3> parse_hex(std::string_view hex) {
            if (!hex.empty() && hex.front() == '#')
                hex.remove_prefix(1);
            if (hex.size() != 6)
                return std::nullopt;

            glm::dvec3 rgb{};
            for (int channel = 0; channel < 3; ++channel) {
                const int hi = hex_digit(hex[static_cast<size_t>(channel) * 2]);
                const int lo = hex_digit(hex[static_cast<size_t>(channel) * 2 + 1]);
                if (hi < 0 || lo < 0)
                    return std::nullopt;
                rgb[channel] = static_cast<double>(hi * 16 + lo) / 255.0;
            }
            return rgb;
        }

        std::optional<std::string_view> lookup_name(const std::string_view name) {
            if (name.size() == 1) {
                const auto it = std::ranges::find(SHORT_COLORS, name.front(), &std::pair<char, std::string_view>::first);
                if (it == SHORT_COLORS.end())
                    return std::nullopt;
                return lookup_name(it->second);
            }
            const auto it = std::ranges::find(NAMED_COLORS, name, &NamedColor::name);
            if (it == NAMED_COLORS.end())
                return std::nullopt;
            return it->hex;
        }

        Result<glm::dvec3> parse_string(const std::string& spec) {
            const std::string name = to_lower(spec);
            if (const auto hex = lookup_name(name)) {
                return *parse_hex(*hex);
            }
            if (auto rgb = parse_hex(name)) {
                return *rgb;
            }
            LOG_WARN("Unrecognized color '{}'", spec);
            return make_error(ErrorCode::INVALID_COLOR,
                              fmt::format("'{}' is not a color name or a hex string", spec));
        }

        Result<glm::dvec3> parse_triple(const glm::dvec3& rgb) {
            for (int i = 0; i < 3; ++i) {
                if (!std::isfinite(rgb[i]) || rgb[i] < 0.0 || rgb[i] > 1.0) {
                    LOG_WARN("RGB component {} out of range: {}", i, rgb[i]);
                    return make_error(ErrorCode::INVALID_COLOR,
                                      fmt::format("RGB components must lie in [0, 1], got ({}, {}, {})",
                                                  rgb.r, rgb.g, rgb.b));
                }
            }
            return rgb;
        }
    } // namespace

    Result<glm::dvec3> parse_color(const ColorSpec& spec) {
        if (const auto* name = std::get_if<std::string>(&spec)) {
            return parse_string(*name);
        }
        return parse_triple(std::get<glm::dvec3>(spec));
    }

    Result<FontFamily> parse_font_family(const std::string_view name) {
        const std::string lowered = to_lower(name);
        if (lowered == "arial")
            return FontFamily::Arial;
        if (lowered == "courier")
            return FontFamily::Courier;
        if (lowered == "times")
            return FontFamily::Times;
        return make_error(ErrorCode::INVALID_FONT_FAMILY,
                          fmt::format("Font family '{}' is not one of arial, courier or times", name));
    }

    std::string_view font_family_name(const FontFamily family) {
        switch (family) {
        case FontFamily::Arial: return "arial";
        case FontFamily::Courier: return "courier";
        case FontFamily::Times: return "times";
        }
        return "arial";
    }

    std::string color_to_hex(const glm::dvec3& rgb) {
        const auto channel = [](const double v) {
            return static_cast<int>(std::lround(std::clamp(v, 0.0, 1.0) * 255.0));
        };
        return fmt::format("#{:02x}{:02x}{:02x}", channel(rgb.r), channel(rgb.g), channel(rgb.b));
    }

} // namespace vista::core
