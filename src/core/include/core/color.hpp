/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/export.hpp"
#include <glm/glm.hpp>
#include <string>
#include <string_view>
#include <variant>

namespace vista::core {

    /// A color given by name ("white", "w"), hex ("#ff8800", "ff8800") or RGB in [0, 1]
    using ColorSpec = std::variant<std::string, glm::dvec3>;

    enum class FontFamily {
        Arial,
        Courier,
        Times
    };

    /**
     * @brief Normalize a color value to an RGB triple in [0, 1].
     * @return INVALID_COLOR for unknown names, malformed hex strings or out of range components
     */
    [[nodiscard]] VISTA_CORE_API Result<glm::dvec3> parse_color(const ColorSpec& spec);

    // Case-insensitive lookup of arial, courier and times
    [[nodiscard]] VISTA_CORE_API Result<FontFamily> parse_font_family(std::string_view name);

    [[nodiscard]] VISTA_CORE_API std::string_view font_family_name(FontFamily family);

    // Lowercase "#rrggbb"
    [[nodiscard]] VISTA_CORE_API std::string color_to_hex(const glm::dvec3& rgb);

} // namespace vista::core
