/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scene/scene_types.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cctype>

namespace vista::vis {

    core::Result<rendering::Culling> parse_culling(const CullingSpec& spec) {
        if (const auto* enabled = std::get_if<bool>(&spec)) {
            return *enabled ? rendering::Culling::Back : rendering::Culling::None;
        }

        std::string value = std::get<std::string>(spec);
        std::ranges::transform(value, value.begin(), [](const unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });

        if (value.empty() || value == "none")
            return rendering::Culling::None;
        if (value == "back" || value == "backface" || value == "b")
            return rendering::Culling::Back;
        if (value == "front" || value == "frontface" || value == "f")
            return rendering::Culling::Front;

        LOG_WARN("Culling option '{}' not understood", value);
        return core::make_error(core::ErrorCode::INVALID_CULLING,
                                fmt::format("Culling option ({}) not understood", std::get<std::string>(spec)));
    }

} // namespace vista::vis
