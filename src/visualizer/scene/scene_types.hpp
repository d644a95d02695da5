/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/color.hpp"
#include "core/error.hpp"
#include "core/export.hpp"
#include "rendering/prop.hpp"
#include <concepts>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vista::vis {

    /// What a mutation does to the camera afterwards
    enum class ResetPolicy : uint8_t {
        ForceReset,  // Always fit the camera to the scene
        NeverReset,  // Only request a redraw
        AutoIfUnset  // Fit while no explicit camera position has been chosen
    };

    // true selects back-face culling, false disables culling
    using CullingSpec = std::variant<bool, std::string>;

    /// Accepts front/frontface/f and back/backface/b, case-insensitive
    [[nodiscard]] VISTA_VIS_API core::Result<rendering::Culling> parse_culling(const CullingSpec& spec);

    struct AddActorOptions {
        std::optional<std::string> name;
        bool pickable = true;
        CullingSpec culling = false;
        ResetPolicy reset_camera = ResetPolicy::AutoIfUnset;
    };

    /// A registered prop together with the key it was stored under
    struct ActorHandle {
        std::shared_ptr<rendering::Prop> actor;
        std::string name;

        [[nodiscard]] rendering::Property& property() const { return actor->property(); }
    };

    /**
     * @brief Argument of Renderer::removeActor.
     *
     * Either nothing, a registered name, a prop handle, or an ordered
     * collection of further targets that are removed one by one.
     */
    class VISTA_VIS_API RemoveTarget {
    public:
        enum class Kind : uint8_t {
            None,
            Name,
            Prop,
            Collection
        };

        RemoveTarget() = default;
        RemoveTarget(std::nullptr_t) {}
        RemoveTarget(std::string name) : value_(std::move(name)) {}
        RemoveTarget(const char* name) : value_(std::string(name)) {}
        RemoveTarget(std::shared_ptr<rendering::Prop> prop) : value_(std::move(prop)) {}

        template <std::derived_from<rendering::Prop> T>
        RemoveTarget(std::shared_ptr<T> prop) : value_(std::shared_ptr<rendering::Prop>(std::move(prop))) {}

        explicit RemoveTarget(std::vector<RemoveTarget> items) : value_(std::move(items)) {}

        [[nodiscard]] Kind kind() const { return static_cast<Kind>(value_.index()); }

        [[nodiscard]] const std::string& name() const { return std::get<std::string>(value_); }
        [[nodiscard]] const std::shared_ptr<rendering::Prop>& prop() const {
            return std::get<std::shared_ptr<rendering::Prop>>(value_);
        }
        [[nodiscard]] const std::vector<RemoveTarget>& items() const {
            return std::get<std::vector<RemoveTarget>>(value_);
        }

    private:
        // Alternative order matches Kind
        std::variant<std::monostate, std::string, std::shared_ptr<rendering::Prop>, std::vector<RemoveTarget>> value_;
    };

    using GridSpec = std::variant<bool, std::string>;

    /// Options of Renderer::showBounds
    struct BoundsAxesOptions {
        std::optional<core::BoundingVolume> bounds; // Defaults to the scene bounds
        bool show_xaxis = true;
        bool show_yaxis = true;
        bool show_zaxis = true;
        bool show_xlabels = true;
        bool show_ylabels = true;
        bool show_zlabels = true;
        bool italic = false;
        bool bold = true;
        bool shadow = false;
        std::optional<int> font_size;
        std::optional<std::string> font_family;
        std::optional<core::ColorSpec> color;
        std::string xlabel = "X Axis";
        std::string ylabel = "Y Axis";
        std::string zlabel = "Z Axis";
        bool use_2d = false;
        GridSpec grid = false;
        std::string location = "closest";
        std::optional<std::string> ticks;
        bool all_edges = false;
        double corner_factor = 0.5;
        std::optional<std::string> fmt;
        bool minor_ticks = false;
        double padding = 0.0;
    };

    /// Options of Renderer::addBoundingBox
    struct BoundingBoxOptions {
        std::optional<core::ColorSpec> color = core::ColorSpec{std::string("grey")};
        double corner_factor = 0.5;
        std::optional<double> line_width;
        double opacity = 1.0;
        bool render_lines_as_tubes = false;
        std::optional<bool> lighting;
        ResetPolicy reset_camera = ResetPolicy::AutoIfUnset;
        bool outline = true;
        CullingSpec culling = std::string("front");
    };

    /// Options of Renderer::addAxesAtOrigin
    struct AxesMarkerOptions {
        std::optional<core::ColorSpec> x_color;
        std::optional<core::ColorSpec> y_color;
        std::optional<core::ColorSpec> z_color;
        std::string xlabel = "X";
        std::string ylabel = "Y";
        std::string zlabel = "Z";
        double line_width = 2.0;
        bool labels_off = false;
    };

    [[nodiscard]] constexpr std::string_view reset_policy_name(const ResetPolicy policy) {
        switch (policy) {
        case ResetPolicy::ForceReset: return "force";
        case ResetPolicy::NeverReset: return "never";
        case ResetPolicy::AutoIfUnset: return "auto";
        }
        return "unknown";
    }

} // namespace vista::vis
