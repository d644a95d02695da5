/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/export.hpp"
#include "core/parameters.hpp"
#include "rendering/graphics_backend.hpp"
#include "scene/scale_transform.hpp"
#include "scene/scene_types.hpp"
#include <glm/glm.hpp>
#include <string>
#include <string_view>
#include <variant>

namespace vista::vis {

    enum class CameraState : uint8_t {
        Unset, // Scene changes keep refitting the view
        Set    // The caller chose a framing, scene changes only redraw
    };

    /// Camera pose in world coordinates
    struct CameraPosition {
        glm::dvec3 position;
        glm::dvec3 focal_point;
        glm::dvec3 view_up;
    };

    enum class PlanarView : uint8_t {
        XY,
        YX,
        XZ,
        ZX,
        YZ,
        ZY
    };

    struct NamedView {
        PlanarView view;
        bool negative = false;
    };

    struct ViewPreset {
        glm::dvec3 vector;
        glm::dvec3 view_up;
    };

    /// Argument of Renderer::setCameraPosition.
    /// monostate is a no-op, a string names a planar view, a vector is a view direction.
    using CameraLocation = std::variant<std::monostate, std::string, NamedView, glm::dvec3, CameraPosition>;

    /**
     * @brief Camera pose bookkeeping in world coordinates.
     *
     * The backend camera stores model-space coordinates. Reads and writes go
     * through ScaleTransform::scalePoint so callers never see the scale.
     */
    class VISTA_VIS_API CameraController {
    public:
        CameraController(rendering::GraphicsBackend& backend,
                         const ScaleTransform& scale,
                         const core::param::CameraDefaults& defaults);

        [[nodiscard]] CameraState state() const { return state_; }
        [[nodiscard]] bool isSet() const { return state_ == CameraState::Set; }
        void markSet() { state_ = CameraState::Set; }
        void markUnset() { state_ = CameraState::Unset; }

        // True if the mutation should be followed by a camera fit rather than a redraw
        [[nodiscard]] bool shouldFit(ResetPolicy policy, bool replaced = false) const;

        [[nodiscard]] core::Result<CameraPosition> position() const;

        // Stores an explicit pose, resets the clipping range and marks the camera set
        core::Result<void> apply(const CameraPosition& pose);

        // Isometric pose around the focal point, NaN centers fall back to the origin
        [[nodiscard]] CameraPosition defaultPosition(const glm::dvec3& center, bool negative) const;

        // Pose looking along -vector at the center, view-up defaults to the configured one
        [[nodiscard]] CameraPosition viewVectorPosition(const glm::dvec3& vector,
                                                        const glm::dvec3& center,
                                                        const std::optional<glm::dvec3>& view_up) const;

        core::Result<void> setFocus(const glm::dvec3& point);
        core::Result<void> setPosition(const glm::dvec3& point);
        void setViewUp(const glm::dvec3& vector);

        [[nodiscard]] static core::Result<PlanarView> parseView(std::string_view name);
        [[nodiscard]] static ViewPreset preset(PlanarView view, bool negative);

        [[nodiscard]] const core::param::CameraDefaults& defaults() const { return defaults_; }

    private:
        rendering::GraphicsBackend& backend_;
        const ScaleTransform& scale_;
        core::param::CameraDefaults defaults_;
        CameraState state_ = CameraState::Unset;
    };

} // namespace vista::vis
