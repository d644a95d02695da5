/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include <glm/glm.hpp>

namespace vista::rendering {

    /**
     * @brief Perspective or parallel camera of one viewport.
     *
     * Position, focal point and view-up live in model space, i.e. after the
     * model transform has been applied. Callers that think in world space go
     * through the scene layer's scale conversion.
     */
    class VISTA_RENDERING_API Camera {
    public:
        Camera() = default;

        [[nodiscard]] const glm::dvec3& position() const { return position_; }
        void setPosition(const glm::dvec3& position) { position_ = position; }

        [[nodiscard]] const glm::dvec3& focalPoint() const { return focal_point_; }
        void setFocalPoint(const glm::dvec3& focal_point) { focal_point_ = focal_point; }

        [[nodiscard]] const glm::dvec3& viewUp() const { return view_up_; }
        void setViewUp(const glm::dvec3& view_up) { view_up_ = view_up; }

        // Unit vector pointing from the focal point towards the camera
        [[nodiscard]] glm::dvec3 viewPlaneNormal() const;
        [[nodiscard]] double distance() const;

        [[nodiscard]] double viewAngle() const { return view_angle_; }
        void setViewAngle(double degrees) { view_angle_ = degrees; }

        [[nodiscard]] bool parallelProjection() const { return parallel_projection_; }
        void setParallelProjection(bool enabled) { parallel_projection_ = enabled; }

        [[nodiscard]] double parallelScale() const { return parallel_scale_; }
        void setParallelScale(double scale) { parallel_scale_ = scale; }

        [[nodiscard]] const glm::dmat4& modelTransform() const { return model_transform_; }
        void setModelTransform(const glm::dmat4& transform) { model_transform_ = transform; }

        [[nodiscard]] const glm::dvec2& clippingRange() const { return clipping_range_; }
        void setClippingRange(const glm::dvec2& range) { clipping_range_ = range; }

    private:
        glm::dvec3 position_{0.0, 0.0, 1.0};
        glm::dvec3 focal_point_{0.0, 0.0, 0.0};
        glm::dvec3 view_up_{0.0, 1.0, 0.0};
        double view_angle_ = 30.0;
        bool parallel_projection_ = false;
        double parallel_scale_ = 1.0;
        glm::dmat4 model_transform_{1.0};
        glm::dvec2 clipping_range_{0.01, 1000.01};
    };

} // namespace vista::rendering
