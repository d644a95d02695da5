/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/camera.hpp"

namespace vista::rendering {

    glm::dvec3 Camera::viewPlaneNormal() const {
        const glm::dvec3 direction = position_ - focal_point_;
        const double length = glm::length(direction);
        if (length <= 0.0)
            return {0.0, 0.0, 1.0};
        return direction / length;
    }

    double Camera::distance() const {
        return glm::length(position_ - focal_point_);
    }

} // namespace vista::rendering
