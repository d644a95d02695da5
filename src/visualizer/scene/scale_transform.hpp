/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/bounds.hpp"
#include "core/error.hpp"
#include "core/export.hpp"
#include "rendering/camera.hpp"
#include <glm/glm.hpp>
#include <optional>

namespace vista::vis {

    /// Per-axis request, absent axes keep their current factor
    struct ScaleRequest {
        std::optional<double> x;
        std::optional<double> y;
        std::optional<double> z;
    };

    /**
     * @brief Anisotropic axis scale realized as the camera model transform.
     *
     * Factors are always strictly positive: zero, negative and non-finite
     * requests are replaced with 1 so the view never collapses.
     */
    class VISTA_VIS_API ScaleTransform {
    public:
        ScaleTransform() = default;

        [[nodiscard]] const glm::dvec3& scale() const { return scale_; }

        // Merges the request into the current factors and returns the result
        glm::dvec3 apply(const ScaleRequest& request);
        void reset() { scale_ = glm::dvec3(1.0); }

        [[nodiscard]] glm::dmat4 matrix() const;
        [[nodiscard]] bool isIdentity(double rtol = core::DEFAULT_RELATIVE_TOLERANCE) const;

        /**
         * @brief Map a direction through the camera model transform (w = 0).
         * @param invert Use the inverse transform, i.e. model space to world space
         * @return DEGENERATE_TRANSFORM if the matrix cannot be inverted or the result is not finite
         */
        [[nodiscard]] static core::Result<glm::dvec3> scalePoint(const rendering::Camera& camera,
                                                                 const glm::dvec3& point,
                                                                 bool invert);

    private:
        glm::dvec3 scale_{1.0, 1.0, 1.0};
    };

} // namespace vista::vis
