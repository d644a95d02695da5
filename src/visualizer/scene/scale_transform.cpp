/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scene/scale_transform.hpp"
#include "core/logger.hpp"

#include <cmath>

namespace vista::vis {

    namespace {
        constexpr double SINGULAR_EPSILON = 1e-12;

        bool is_finite(const glm::dvec3& v) {
            return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
        }

        double sanitize(const char axis, const std::optional<double> requested, const double current) {
            if (!requested)
                return current;
            const double value = *requested;
            if (!std::isfinite(value) || value <= 0.0) {
                LOG_WARN("Scale {} = {} is not a positive finite factor, using 1", axis, value);
                return 1.0;
            }
            return value;
        }
    } // namespace

    glm::dvec3 ScaleTransform::apply(const ScaleRequest& request) {
        scale_ = {sanitize('x', request.x, scale_.x),
                  sanitize('y', request.y, scale_.y),
                  sanitize('z', request.z, scale_.z)};
        LOG_DEBUG("Scale set to ({}, {}, {})", scale_.x, scale_.y, scale_.z);
        return scale_;
    }

    glm::dmat4 ScaleTransform::matrix() const {
        glm::dmat4 m(1.0);
        m[0][0] = scale_.x;
        m[1][1] = scale_.y;
        m[2][2] = scale_.z;
        return m;
    }

    bool ScaleTransform::isIdentity(const double rtol) const {
        return core::all_close(scale_, glm::dvec3(1.0), rtol);
    }

    core::Result<glm::dvec3> ScaleTransform::scalePoint(const rendering::Camera& camera,
                                                        const glm::dvec3& point,
                                                        const bool invert) {
        glm::dmat4 m = camera.modelTransform();
        if (invert) {
            const double det = glm::determinant(m);
            if (!std::isfinite(det) || std::abs(det) < SINGULAR_EPSILON) {
                LOG_WARN("Cannot invert camera model transform, determinant {}", det);
                return core::make_error(core::ErrorCode::DEGENERATE_TRANSFORM,
                                        fmt::format("Model transform is singular (determinant {})", det));
            }
            m = glm::inverse(m);
        }

        const glm::dvec3 result = glm::dvec3(m * glm::dvec4(point, 0.0));
        if (!is_finite(result)) {
            return core::make_error(core::ErrorCode::DEGENERATE_TRANSFORM,
                                    fmt::format("Scaling ({}, {}, {}) produced a non-finite point",
                                                point.x, point.y, point.z));
        }
        return result;
    }

} // namespace vista::vis
