/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include <array>
#include <cstddef>
#include <glm/glm.hpp>

namespace vista::core {

    inline constexpr double DEFAULT_RELATIVE_TOLERANCE = 1e-5;
    inline constexpr double DEFAULT_ABSOLUTE_TOLERANCE = 1e-8;

    /// Element-wise closeness test, |a - b| <= atol + rtol * |b|
    [[nodiscard]] VISTA_CORE_API bool is_close(double a, double b,
                                               double rtol = DEFAULT_RELATIVE_TOLERANCE,
                                               double atol = DEFAULT_ABSOLUTE_TOLERANCE);

    [[nodiscard]] VISTA_CORE_API bool all_close(const glm::dvec3& a, const glm::dvec3& b,
                                                double rtol = DEFAULT_RELATIVE_TOLERANCE,
                                                double atol = DEFAULT_ABSOLUTE_TOLERANCE);

    /**
     * @brief Axis-aligned bounding volume stored as (xmin, xmax, ymin, ymax, zmin, zmax).
     *
     * A default constructed volume is the empty accumulator (+inf, -inf, ...) so that
     * folding boxes into it with expand() yields their exact union. finalize() turns
     * axes that never received a box into the degenerate [-1, 1] range.
     */
    struct VISTA_CORE_API BoundingVolume {
        std::array<double, 6> values;

        BoundingVolume();
        BoundingVolume(double xmin, double xmax, double ymin, double ymax, double zmin, double zmax);

        [[nodiscard]] static BoundingVolume empty();
        [[nodiscard]] static BoundingVolume unit();

        [[nodiscard]] double operator[](size_t i) const { return values[i]; }
        double& operator[](size_t i) { return values[i]; }

        [[nodiscard]] glm::dvec3 min() const { return {values[0], values[2], values[4]}; }
        [[nodiscard]] glm::dvec3 max() const { return {values[1], values[3], values[5]}; }
        [[nodiscard]] glm::dvec3 center() const;
        [[nodiscard]] glm::dvec3 extent() const;

        // True if at least one axis was never expanded
        [[nodiscard]] bool has_unset_axis() const;
        // True if every axis is finite and ordered
        [[nodiscard]] bool is_valid() const;
        [[nodiscard]] bool has_infinite_bound() const;

        // Per-axis union with another volume
        void expand(const BoundingVolume& other);

        // Replace remaining infinite sentinels with the [-1, 1] fallback
        void finalize();

        [[nodiscard]] std::array<glm::dvec3, 8> corners() const;

        // Bounds of the eight corners after an affine transform
        [[nodiscard]] BoundingVolume transformed(const glm::dmat4& matrix) const;

        // Grow each axis by fraction * extent on both sides
        [[nodiscard]] BoundingVolume padded(double fraction) const;

        [[nodiscard]] bool is_close(const BoundingVolume& other,
                                    double rtol = DEFAULT_RELATIVE_TOLERANCE,
                                    double atol = DEFAULT_ABSOLUTE_TOLERANCE) const;

        bool operator==(const BoundingVolume& other) const = default;
    };

} // namespace vista::core
