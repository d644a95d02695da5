/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/bounds.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace vista::core {

    namespace {
        constexpr double INF = std::numeric_limits<double>::infinity();
    } // namespace

    bool is_close(const double a, const double b, const double rtol, const double atol) {
        if (a == b)
            return true;
        if (std::isnan(a) || std::isnan(b) || std::isinf(a) || std::isinf(b))
            return false;
        return std::abs(a - b) <= atol + rtol * std::abs(b);
    }

    bool all_close(const glm::dvec3& a, const glm::dvec3& b, const double rtol, const double atol) {
        return core::is_close(a.x, b.x, rtol, atol) &&
               core::is_close(a.y, b.y, rtol, atol) &&
               core::is_close(a.z, b.z, rtol, atol);
    }

    BoundingVolume::BoundingVolume() : values{INF, -INF, INF, -INF, INF, -INF} {}

    BoundingVolume::BoundingVolume(const double xmin, const double xmax,
                                   const double ymin, const double ymax,
                                   const double zmin, const double zmax)
        : values{xmin, xmax, ymin, ymax, zmin, zmax} {}

    BoundingVolume BoundingVolume::empty() {
        return {};
    }

    BoundingVolume BoundingVolume::unit() {
        return {-1.0, 1.0, -1.0, 1.0, -1.0, 1.0};
    }

    glm::dvec3 BoundingVolume::center() const {
        return (min() + max()) * 0.5;
    }

    glm::dvec3 BoundingVolume::extent() const {
        return glm::abs(max() - min());
    }

    bool BoundingVolume::has_unset_axis() const {
        for (size_t axis = 0; axis < 3; ++axis) {
            if (values[axis * 2] == INF || values[axis * 2 + 1] == -INF)
                return true;
        }
        return false;
    }

    bool BoundingVolume::is_valid() const {
        for (size_t axis = 0; axis < 3; ++axis) {
            const double lo = values[axis * 2];
            const double hi = values[axis * 2 + 1];
            if (!std::isfinite(lo) || !std::isfinite(hi) || lo > hi)
                return false;
        }
        return true;
    }

    bool BoundingVolume::has_infinite_bound() const {
        return std::ranges::any_of(values, [](const double v) { return std::isinf(v); });
    }

    void BoundingVolume::expand(const BoundingVolume& other) {
        for (size_t axis = 0; axis < 3; ++axis) {
            if (other.values[axis * 2] < values[axis * 2])
                values[axis * 2] = other.values[axis * 2];
            if (other.values[axis * 2 + 1] > values[axis * 2 + 1])
                values[axis * 2 + 1] = other.values[axis * 2 + 1];
        }
    }

    void BoundingVolume::finalize() {
        for (auto& v : values) {
            if (v == INF)
                v = -1.0;
            else if (v == -INF)
                v = 1.0;
        }
    }

    std::array<glm::dvec3, 8> BoundingVolume::corners() const {
        const glm::dvec3 lo = min();
        const glm::dvec3 hi = max();
        return {{{lo.x, lo.y, lo.z},
                 {hi.x, lo.y, lo.z},
                 {lo.x, hi.y, lo.z},
                 {hi.x, hi.y, lo.z},
                 {lo.x, lo.y, hi.z},
                 {hi.x, lo.y, hi.z},
                 {lo.x, hi.y, hi.z},
                 {hi.x, hi.y, hi.z}}};
    }

    BoundingVolume BoundingVolume::transformed(const glm::dmat4& matrix) const {
        BoundingVolume result;
        for (const auto& corner : corners()) {
            const glm::dvec3 p = glm::dvec3(matrix * glm::dvec4(corner, 1.0));
            result.expand({p.x, p.x, p.y, p.y, p.z, p.z});
        }
        return result;
    }

    BoundingVolume BoundingVolume::padded(const double fraction) const {
        if (has_infinite_bound())
            return *this;
        BoundingVolume result = *this;
        const glm::dvec3 cushion = extent() * fraction;
        for (size_t axis = 0; axis < 3; ++axis) {
            result.values[axis * 2] -= cushion[static_cast<glm::length_t>(axis)];
            result.values[axis * 2 + 1] += cushion[static_cast<glm::length_t>(axis)];
        }
        return result;
    }

    bool BoundingVolume::is_close(const BoundingVolume& other, const double rtol, const double atol) const {
        for (size_t i = 0; i < values.size(); ++i) {
            if (!core::is_close(values[i], other.values[i], rtol, atol))
                return false;
        }
        return true;
    }

} // namespace vista::core
