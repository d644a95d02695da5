/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/bounds.hpp"
#include "core/export.hpp"
#include "rendering/prop.hpp"
#include <cstdint>
#include <glm/glm.hpp>
#include <optional>

namespace vista::vis {

    class ActorRegistry;

    /**
     * @brief Union of the bounds of every registered drawable.
     *
     * Cube axes are never folded in, nor is the prop passed as `excluded`
     * (the live bounding-box decoration). Axes that receive no finite bounds
     * fall back to [-1, 1]. The result is cached against the registry
     * generation and the global geometry epoch, so repeated queries between
     * mutations do not walk the registry again.
     */
    class VISTA_VIS_API BoundsAggregator {
    public:
        explicit BoundsAggregator(const ActorRegistry& registry);

        [[nodiscard]] core::BoundingVolume bounds(const rendering::Prop* excluded = nullptr) const;
        [[nodiscard]] glm::dvec3 center(const rendering::Prop* excluded = nullptr) const;

    private:
        struct CacheKey {
            uint64_t generation;
            uint64_t epoch;
            const rendering::Prop* excluded;

            bool operator==(const CacheKey&) const = default;
        };

        struct Cached {
            CacheKey key;
            core::BoundingVolume value;
        };

        [[nodiscard]] core::BoundingVolume compute(const rendering::Prop* excluded) const;

        const ActorRegistry& registry_;
        mutable std::optional<Cached> cache_;
    };

} // namespace vista::vis
