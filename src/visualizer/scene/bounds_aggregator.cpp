/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scene/bounds_aggregator.hpp"
#include "core/logger.hpp"
#include "scene/actor_registry.hpp"

namespace vista::vis {

    BoundsAggregator::BoundsAggregator(const ActorRegistry& registry) : registry_(registry) {}

    core::BoundingVolume BoundsAggregator::bounds(const rendering::Prop* excluded) const {
        const CacheKey key{registry_.generation(), rendering::geometry_epoch(), excluded};
        if (cache_ && cache_->key == key)
            return cache_->value;

        auto value = compute(excluded);
        cache_ = Cached{key, value};
        return value;
    }

    glm::dvec3 BoundsAggregator::center(const rendering::Prop* excluded) const {
        return bounds(excluded).center();
    }

    core::BoundingVolume BoundsAggregator::compute(const rendering::Prop* excluded) const {
        core::BoundingVolume total;
        for (const auto& entry : registry_.entries()) {
            const auto& prop = entry.prop;
            if (!prop || prop.get() == excluded || prop->kind() == rendering::PropKind::CubeAxes)
                continue;
            const auto bounds = prop->bounds();
            // Empty datasets report inverted bounds and contribute nothing
            if (!bounds || !bounds->is_valid())
                continue;
            total.expand(*bounds);
        }
        total.finalize();
        LOG_TRACE("Scene bounds [{}, {}, {}, {}, {}, {}] over {} entries",
                  total[0], total[1], total[2], total[3], total[4], total[5], registry_.size());
        return total;
    }

} // namespace vista::vis
