/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scene/scalar_bar_registry.hpp"
#include "core/logger.hpp"

#include <algorithm>

namespace vista::vis {

    ScalarBarRegistry::ScalarBarRegistry(const size_t max_bars) {
        for (size_t slot = 0; slot < max_bars; ++slot)
            free_slots_.insert(slot);
    }

    ScalarBarRegistry::ScalarBarRegistry(const core::param::RendererParameters& params)
        : ScalarBarRegistry(static_cast<size_t>(std::max(params.max_n_color_bars, 0))) {}

    core::Result<std::shared_ptr<rendering::ScalarBarActor>> ScalarBarRegistry::track(
        const std::string& title,
        std::shared_ptr<rendering::Mapper> mapper) {
        if (!mapper) {
            return core::make_error(core::ErrorCode::INVALID_ARGUMENT,
                                    fmt::format("Colorbar '{}' needs a mapper", title));
        }

        if (auto it = bars_.find(title); it != bars_.end()) {
            Bar& bar = it->second;
            if (std::ranges::find(bar.mappers, mapper) == bar.mappers.end())
                bar.mappers.push_back(mapper);
            const glm::dvec2 r = mapper->scalarRange();
            bar.range = {std::min(bar.range.x, r.x), std::max(bar.range.y, r.y)};
            bar.actor->range = bar.range;
            return bar.actor;
        }

        if (free_slots_.empty()) {
            LOG_WARN("No free colorbar slot for '{}'", title);
            return core::make_error(core::ErrorCode::NO_FREE_SLOT,
                                    fmt::format("All colorbar slots are in use, cannot add '{}'", title));
        }

        const size_t slot = *free_slots_.begin();
        free_slots_.erase(free_slots_.begin());

        auto actor = std::make_shared<rendering::ScalarBarActor>(title, slot);
        actor->range = mapper->scalarRange();
        bars_.emplace(title, Bar{slot, {mapper}, mapper->scalarRange(), actor});
        LOG_DEBUG("Colorbar '{}' took slot {}", title, slot);
        return actor;
    }

    bool ScalarBarRegistry::dropMapperForActor(const rendering::Prop& actor, const DetachCallback& detach) {
        const auto mapper = actor.mapper();
        if (!mapper)
            return false;

        std::vector<std::shared_ptr<rendering::ScalarBarActor>> emptied;
        for (auto it = bars_.begin(); it != bars_.end();) {
            auto& mappers = it->second.mappers;
            std::erase(mappers, mapper);
            if (!mappers.empty()) {
                ++it;
                continue;
            }
            LOG_DEBUG("Colorbar '{}' has no mappers left, freeing slot {}", it->first, it->second.slot);
            free_slots_.insert(it->second.slot);
            emptied.push_back(std::move(it->second.actor));
            it = bars_.erase(it);
        }

        // Detach after the bookkeeping so the callback sees a consistent registry
        if (detach) {
            for (const auto& bar : emptied)
                detach(bar);
        }
        return !emptied.empty();
    }

    size_t ScalarBarRegistry::mapperCount(const std::string& title) const {
        const auto it = bars_.find(title);
        return it == bars_.end() ? 0 : it->second.mappers.size();
    }

    std::optional<glm::dvec2> ScalarBarRegistry::range(const std::string& title) const {
        const auto it = bars_.find(title);
        if (it == bars_.end())
            return std::nullopt;
        return it->second.range;
    }

    std::optional<size_t> ScalarBarRegistry::slotOf(const std::string& title) const {
        const auto it = bars_.find(title);
        if (it == bars_.end())
            return std::nullopt;
        return it->second.slot;
    }

} // namespace vista::vis
