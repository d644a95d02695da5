/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/export.hpp"
#include "core/parameters.hpp"
#include "rendering/prop.hpp"
#include <functional>
#include <glm/glm.hpp>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace vista::vis {

    /**
     * @brief Colorbars shared by the renderers of one host.
     *
     * Each title owns a display slot, the mappers colored by it, the combined
     * scalar range and one colorbar prop. A title lives as long as at least
     * one mapper references it.
     */
    class VISTA_VIS_API ScalarBarRegistry {
    public:
        using DetachCallback = std::function<void(const std::shared_ptr<rendering::ScalarBarActor>&)>;

        explicit ScalarBarRegistry(size_t max_bars = 10);
        // One slot per configured colorbar
        explicit ScalarBarRegistry(const core::param::RendererParameters& params);

        /**
         * @brief Track a mapper under a title, creating the colorbar on first use.
         * @return The colorbar prop of the title, or NO_FREE_SLOT when every slot is taken
         */
        core::Result<std::shared_ptr<rendering::ScalarBarActor>> track(const std::string& title,
                                                                       std::shared_ptr<rendering::Mapper> mapper);

        /**
         * @brief Stop tracking the mapper of a removed actor.
         *
         * Titles left without mappers give their slot back and their colorbar
         * is handed to `detach` so the caller can take it off screen.
         * @return true if at least one colorbar became empty
         */
        bool dropMapperForActor(const rendering::Prop& actor, const DetachCallback& detach);

        [[nodiscard]] bool hasTitle(const std::string& title) const { return bars_.contains(title); }
        [[nodiscard]] size_t mapperCount(const std::string& title) const;
        [[nodiscard]] std::optional<glm::dvec2> range(const std::string& title) const;
        [[nodiscard]] std::optional<size_t> slotOf(const std::string& title) const;
        [[nodiscard]] size_t freeSlotCount() const { return free_slots_.size(); }
        [[nodiscard]] size_t size() const { return bars_.size(); }

    private:
        struct Bar {
            size_t slot;
            std::vector<std::shared_ptr<rendering::Mapper>> mappers;
            glm::dvec2 range;
            std::shared_ptr<rendering::ScalarBarActor> actor;
        };

        std::set<size_t> free_slots_;
        std::map<std::string, Bar> bars_;
    };

} // namespace vista::vis
