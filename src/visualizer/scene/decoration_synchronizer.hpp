/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/bounds.hpp"
#include "core/error.hpp"
#include "core/export.hpp"
#include "rendering/prop.hpp"
#include "scene/scene_types.hpp"
#include <memory>
#include <optional>

namespace vista::vis {

    class Renderer;

    /**
     * @brief Owns the bounding-box and cube-axes decorations of a renderer.
     *
     * At most one of each exists. Both are registered like ordinary actors but
     * are kept out of the scene bounds they are derived from. update() runs
     * after every bounds-affecting mutation: a drifted bounding box is rebuilt
     * with its previous style, the cube axes are resized in place and their 2D
     * mode follows the scale alone.
     */
    class VISTA_VIS_API DecorationSynchronizer {
    public:
        explicit DecorationSynchronizer(Renderer& renderer);

        core::Result<std::shared_ptr<rendering::BoundingBoxActor>> addBoundingBox(const BoundingBoxOptions& options);
        bool removeBoundingBox();

        core::Result<std::shared_ptr<rendering::CubeAxesActor>> showBounds(const BoundsAxesOptions& options);
        bool removeBoundsAxes();

        void update();

        // Clears the matching state when a decoration prop is removed by other means
        void onPropRemoved(const rendering::Prop& prop);

        // Drops both states without touching the registry
        void forget() noexcept;

        [[nodiscard]] std::shared_ptr<rendering::BoundingBoxActor> boundingBox() const;
        [[nodiscard]] std::optional<core::BoundingVolume> boundingBoxBounds() const;
        [[nodiscard]] std::shared_ptr<rendering::CubeAxesActor> cubeAxes() const;

    private:
        struct BoundingBoxState {
            std::shared_ptr<rendering::BoundingBoxActor> actor;
            core::BoundingVolume bounds;
            BoundingBoxOptions style; // Resolved, reused when the box is rebuilt
        };

        struct CubeAxesState {
            std::shared_ptr<rendering::CubeAxesActor> actor;
            double padding = 0.0;
        };

        Renderer& renderer_;
        std::optional<BoundingBoxState> box_;
        std::optional<CubeAxesState> axes_;
        bool updating_ = false;
    };

} // namespace vista::vis
