/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/bounds.hpp"
#include "core/export.hpp"
#include "rendering/graphics_backend.hpp"
#include <optional>

namespace vista::rendering {

    /// Backend without a surface. Keeps the prop list and fits the camera.
    class VISTA_RENDERING_API HeadlessBackend : public GraphicsBackend {
    public:
        HeadlessBackend();
        ~HeadlessBackend() override;

        void addProp(std::shared_ptr<Prop> prop) override;
        bool removeProp(const Prop& prop) override;
        void removeAllProps() override;

        [[nodiscard]] bool hasProp(const Prop& prop) const override;
        [[nodiscard]] size_t propCount() const override { return props_.size(); }
        [[nodiscard]] std::vector<std::shared_ptr<Prop>> props() const override { return props_; }

        [[nodiscard]] Camera& activeCamera() override { return *camera_; }
        [[nodiscard]] const Camera& activeCamera() const override { return *camera_; }
        [[nodiscard]] std::shared_ptr<Camera> activeCameraPtr() const override { return camera_; }
        void setActiveCamera(std::shared_ptr<Camera> camera) override;

        void resetCamera() override;
        void resetCameraClippingRange() override;

        [[nodiscard]] glm::ivec4 pickRect() const override { return pick_rect_; }
        void setPickRect(const glm::ivec4& rect) { pick_rect_ = rect; }

        [[nodiscard]] bool interactive() const override { return interactive_; }
        void setInteractive(bool enabled) override { interactive_ = enabled; }

        // Union of visible prop bounds in model space, nullopt if nothing is visible
        [[nodiscard]] std::optional<core::BoundingVolume> visiblePropBounds() const;

    private:
        std::vector<std::shared_ptr<Prop>> props_;
        std::shared_ptr<Camera> camera_;
        glm::ivec4 pick_rect_{0, 0, 0, 0};
        bool interactive_ = true;
    };

} // namespace vista::rendering
