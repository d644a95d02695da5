/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "rendering/camera.hpp"
#include "rendering/prop.hpp"
#include <glm/glm.hpp>
#include <memory>
#include <vector>

namespace vista::rendering {

    /**
     * @brief Low-level viewport of the graphics subsystem.
     *
     * Holds the props that are drawn and the active camera. The scene layer
     * composes one of these rather than deriving from it, so tests can swap in
     * a recording implementation.
     */
    class GraphicsBackend {
    public:
        virtual ~GraphicsBackend() = default;

        virtual void addProp(std::shared_ptr<Prop> prop) = 0;
        // Returns false if the prop was not attached
        virtual bool removeProp(const Prop& prop) = 0;
        virtual void removeAllProps() = 0;

        [[nodiscard]] virtual bool hasProp(const Prop& prop) const = 0;
        [[nodiscard]] virtual size_t propCount() const = 0;
        [[nodiscard]] virtual std::vector<std::shared_ptr<Prop>> props() const = 0;

        [[nodiscard]] virtual Camera& activeCamera() = 0;
        [[nodiscard]] virtual const Camera& activeCamera() const = 0;
        [[nodiscard]] virtual std::shared_ptr<Camera> activeCameraPtr() const = 0;
        virtual void setActiveCamera(std::shared_ptr<Camera> camera) = 0;

        // Slide the camera along its view direction until every visible prop is framed
        virtual void resetCamera() = 0;
        virtual void resetCameraClippingRange() = 0;

        // (x0, y0, x1, y1) of the last pick
        [[nodiscard]] virtual glm::ivec4 pickRect() const = 0;

        [[nodiscard]] virtual bool interactive() const = 0;
        virtual void setInteractive(bool enabled) = 0;
    };

} // namespace vista::rendering
