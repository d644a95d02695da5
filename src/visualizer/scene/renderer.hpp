/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/bounds.hpp"
#include "core/error.hpp"
#include "core/export.hpp"
#include "core/parameters.hpp"
#include "rendering/graphics_backend.hpp"
#include "scene/actor_registry.hpp"
#include "scene/bounds_aggregator.hpp"
#include "scene/camera_controller.hpp"
#include "scene/decoration_synchronizer.hpp"
#include "scene/renderer_host.hpp"
#include "scene/scale_transform.hpp"
#include "scene/scene_types.hpp"
#include <glm/glm.hpp>
#include <memory>
#include <optional>

namespace vista::vis {

    /**
     * @brief Scene management for one viewport.
     *
     * Composes a graphics backend with a named actor registry, the aggregate
     * bounds, the axis scale, the camera state and the decorations that
     * follow the scene. Every public mutation validates its arguments before
     * touching any state. Not thread-safe.
     */
    class VISTA_VIS_API Renderer {
    public:
        /**
         * @brief RAII guard that holds back redraw requests.
         *
         * Requests issued while any guard is alive are merged into one that is
         * sent when the outermost guard closes. Camera fits still happen
         * immediately.
         */
        class Batch {
        public:
            explicit Batch(Renderer& renderer);
            ~Batch();

            Batch(const Batch&) = delete;
            Batch& operator=(const Batch&) = delete;

        private:
            Renderer& renderer_;
        };

        // A null backend is replaced by a headless one
        Renderer(std::shared_ptr<rendering::GraphicsBackend> backend,
                 std::weak_ptr<RendererHost> host,
                 core::param::RendererParameters params = {});
        ~Renderer();

        Renderer(const Renderer&) = delete;
        Renderer& operator=(const Renderer&) = delete;

        // ---- registry ----

        /**
         * @brief Register a prop, replacing any entry of the same name.
         *
         * Culling is validated first, an invalid value leaves the scene
         * untouched. Under AutoIfUnset the camera is refitted only if no
         * explicit position was chosen and nothing was replaced.
         */
        core::Result<ActorHandle> addActor(std::shared_ptr<rendering::Prop> actor, const AddActorOptions& options = {});

        // Wraps the mapper in a new actor
        core::Result<ActorHandle> addActor(std::shared_ptr<rendering::Mapper> mapper, const AddActorOptions& options = {});

        /**
         * @brief Remove by name, prop or collection.
         *
         * Names also take their "<name>-<suffix>" group along. Absent targets
         * are not an error.
         * @return true if at least one prop was removed
         */
        bool removeActor(const RemoveTarget& target, ResetPolicy reset_camera = ResetPolicy::NeverReset);

        // Removes every registered prop without moving the camera, then detaches the rest
        void clear();

        [[nodiscard]] const ActorRegistry& actors() const { return registry_; }

        // ---- bounds and scale ----

        [[nodiscard]] core::BoundingVolume bounds() const;
        [[nodiscard]] glm::dvec3 center() const;

        void setScale(const ScaleRequest& request, bool reset_camera = true);
        [[nodiscard]] const glm::dvec3& scale() const { return scale_.scale(); }
        [[nodiscard]] const ScaleTransform& scaleTransform() const { return scale_; }
        [[nodiscard]] core::Result<glm::dvec3> scalePoint(const glm::dvec3& point, bool invert) const;

        // ---- camera ----

        [[nodiscard]] core::Result<CameraPosition> cameraPosition() const;
        core::Result<void> setCameraPosition(const CameraLocation& location);
        [[nodiscard]] CameraState cameraState() const { return camera_.state(); }
        [[nodiscard]] bool isCameraSet() const { return camera_.isSet(); }

        [[nodiscard]] CameraPosition defaultCameraPosition(bool negative = false) const;
        core::Result<void> viewIsometric(bool negative = false);
        void resetCamera();
        core::Result<void> viewVector(const glm::dvec3& vector, const std::optional<glm::dvec3>& view_up = std::nullopt);
        core::Result<void> viewXY(bool negative = false);
        core::Result<void> viewYX(bool negative = false);
        core::Result<void> viewXZ(bool negative = false);
        core::Result<void> viewZX(bool negative = false);
        core::Result<void> viewYZ(bool negative = false);
        core::Result<void> viewZY(bool negative = false);

        core::Result<void> setFocus(const glm::dvec3& point);
        core::Result<void> setPosition(const glm::dvec3& point, bool reset = false);
        void setViewUp(const glm::dvec3& vector);

        [[nodiscard]] rendering::Camera& camera() { return backend_->activeCamera(); }
        [[nodiscard]] const rendering::Camera& camera() const { return backend_->activeCamera(); }
        // Installs the camera and re-applies its own pose in world coordinates
        core::Result<void> setCamera(std::shared_ptr<rendering::Camera> camera);

        void enableParallelProjection();
        void disableParallelProjection();

        // ---- decorations ----

        core::Result<std::shared_ptr<rendering::CubeAxesActor>> showBounds(const BoundsAxesOptions& options = {});
        bool removeBoundsAxes();
        core::Result<std::shared_ptr<rendering::BoundingBoxActor>> addBoundingBox(const BoundingBoxOptions& options = {});
        bool removeBoundingBox();
        void updateBoundsAxes();

        [[nodiscard]] std::shared_ptr<rendering::BoundingBoxActor> boundingBoxActor() const { return decorations_.boundingBox(); }
        [[nodiscard]] std::optional<core::BoundingVolume> boundingBoxBounds() const { return decorations_.boundingBoxBounds(); }
        [[nodiscard]] std::shared_ptr<rendering::CubeAxesActor> cubeAxesActor() const { return decorations_.cubeAxes(); }

        core::Result<std::shared_ptr<rendering::AxesMarker>> addAxesAtOrigin(const AxesMarkerOptions& options = {});

        // ---- viewport ----

        void enable();
        void disable();
        [[nodiscard]] bool interactive() const { return backend_->interactive(); }
        [[nodiscard]] glm::ivec4 pickPosition() const { return backend_->pickRect(); }

        /**
         * @brief Release every prop and the host association.
         *
         * Tolerates missing decorations and may be called more than once.
         */
        void deepClean() noexcept;

        [[nodiscard]] rendering::RendererId id() const { return id_; }
        [[nodiscard]] rendering::GraphicsBackend& backend() { return *backend_; }
        [[nodiscard]] const rendering::GraphicsBackend& backend() const { return *backend_; }
        [[nodiscard]] std::shared_ptr<RendererHost> host() const { return host_.lock(); }
        [[nodiscard]] const core::param::RendererParameters& parameters() const { return params_; }

    private:
        core::Result<void> viewPlanar(PlanarView view, bool negative);
        bool removeRegistered(std::shared_ptr<rendering::Prop> prop,
                              const std::optional<std::string>& name,
                              ResetPolicy reset_camera);
        void afterMutation(ResetPolicy reset_camera, bool replaced);
        void requestRender();
        void attachBorder();

        rendering::RendererId id_;
        core::param::RendererParameters params_;
        std::shared_ptr<rendering::GraphicsBackend> backend_;
        std::weak_ptr<RendererHost> host_;

        ActorRegistry registry_;
        BoundsAggregator aggregator_;
        ScaleTransform scale_;
        CameraController camera_;
        DecorationSynchronizer decorations_;

        int batch_depth_ = 0;
        bool render_pending_ = false;
        bool cleaned_ = false;
    };

} // namespace vista::vis
