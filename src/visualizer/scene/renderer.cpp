/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scene/renderer.hpp"
#include "core/logger.hpp"
#include "rendering/headless_backend.hpp"
#include "scene/scalar_bar_registry.hpp"

#include <array>
#include <atomic>

namespace vista::vis {

    namespace {
        std::atomic<rendering::RendererId> next_renderer_id{1};

        std::shared_ptr<rendering::GraphicsBackend> backend_or_headless(std::shared_ptr<rendering::GraphicsBackend> backend) {
            if (backend)
                return backend;
            return std::make_shared<rendering::HeadlessBackend>();
        }
    } // namespace

    Renderer::Batch::Batch(Renderer& renderer) : renderer_(renderer) {
        ++renderer_.batch_depth_;
    }

    Renderer::Batch::~Batch() {
        if (--renderer_.batch_depth_ == 0 && renderer_.render_pending_) {
            renderer_.render_pending_ = false;
            renderer_.requestRender();
        }
    }

    Renderer::Renderer(std::shared_ptr<rendering::GraphicsBackend> backend,
                       std::weak_ptr<RendererHost> host,
                       core::param::RendererParameters params)
        : id_(next_renderer_id.fetch_add(1, std::memory_order_relaxed)),
          params_(std::move(params)),
          backend_(backend_or_headless(std::move(backend))),
          host_(std::move(host)),
          aggregator_(registry_),
          camera_(*backend_, scale_, params_.camera),
          decorations_(*this) {
        backend_->activeCamera().setViewAngle(params_.camera.view_angle);
        if (params_.border)
            attachBorder();
        LOG_DEBUG("Renderer {} created", id_);
    }

    Renderer::~Renderer() {
        deepClean();
    }

    void Renderer::attachBorder() {
        auto color = core::parse_color(core::ColorSpec{params_.border_color});
        if (!color) {
            LOG_WARN("Border color: {}, using white", color.error().format());
        }
        backend_->addProp(std::make_shared<rendering::Border2D>(color.value_or(glm::dvec3(1.0)),
                                                                params_.border_width));
    }

    core::Result<ActorHandle> Renderer::addActor(std::shared_ptr<rendering::Prop> actor, const AddActorOptions& options) {
        if (!actor) {
            return core::make_error(core::ErrorCode::INVALID_ARGUMENT, "Cannot add a null actor");
        }
        if (options.name && options.name->empty()) {
            return core::make_error(core::ErrorCode::INVALID_ARGUMENT, "Actor name cannot be empty");
        }
        auto culling = parse_culling(options.culling);
        if (!culling) {
            return std::unexpected(culling.error());
        }

        Batch batch(*this);

        const bool replaced = options.name && removeActor(*options.name, ResetPolicy::NeverReset);

        backend_->addProp(actor);
        actor->setRenderer(id_);
        const std::string name = options.name ? *options.name : registry_.uniqueName(*actor);
        registry_.insert(name, actor);

        if (*culling != rendering::Culling::None)
            actor->property().culling = *culling;
        actor->setPickable(options.pickable);

        LOG_DEBUG("Added '{}'{} (camera {})", name, replaced ? " replacing previous entry" : "",
                  reset_policy_name(options.reset_camera));

        afterMutation(options.reset_camera, replaced);
        backend_->resetCameraClippingRange();
        return ActorHandle{std::move(actor), name};
    }

    core::Result<ActorHandle> Renderer::addActor(std::shared_ptr<rendering::Mapper> mapper, const AddActorOptions& options) {
        if (!mapper) {
            return core::make_error(core::ErrorCode::INVALID_ARGUMENT, "Cannot add a null mapper");
        }
        return addActor(std::static_pointer_cast<rendering::Prop>(std::make_shared<rendering::Actor>(std::move(mapper))),
                        options);
    }

    bool Renderer::removeActor(const RemoveTarget& target, const ResetPolicy reset_camera) {
        switch (target.kind()) {
        case RemoveTarget::Kind::None:
            return false;

        case RemoveTarget::Kind::Collection: {
            Batch batch(*this);
            bool success = false;
            for (const auto& item : target.items()) {
                if (removeActor(item, reset_camera))
                    success = true;
            }
            return success;
        }

        case RemoveTarget::Kind::Name: {
            const std::string& name = target.name();
            if (const auto members = registry_.groupMembers(name); !members.empty()) {
                std::vector<RemoveTarget> group(members.begin(), members.end());
                removeActor(RemoveTarget(std::move(group)), reset_camera);
            }
            auto prop = registry_.find(name);
            if (!prop) {
                LOG_DEBUG("No actor named '{}' to remove", name);
                return false;
            }
            return removeRegistered(std::move(prop), name, reset_camera);
        }

        case RemoveTarget::Kind::Prop: {
            const auto& prop = target.prop();
            if (!prop)
                return false;
            auto name = registry_.nameOf(*prop);
            if (!name && !backend_->hasProp(*prop)) {
                LOG_DEBUG("Prop {:#x} is not part of renderer {}", prop->id(), id_);
                return false;
            }
            return removeRegistered(prop, name, reset_camera);
        }
        }
        return false;
    }

    bool Renderer::removeRegistered(std::shared_ptr<rendering::Prop> prop,
                                    const std::optional<std::string>& name,
                                    const ResetPolicy reset_camera) {
        // Colorbars tracking only this prop's mapper go first
        if (const auto host = host_.lock()) {
            if (auto* bars = host->scalarBars()) {
                bars->dropMapperForActor(*prop, [this](const std::shared_ptr<rendering::ScalarBarActor>& bar) {
                    removeActor(bar, ResetPolicy::NeverReset);
                });
            }
        }

        backend_->removeProp(*prop);
        prop->setRenderer(std::nullopt);
        if (name)
            registry_.erase(*name);
        decorations_.onPropRemoved(*prop);

        LOG_DEBUG("Removed '{}' (camera {})", name.value_or("<unnamed>"), reset_policy_name(reset_camera));
        afterMutation(reset_camera, false);
        return true;
    }

    void Renderer::clear() {
        Batch batch(*this);
        // Decorations first, they must not be rebuilt while entries disappear
        decorations_.removeBoundingBox();
        decorations_.removeBoundsAxes();
        // Group removal may already have taken later names
        for (const auto& name : registry_.names())
            removeActor(name, ResetPolicy::NeverReset);
        backend_->removeAllProps();
    }

    void Renderer::afterMutation(const ResetPolicy reset_camera, const bool replaced) {
        decorations_.update();
        if (camera_.shouldFit(reset_camera, replaced))
            resetCamera();
        else
            requestRender();
    }

    void Renderer::requestRender() {
        if (batch_depth_ > 0) {
            render_pending_ = true;
            return;
        }
        if (const auto host = host_.lock()) {
            host->render();
        } else {
            LOG_DEBUG("Renderer {} has no host, skipping redraw", id_);
        }
    }

    core::BoundingVolume Renderer::bounds() const {
        const auto box = decorations_.boundingBox();
        return aggregator_.bounds(box.get());
    }

    glm::dvec3 Renderer::center() const {
        return bounds().center();
    }

    void Renderer::setScale(const ScaleRequest& request, const bool reset_camera) {
        scale_.apply(request);
        backend_->activeCamera().setModelTransform(scale_.matrix());
        requestRender();
        if (reset_camera) {
            decorations_.update();
            resetCamera();
        }
    }

    core::Result<glm::dvec3> Renderer::scalePoint(const glm::dvec3& point, const bool invert) const {
        return ScaleTransform::scalePoint(camera(), point, invert);
    }

    core::Result<CameraPosition> Renderer::cameraPosition() const {
        return camera_.position();
    }

    core::Result<void> Renderer::setCameraPosition(const CameraLocation& location) {
        if (std::holds_alternative<std::monostate>(location))
            return {};

        if (const auto* name = std::get_if<std::string>(&location)) {
            auto view = CameraController::parseView(*name);
            if (!view)
                return std::unexpected(view.error());
            return viewPlanar(*view, false);
        }
        if (const auto* named = std::get_if<NamedView>(&location))
            return viewPlanar(named->view, named->negative);
        if (const auto* vector = std::get_if<glm::dvec3>(&location))
            return viewVector(*vector);

        return camera_.apply(std::get<CameraPosition>(location));
    }

    CameraPosition Renderer::defaultCameraPosition(const bool negative) const {
        return camera_.defaultPosition(center(), negative);
    }

    core::Result<void> Renderer::viewIsometric(const bool negative) {
        if (auto applied = camera_.apply(defaultCameraPosition(negative)); !applied)
            return applied;
        camera_.markUnset();
        resetCamera();
        return {};
    }

    void Renderer::resetCamera() {
        LOG_TIMER_TRACE("Renderer::resetCamera");
        backend_->resetCamera();
        requestRender();
    }

    core::Result<void> Renderer::viewVector(const glm::dvec3& vector, const std::optional<glm::dvec3>& view_up) {
        if (auto applied = camera_.apply(camera_.viewVectorPosition(vector, center(), view_up)); !applied)
            return applied;
        resetCamera();
        return {};
    }

    core::Result<void> Renderer::viewPlanar(const PlanarView view, const bool negative) {
        const ViewPreset preset = CameraController::preset(view, negative);
        return viewVector(preset.vector, preset.view_up);
    }

    core::Result<void> Renderer::viewXY(const bool negative) { return viewPlanar(PlanarView::XY, negative); }
    core::Result<void> Renderer::viewYX(const bool negative) { return viewPlanar(PlanarView::YX, negative); }
    core::Result<void> Renderer::viewXZ(const bool negative) { return viewPlanar(PlanarView::XZ, negative); }
    core::Result<void> Renderer::viewZX(const bool negative) { return viewPlanar(PlanarView::ZX, negative); }
    core::Result<void> Renderer::viewYZ(const bool negative) { return viewPlanar(PlanarView::YZ, negative); }
    core::Result<void> Renderer::viewZY(const bool negative) { return viewPlanar(PlanarView::ZY, negative); }

    core::Result<void> Renderer::setFocus(const glm::dvec3& point) {
        return camera_.setFocus(point);
    }

    core::Result<void> Renderer::setPosition(const glm::dvec3& point, const bool reset) {
        if (auto moved = camera_.setPosition(point); !moved)
            return moved;
        if (reset)
            resetCamera();
        return {};
    }

    void Renderer::setViewUp(const glm::dvec3& vector) {
        camera_.setViewUp(vector);
    }

    core::Result<void> Renderer::setCamera(std::shared_ptr<rendering::Camera> camera) {
        if (!camera) {
            return core::make_error(core::ErrorCode::INVALID_ARGUMENT, "Cannot install a null camera");
        }
        // World pose as seen through the new camera's own model transform
        auto position = ScaleTransform::scalePoint(*camera, camera->position(), true);
        if (!position)
            return std::unexpected(position.error());
        auto focal_point = ScaleTransform::scalePoint(*camera, camera->focalPoint(), true);
        if (!focal_point)
            return std::unexpected(focal_point.error());

        const glm::dvec3 view_up = camera->viewUp();
        backend_->setActiveCamera(std::move(camera));
        return camera_.apply({*position, *focal_point, view_up});
    }

    void Renderer::enableParallelProjection() {
        camera().setParallelProjection(true);
    }

    void Renderer::disableParallelProjection() {
        camera().setParallelProjection(false);
    }

    core::Result<std::shared_ptr<rendering::CubeAxesActor>> Renderer::showBounds(const BoundsAxesOptions& options) {
        return decorations_.showBounds(options);
    }

    bool Renderer::removeBoundsAxes() {
        return decorations_.removeBoundsAxes();
    }

    core::Result<std::shared_ptr<rendering::BoundingBoxActor>> Renderer::addBoundingBox(const BoundingBoxOptions& options) {
        return decorations_.addBoundingBox(options);
    }

    bool Renderer::removeBoundingBox() {
        return decorations_.removeBoundingBox();
    }

    void Renderer::updateBoundsAxes() {
        decorations_.update();
    }

    core::Result<std::shared_ptr<rendering::AxesMarker>> Renderer::addAxesAtOrigin(const AxesMarkerOptions& options) {
        auto marker = std::make_shared<rendering::AxesMarker>();

        const std::array<const std::optional<core::ColorSpec>*, 3> colors{&options.x_color, &options.y_color, &options.z_color};
        for (size_t i = 0; i < colors.size(); ++i) {
            if (!*colors[i])
                continue;
            auto rgb = core::parse_color(**colors[i]);
            if (!rgb)
                return std::unexpected(rgb.error());
            marker->colors[i] = *rgb;
        }
        marker->labels = {options.xlabel, options.ylabel, options.zlabel};
        marker->line_width = options.line_width;
        marker->labels_off = options.labels_off;

        auto handle = addActor(std::static_pointer_cast<rendering::Prop>(marker),
                               AddActorOptions{.reset_camera = ResetPolicy::NeverReset});
        if (!handle)
            return std::unexpected(handle.error());
        return marker;
    }

    void Renderer::enable() {
        backend_->setInteractive(true);
    }

    void Renderer::disable() {
        backend_->setInteractive(false);
    }

    void Renderer::deepClean() noexcept {
        if (cleaned_)
            return;
        cleaned_ = true;

        decorations_.forget();
        backend_->removeAllProps();
        for (const auto& entry : registry_.entries()) {
            if (entry.prop)
                entry.prop->setRenderer(std::nullopt);
        }
        registry_.clear();
        // Host association goes last
        host_.reset();
        LOG_DEBUG("Renderer {} cleaned", id_);
    }

} // namespace vista::vis
