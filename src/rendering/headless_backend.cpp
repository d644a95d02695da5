/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/headless_backend.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

namespace vista::rendering {

    HeadlessBackend::HeadlessBackend() : camera_(std::make_shared<Camera>()) {}

    HeadlessBackend::~HeadlessBackend() = default;

    void HeadlessBackend::addProp(std::shared_ptr<Prop> prop) {
        if (!prop || hasProp(*prop))
            return;
        props_.push_back(std::move(prop));
    }

    bool HeadlessBackend::removeProp(const Prop& prop) {
        const auto it = std::ranges::find_if(props_, [&](const auto& p) { return p.get() == &prop; });
        if (it == props_.end())
            return false;
        props_.erase(it);
        return true;
    }

    void HeadlessBackend::removeAllProps() {
        LOG_TRACE("Detaching {} props", props_.size());
        props_.clear();
    }

    bool HeadlessBackend::hasProp(const Prop& prop) const {
        return std::ranges::any_of(props_, [&](const auto& p) { return p.get() == &prop; });
    }

    void HeadlessBackend::setActiveCamera(std::shared_ptr<Camera> camera) {
        if (!camera) {
            LOG_WARN("Ignoring null active camera");
            return;
        }
        camera_ = std::move(camera);
    }

    std::optional<core::BoundingVolume> HeadlessBackend::visiblePropBounds() const {
        core::BoundingVolume total;
        bool any = false;
        for (const auto& prop : props_) {
            if (!prop->visible())
                continue;
            const auto bounds = prop->bounds();
            if (!bounds || !bounds->is_valid())
                continue;
            total.expand(*bounds);
            any = true;
        }
        if (!any)
            return std::nullopt;
        return total.transformed(camera_->modelTransform());
    }

    void HeadlessBackend::resetCamera() {
        const auto bounds = visiblePropBounds();
        if (!bounds) {
            LOG_DEBUG("Cannot reset camera, no visible props");
            return;
        }

        Camera& camera = *camera_;
        const glm::dvec3 normal = camera.viewPlaneNormal();
        const glm::dvec3 center = bounds->center();
        const glm::dvec3 extent = bounds->extent();

        double radius = glm::length(extent) * 0.5;
        if (radius == 0.0)
            radius = 1.0;

        const double half_angle = camera.viewAngle() * std::numbers::pi / 360.0;
        const double distance = radius / std::sin(half_angle);

        // View-up parallel to the view direction leaves the frame undefined
        const glm::dvec3 up = camera.viewUp();
        if (std::abs(glm::dot(up, normal)) > 0.999) {
            LOG_DEBUG("Resetting view-up since view plane normal is parallel");
            camera.setViewUp({-up.z, up.x, up.y});
        }

        camera.setFocalPoint(center);
        camera.setPosition(center + distance * normal);
        camera.setParallelScale(radius);

        LOG_TRACE("Camera fit: center ({}, {}, {}), distance {}", center.x, center.y, center.z, distance);
        resetCameraClippingRange();
    }

    void HeadlessBackend::resetCameraClippingRange() {
        const auto bounds = visiblePropBounds();
        if (!bounds)
            return;

        Camera& camera = *camera_;
        const glm::dvec3 normal = camera.viewPlaneNormal();
        double near_plane = std::numeric_limits<double>::max();
        double far_plane = std::numeric_limits<double>::lowest();
        for (const auto& corner : bounds->corners()) {
            const double depth = glm::dot(camera.position() - corner, normal);
            near_plane = std::min(near_plane, depth);
            far_plane = std::max(far_plane, depth);
        }

        // Keep the near plane in front of the camera
        constexpr double NEAR_RATIO = 0.001;
        far_plane = std::max(far_plane, NEAR_RATIO);
        near_plane = std::max(near_plane, far_plane * NEAR_RATIO);
        camera.setClippingRange({near_plane, far_plane});
    }

} // namespace vista::rendering
