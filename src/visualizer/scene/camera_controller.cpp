/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scene/camera_controller.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace vista::vis {

    namespace {
        struct PresetEntry {
            std::string_view name;
            PlanarView view;
            ViewPreset preset;
        };

        const std::array<PresetEntry, 6> PRESETS = {{
            {"xy", PlanarView::XY, {{0, 0, 1}, {0, 1, 0}}},
            {"yx", PlanarView::YX, {{0, 0, -1}, {1, 0, 0}}},
            {"xz", PlanarView::XZ, {{0, -1, 0}, {0, 0, 1}}},
            {"zx", PlanarView::ZX, {{0, 1, 0}, {1, 0, 0}}},
            {"yz", PlanarView::YZ, {{1, 0, 0}, {0, 0, 1}}},
            {"zy", PlanarView::ZY, {{-1, 0, 0}, {0, 1, 0}}},
        }};

        bool has_nan(const glm::dvec3& v) {
            return std::isnan(v.x) || std::isnan(v.y) || std::isnan(v.z);
        }
    } // namespace

    CameraController::CameraController(rendering::GraphicsBackend& backend,
                                       const ScaleTransform& scale,
                                       const core::param::CameraDefaults& defaults)
        : backend_(backend),
          scale_(scale),
          defaults_(defaults) {}

    bool CameraController::shouldFit(const ResetPolicy policy, const bool replaced) const {
        switch (policy) {
        case ResetPolicy::ForceReset: return true;
        case ResetPolicy::NeverReset: return false;
        case ResetPolicy::AutoIfUnset: return state_ == CameraState::Unset && !replaced;
        }
        return false;
    }

    core::Result<CameraPosition> CameraController::position() const {
        const auto& camera = backend_.activeCamera();
        auto position = ScaleTransform::scalePoint(camera, camera.position(), true);
        if (!position)
            return std::unexpected(position.error());
        auto focal_point = ScaleTransform::scalePoint(camera, camera.focalPoint(), true);
        if (!focal_point)
            return std::unexpected(focal_point.error());
        return CameraPosition{*position, *focal_point, camera.viewUp()};
    }

    core::Result<void> CameraController::apply(const CameraPosition& pose) {
        auto& camera = backend_.activeCamera();
        auto position = ScaleTransform::scalePoint(camera, pose.position, false);
        if (!position)
            return std::unexpected(position.error());
        auto focal_point = ScaleTransform::scalePoint(camera, pose.focal_point, false);
        if (!focal_point)
            return std::unexpected(focal_point.error());

        camera.setPosition(*position);
        camera.setFocalPoint(*focal_point);
        camera.setViewUp(pose.view_up);
        backend_.resetCameraClippingRange();
        state_ = CameraState::Set;

        LOG_DEBUG("Camera placed at ({}, {}, {}) looking at ({}, {}, {})",
                  pose.position.x, pose.position.y, pose.position.z,
                  pose.focal_point.x, pose.focal_point.y, pose.focal_point.z);
        return {};
    }

    CameraPosition CameraController::defaultPosition(const glm::dvec3& center, const bool negative) const {
        const glm::dvec3 focal_point = has_nan(center) ? glm::dvec3(0.0) : center;
        glm::dvec3 offset = defaults_.position;
        if (negative)
            offset = -offset;
        offset /= scale_.scale();
        return {offset + focal_point, focal_point, defaults_.viewup};
    }

    CameraPosition CameraController::viewVectorPosition(const glm::dvec3& vector,
                                                        const glm::dvec3& center,
                                                        const std::optional<glm::dvec3>& view_up) const {
        return {vector + center, center, view_up.value_or(defaults_.viewup)};
    }

    core::Result<void> CameraController::setFocus(const glm::dvec3& point) {
        auto& camera = backend_.activeCamera();
        auto scaled = ScaleTransform::scalePoint(camera, point, false);
        if (!scaled)
            return std::unexpected(scaled.error());
        camera.setFocalPoint(*scaled);
        return {};
    }

    core::Result<void> CameraController::setPosition(const glm::dvec3& point) {
        auto& camera = backend_.activeCamera();
        auto scaled = ScaleTransform::scalePoint(camera, point, false);
        if (!scaled)
            return std::unexpected(scaled.error());
        camera.setPosition(*scaled);
        state_ = CameraState::Set;
        return {};
    }

    void CameraController::setViewUp(const glm::dvec3& vector) {
        backend_.activeCamera().setViewUp(vector);
    }

    core::Result<PlanarView> CameraController::parseView(const std::string_view name) {
        std::string lowered(name);
        std::ranges::transform(lowered, lowered.begin(), [](const unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        const auto it = std::ranges::find(PRESETS, std::string_view(lowered), &PresetEntry::name);
        if (it == PRESETS.end()) {
            LOG_WARN("Unknown camera view '{}'", name);
            return core::make_error(core::ErrorCode::INVALID_CAMERA_VIEW,
                                    fmt::format("Camera view '{}' is not one of xy, yx, xz, zx, yz, zy", name));
        }
        return it->view;
    }

    ViewPreset CameraController::preset(const PlanarView view, const bool negative) {
        const auto it = std::ranges::find(PRESETS, view, &PresetEntry::view);
        ViewPreset result = it->preset;
        if (negative)
            result.vector = -result.vector;
        return result;
    }

} // namespace vista::vis
