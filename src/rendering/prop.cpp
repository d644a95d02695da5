/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/prop.hpp"

#include <atomic>

namespace vista::rendering {

    namespace {
        std::atomic<uint64_t> next_prop_id{1};
        std::atomic<uint64_t> next_mapper_id{1};
        std::atomic<uint64_t> epoch{0};
    } // namespace

    uint64_t geometry_epoch() {
        return epoch.load(std::memory_order_relaxed);
    }

    void bump_geometry_epoch() {
        epoch.fetch_add(1, std::memory_order_relaxed);
    }

    Mapper::Mapper(std::optional<core::BoundingVolume> bounds)
        : id_(next_mapper_id.fetch_add(1, std::memory_order_relaxed)),
          bounds_(std::move(bounds)) {}

    void Mapper::setBounds(std::optional<core::BoundingVolume> bounds) {
        bounds_ = std::move(bounds);
        bump_geometry_epoch();
    }

    Prop::Prop() : id_(next_prop_id.fetch_add(1, std::memory_order_relaxed)) {}

    Actor::Actor(std::shared_ptr<Mapper> mapper) : mapper_(std::move(mapper)) {}

    std::optional<core::BoundingVolume> Actor::bounds() const {
        if (!mapper_)
            return std::nullopt;
        return mapper_->bounds();
    }

    void Actor::setMapper(std::shared_ptr<Mapper> mapper) {
        mapper_ = std::move(mapper);
        bump_geometry_epoch();
    }

    BoundingBoxActor::BoundingBoxActor(std::shared_ptr<Mapper> mapper, const bool outline, const double corner_factor)
        : Actor(std::move(mapper)),
          outline_(outline),
          corner_factor_(corner_factor) {
        setPickable(false);
    }

    void CubeAxesActor::setBounds(const core::BoundingVolume& bounds) {
        bounds_ = bounds;
        bump_geometry_epoch();
    }

    ScalarBarActor::ScalarBarActor(std::string title, const size_t slot)
        : title_(std::move(title)),
          slot_(slot) {
        setPickable(false);
    }

    Border2D::Border2D(const glm::dvec3& color, const double width) {
        property().color = color;
        property().line_width = width;
        setPickable(false);
    }

} // namespace vista::rendering
