/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scene/decoration_synchronizer.hpp"
#include "core/logger.hpp"
#include "scene/renderer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace vista::vis {

    namespace {
        std::string lowered(std::string value) {
            std::ranges::transform(value, value.begin(), [](const unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return value;
        }

        core::Result<rendering::GridLocation> parse_grid(const GridSpec& spec) {
            if (const auto* enabled = std::get_if<bool>(&spec)) {
                return *enabled ? rendering::GridLocation::Back : rendering::GridLocation::None;
            }
            const std::string value = lowered(std::get<std::string>(spec));
            if (value.empty() || value == "none")
                return rendering::GridLocation::None;
            if (value == "back" || value == "backface" || value == "furthest")
                return rendering::GridLocation::Back;
            if (value == "front" || value == "frontface" || value == "closest")
                return rendering::GridLocation::Front;
            if (value == "all" || value == "both")
                return rendering::GridLocation::All;
            LOG_WARN("Grid option '{}' not understood", value);
            return core::make_error(core::ErrorCode::INVALID_GRID_LOCATION,
                                    fmt::format("Value of grid ({}) not understood", value));
        }

        core::Result<rendering::AxesLocation> parse_location(const std::string& spec) {
            const std::string value = lowered(spec);
            if (value == "all")
                return rendering::AxesLocation::All;
            if (value == "origin")
                return rendering::AxesLocation::Origin;
            if (value == "outer")
                return rendering::AxesLocation::Outer;
            if (value == "default" || value == "closest" || value == "front")
                return rendering::AxesLocation::Closest;
            if (value == "furthest" || value == "back")
                return rendering::AxesLocation::Furthest;
            LOG_WARN("Location option '{}' not understood", value);
            return core::make_error(core::ErrorCode::INVALID_AXES_LOCATION,
                                    fmt::format("Value of location ({}) not understood", spec));
        }

        core::Result<rendering::TickLocation> parse_ticks(const std::string& spec) {
            const std::string value = lowered(spec);
            if (value == "inside")
                return rendering::TickLocation::Inside;
            if (value == "outside")
                return rendering::TickLocation::Outside;
            if (value == "both")
                return rendering::TickLocation::Both;
            LOG_WARN("Ticks option '{}' not understood", value);
            return core::make_error(core::ErrorCode::INVALID_TICK_LOCATION,
                                    fmt::format("Value of ticks ({}) not understood", spec));
        }

        // Resets a flag on scope exit
        class ReentryGuard {
        public:
            explicit ReentryGuard(bool& flag) : flag_(flag) { flag_ = true; }
            ~ReentryGuard() { flag_ = false; }

            ReentryGuard(const ReentryGuard&) = delete;
            ReentryGuard& operator=(const ReentryGuard&) = delete;

        private:
            bool& flag_;
        };
    } // namespace

    DecorationSynchronizer::DecorationSynchronizer(Renderer& renderer) : renderer_(renderer) {}

    core::Result<std::shared_ptr<rendering::BoundingBoxActor>> DecorationSynchronizer::addBoundingBox(const BoundingBoxOptions& options) {
        const auto& params = renderer_.parameters();

        const core::ColorSpec color_spec = options.color.value_or(core::ColorSpec{params.outline_color});
        auto color = core::parse_color(color_spec);
        if (!color)
            return std::unexpected(color.error());

        // Validated here so a bad value keeps the previous box
        if (auto culling = parse_culling(options.culling); !culling)
            return std::unexpected(culling.error());

        if (!std::isfinite(options.opacity) || options.opacity < 0.0 || options.opacity > 1.0) {
            return core::make_error(core::ErrorCode::INVALID_ARGUMENT,
                                    fmt::format("Opacity must lie in [0, 1], got {}", options.opacity));
        }

        if (options.outline && !(options.corner_factor > 0.0 && options.corner_factor <= 0.5)) {
            return core::make_error(core::ErrorCode::INVALID_ARGUMENT,
                                    fmt::format("Corner factor must lie in (0, 0.5], got {}", options.corner_factor));
        }

        removeBoundingBox();

        const core::BoundingVolume bounds = renderer_.bounds();
        auto mapper = std::make_shared<rendering::Mapper>(bounds);
        auto actor = std::make_shared<rendering::BoundingBoxActor>(mapper, options.outline, options.corner_factor);
        const std::string name = fmt::format("BoundingBox({:#x})", mapper->id());

        auto handle = renderer_.addActor(std::static_pointer_cast<rendering::Prop>(actor),
                                         AddActorOptions{.name = name,
                                                         .pickable = false,
                                                         .culling = options.culling,
                                                         .reset_camera = options.reset_camera});
        if (!handle)
            return std::unexpected(handle.error());

        auto& prop = actor->property();
        prop.color = *color;
        prop.opacity = options.opacity;
        prop.render_lines_as_tubes = options.render_lines_as_tubes;
        prop.lighting = options.lighting.value_or(params.lighting);
        if (options.line_width)
            prop.line_width = *options.line_width;
        prop.representation = rendering::Representation::Surface;

        BoundingBoxOptions style = options;
        style.color = core::ColorSpec{*color};
        style.lighting = prop.lighting;
        style.reset_camera = ResetPolicy::NeverReset;
        box_ = BoundingBoxState{actor, bounds, std::move(style)};

        LOG_DEBUG("Added bounding box '{}' ({})", name, options.outline ? "outline" : "solid");
        return actor;
    }

    bool DecorationSynchronizer::removeBoundingBox() {
        if (!box_)
            return false;
        auto actor = std::move(box_->actor);
        box_.reset();
        renderer_.removeActor(actor, ResetPolicy::NeverReset);
        return true;
    }

    core::Result<std::shared_ptr<rendering::CubeAxesActor>> DecorationSynchronizer::showBounds(const BoundsAxesOptions& options) {
        const auto& params = renderer_.parameters();

        auto family = core::parse_font_family(options.font_family.value_or(params.font.family));
        if (!family)
            return std::unexpected(family.error());
        auto color = core::parse_color(options.color.value_or(core::ColorSpec{params.font.color}));
        if (!color)
            return std::unexpected(color.error());
        auto grid = parse_grid(options.grid);
        if (!grid)
            return std::unexpected(grid.error());
        auto location = parse_location(options.location);
        if (!location)
            return std::unexpected(location.error());
        std::optional<rendering::TickLocation> ticks;
        if (options.ticks) {
            auto parsed = parse_ticks(*options.ticks);
            if (!parsed)
                return std::unexpected(parsed.error());
            ticks = *parsed;
        }
        if (!(options.padding >= 0.0 && options.padding < 1.0)) {
            LOG_WARN("Padding {} outside [0, 1)", options.padding);
            return core::make_error(core::ErrorCode::INVALID_PADDING,
                                    fmt::format("padding ({}) not understood. Must be float between 0 and 1",
                                                options.padding));
        }

        if (options.all_edges && !(options.corner_factor > 0.0 && options.corner_factor <= 0.5)) {
            return core::make_error(core::ErrorCode::INVALID_ARGUMENT,
                                    fmt::format("Corner factor must lie in (0, 0.5], got {}", options.corner_factor));
        }

        removeBoundsAxes();

        auto actor = std::make_shared<rendering::CubeAxesActor>();
        actor->setUse2DMode(options.use_2d || !renderer_.scaleTransform().isIdentity(params.scale_tolerance));
        actor->grid = *grid;
        actor->fly_mode = *location;
        if (ticks)
            actor->tick_location = *ticks;
        actor->setBounds(options.bounds.value_or(renderer_.bounds()).padded(options.padding));

        const std::array<bool, 3> shown{options.show_xaxis, options.show_yaxis, options.show_zaxis};
        const std::array<bool, 3> labels{options.show_xlabels, options.show_ylabels, options.show_zlabels};
        const std::array<std::string, 3> titles{options.xlabel, options.ylabel, options.zlabel};
        for (size_t i = 0; i < 3; ++i) {
            auto& axis = actor->axes[i];
            axis.visible = shown[i];
            // A hidden axis also drops its title and labels
            axis.title = shown[i] ? titles[i] : std::string();
            axis.title_visible = shown[i];
            axis.labels_visible = shown[i] && labels[i];
            axis.minor_ticks = options.minor_ticks;
        }

        actor->text.color = *color;
        actor->text.family = *family;
        actor->text.size = options.font_size.value_or(params.font.size);
        actor->text.bold = options.bold;
        actor->text.italic = options.italic;
        actor->text.shadow = options.shadow;
        actor->property().color = *color;
        if (const auto& fmt_spec = options.fmt ? options.fmt : params.font.label_format)
            actor->label_format = *fmt_spec;

        auto handle = renderer_.addActor(std::static_pointer_cast<rendering::Prop>(actor),
                                         AddActorOptions{.pickable = false, .reset_camera = ResetPolicy::NeverReset});
        if (!handle)
            return std::unexpected(handle.error());
        axes_ = CubeAxesState{actor, options.padding};

        if (options.all_edges) {
            BoundingBoxOptions box;
            box.color = core::ColorSpec{*color};
            box.corner_factor = options.corner_factor;
            if (auto added = addBoundingBox(box); !added)
                return std::unexpected(added.error());
        }

        LOG_DEBUG("Showing bounds axes (grid {}, padding {})", static_cast<int>(actor->grid), options.padding);
        return actor;
    }

    bool DecorationSynchronizer::removeBoundsAxes() {
        if (!axes_)
            return false;
        auto actor = std::move(axes_->actor);
        axes_.reset();
        renderer_.removeActor(actor, ResetPolicy::NeverReset);
        return true;
    }

    void DecorationSynchronizer::update() {
        if (updating_)
            return;
        ReentryGuard guard(updating_);

        const double tolerance = renderer_.parameters().scale_tolerance;

        if (box_) {
            const core::BoundingVolume current = renderer_.bounds();
            if (!box_->bounds.is_close(current, tolerance)) {
                LOG_DEBUG("Bounding box drifted, rebuilding");
                BoundingBoxOptions style = box_->style;
                removeBoundingBox();
                if (auto rebuilt = addBoundingBox(style); !rebuilt)
                    LOG_ERROR("Failed to rebuild bounding box: {}", rebuilt.error().format());
            }
        }

        if (axes_) {
            axes_->actor->setBounds(renderer_.bounds().padded(axes_->padding));
            axes_->actor->setUse2DMode(!renderer_.scaleTransform().isIdentity(tolerance));
        }
    }

    void DecorationSynchronizer::onPropRemoved(const rendering::Prop& prop) {
        if (box_ && box_->actor.get() == &prop) {
            LOG_TRACE("Bounding box removed directly");
            box_.reset();
        }
        if (axes_ && axes_->actor.get() == &prop) {
            LOG_TRACE("Bounds axes removed directly");
            axes_.reset();
        }
    }

    void DecorationSynchronizer::forget() noexcept {
        box_.reset();
        axes_.reset();
    }

    std::shared_ptr<rendering::BoundingBoxActor> DecorationSynchronizer::boundingBox() const {
        return box_ ? box_->actor : nullptr;
    }

    std::optional<core::BoundingVolume> DecorationSynchronizer::boundingBoxBounds() const {
        if (!box_)
            return std::nullopt;
        return box_->bounds;
    }

    std::shared_ptr<rendering::CubeAxesActor> DecorationSynchronizer::cubeAxes() const {
        return axes_ ? axes_->actor : nullptr;
    }

} // namespace vista::vis
