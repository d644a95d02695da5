/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/bounds.hpp"
#include "core/color.hpp"
#include "core/export.hpp"
#include <array>
#include <cstdint>
#include <glm/glm.hpp>
#include <memory>
#include <optional>
#include <string>

namespace vista::rendering {

    using PropId = uint64_t;
    using RendererId = uint64_t;

    enum class PropKind : uint8_t {
        Actor,
        CubeAxes,
        AxesMarker,
        ScalarBar,
        Border2D
    };

    enum class Culling : uint8_t {
        None,
        Front,
        Back
    };

    enum class Representation : uint8_t {
        Surface,
        Wireframe,
        Points
    };

    /// Monotonic counter bumped whenever any prop's own bounds change.
    /// Lets bounds caches detect geometry edits that bypass the registry.
    [[nodiscard]] VISTA_RENDERING_API uint64_t geometry_epoch();
    VISTA_RENDERING_API void bump_geometry_epoch();

    struct Property {
        glm::dvec3 color{1.0, 1.0, 1.0};
        double opacity = 1.0;
        double line_width = 1.0;
        Culling culling = Culling::None;
        bool lighting = true;
        bool render_lines_as_tubes = false;
        Representation representation = Representation::Surface;
    };

    /**
     * @brief Geometry source of an actor.
     *
     * Only the parts the scene layer consumes are modelled: the bounds of the
     * input data and the scalar range used for color mapping.
     */
    class VISTA_RENDERING_API Mapper {
    public:
        explicit Mapper(std::optional<core::BoundingVolume> bounds = std::nullopt);

        [[nodiscard]] uint64_t id() const { return id_; }

        [[nodiscard]] const std::optional<core::BoundingVolume>& bounds() const { return bounds_; }
        void setBounds(std::optional<core::BoundingVolume> bounds);

        [[nodiscard]] glm::dvec2 scalarRange() const { return scalar_range_; }
        void setScalarRange(const glm::dvec2& range) { scalar_range_ = range; }

    private:
        uint64_t id_;
        std::optional<core::BoundingVolume> bounds_;
        glm::dvec2 scalar_range_{0.0, 1.0};
    };

    /// Anything the graphics subsystem can hold in its prop list
    class VISTA_RENDERING_API Prop {
    public:
        virtual ~Prop() = default;

        Prop(const Prop&) = delete;
        Prop& operator=(const Prop&) = delete;

        [[nodiscard]] PropId id() const { return id_; }
        [[nodiscard]] virtual PropKind kind() const = 0;

        // World-space bounds, nullopt when the prop has no extent
        [[nodiscard]] virtual std::optional<core::BoundingVolume> bounds() const { return std::nullopt; }

        [[nodiscard]] virtual std::shared_ptr<Mapper> mapper() const { return nullptr; }

        [[nodiscard]] bool pickable() const { return pickable_; }
        void setPickable(bool pickable) { pickable_ = pickable; }

        [[nodiscard]] bool visible() const { return visible_; }
        void setVisible(bool visible) { visible_ = visible; }

        [[nodiscard]] Property& property() { return property_; }
        [[nodiscard]] const Property& property() const { return property_; }

        // Weak association with the renderer that registered this prop
        [[nodiscard]] std::optional<RendererId> renderer() const { return renderer_; }
        void setRenderer(std::optional<RendererId> renderer) { renderer_ = renderer; }

    protected:
        Prop();

    private:
        PropId id_;
        bool pickable_ = true;
        bool visible_ = true;
        Property property_;
        std::optional<RendererId> renderer_;
    };

    class VISTA_RENDERING_API Actor : public Prop {
    public:
        explicit Actor(std::shared_ptr<Mapper> mapper = nullptr);

        [[nodiscard]] PropKind kind() const override { return PropKind::Actor; }
        [[nodiscard]] std::optional<core::BoundingVolume> bounds() const override;
        [[nodiscard]] std::shared_ptr<Mapper> mapper() const override { return mapper_; }
        void setMapper(std::shared_ptr<Mapper> mapper);

    private:
        std::shared_ptr<Mapper> mapper_;
    };

    /// Scene bounds drawn as corner outlines or as a solid cube
    class VISTA_RENDERING_API BoundingBoxActor : public Actor {
    public:
        BoundingBoxActor(std::shared_ptr<Mapper> mapper, bool outline, double corner_factor);

        // False for a solid cube
        [[nodiscard]] bool outline() const { return outline_; }
        // Fraction of each edge drawn from the corners, only meaningful for outlines
        [[nodiscard]] double cornerFactor() const { return corner_factor_; }

    private:
        bool outline_;
        double corner_factor_;
    };

    // Fly modes of the cube axes
    enum class AxesLocation : uint8_t {
        All,
        Origin,
        Outer,
        Closest,
        Furthest
    };

    enum class TickLocation : uint8_t {
        Inside,
        Outside,
        Both
    };

    enum class GridLocation : uint8_t {
        None,
        Back,
        Front,
        All
    };

    struct AxisStyle {
        bool visible = true;
        bool labels_visible = true;
        bool title_visible = true;
        bool minor_ticks = false;
        std::string title;
    };

    struct TextStyle {
        glm::dvec3 color{1.0, 1.0, 1.0};
        core::FontFamily family = core::FontFamily::Arial;
        int size = 12;
        bool bold = true;
        bool italic = false;
        bool shadow = false;
    };

    /// Ruled axes drawn around a box, with ticks, labels and optional grid lines
    class VISTA_RENDERING_API CubeAxesActor : public Prop {
    public:
        CubeAxesActor() = default;

        [[nodiscard]] PropKind kind() const override { return PropKind::CubeAxes; }
        [[nodiscard]] std::optional<core::BoundingVolume> bounds() const override { return bounds_; }
        void setBounds(const core::BoundingVolume& bounds);

        [[nodiscard]] bool use2DMode() const { return use_2d_; }
        void setUse2DMode(bool enabled) { use_2d_ = enabled; }

        AxesLocation fly_mode = AxesLocation::Closest;
        TickLocation tick_location = TickLocation::Inside;
        GridLocation grid = GridLocation::None;
        std::array<AxisStyle, 3> axes{AxisStyle{.title = "X Axis"}, AxisStyle{.title = "Y Axis"}, AxisStyle{.title = "Z Axis"}};
        TextStyle text;
        std::string label_format = "%.1f";

    private:
        core::BoundingVolume bounds_ = core::BoundingVolume::unit();
        bool use_2d_ = false;
    };

    /// Orientation triad placed at the world origin
    class VISTA_RENDERING_API AxesMarker : public Prop {
    public:
        AxesMarker() = default;

        [[nodiscard]] PropKind kind() const override { return PropKind::AxesMarker; }

        std::array<glm::dvec3, 3> colors{glm::dvec3{1, 0, 0}, glm::dvec3{0, 1, 0}, glm::dvec3{0, 0, 1}};
        std::array<std::string, 3> labels{"X", "Y", "Z"};
        bool labels_off = false;
        double line_width = 2.0;
    };

    class VISTA_RENDERING_API ScalarBarActor : public Prop {
    public:
        ScalarBarActor(std::string title, size_t slot);

        [[nodiscard]] PropKind kind() const override { return PropKind::ScalarBar; }
        [[nodiscard]] const std::string& title() const { return title_; }
        [[nodiscard]] size_t slot() const { return slot_; }

        glm::dvec2 range{0.0, 1.0};

    private:
        std::string title_;
        size_t slot_;
    };

    /// Viewport frame, attached directly to the backend
    class VISTA_RENDERING_API Border2D : public Prop {
    public:
        Border2D(const glm::dvec3& color, double width);

        [[nodiscard]] PropKind kind() const override { return PropKind::Border2D; }
    };

} // namespace vista::rendering
