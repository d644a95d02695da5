// SPDX-FileCopyrightText: 2025 Vista Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scene/camera_controller.hpp"
#include "test_fixtures.hpp"
#include <cmath>
#include <gtest/gtest.h>

namespace vista::vis {

    using test::expect_vec;

    class CameraControllerTest : public ::testing::Test {
    protected:
        rendering::HeadlessBackend backend_;
        ScaleTransform scale_;
        core::param::CameraDefaults defaults_;
        CameraController controller_{backend_, scale_, defaults_};

        void applyScale(const ScaleRequest& request) {
            scale_.apply(request);
            backend_.activeCamera().setModelTransform(scale_.matrix());
        }
    };

    TEST_F(CameraControllerTest, StartsUnset) {
        EXPECT_EQ(controller_.state(), CameraState::Unset);
        EXPECT_FALSE(controller_.isSet());
    }

    TEST_F(CameraControllerTest, FitDecisionFollowsPolicy) {
        EXPECT_TRUE(controller_.shouldFit(ResetPolicy::ForceReset));
        EXPECT_FALSE(controller_.shouldFit(ResetPolicy::NeverReset));
        EXPECT_TRUE(controller_.shouldFit(ResetPolicy::AutoIfUnset));
        EXPECT_FALSE(controller_.shouldFit(ResetPolicy::AutoIfUnset, true));

        controller_.markSet();
        EXPECT_TRUE(controller_.shouldFit(ResetPolicy::ForceReset));
        EXPECT_FALSE(controller_.shouldFit(ResetPolicy::AutoIfUnset));
    }

    TEST_F(CameraControllerTest, ApplyStoresScaledPoseAndMarksSet) {
        applyScale({.x = 2.0});
        ASSERT_TRUE(controller_.apply({{1, 2, 3}, {0.5, 0, 0}, {0, 0, 1}}).has_value());

        EXPECT_TRUE(controller_.isSet());
        expect_vec(backend_.activeCamera().position(), {2, 2, 3});
        expect_vec(backend_.activeCamera().focalPoint(), {1, 0, 0});

        const auto pose = controller_.position();
        ASSERT_TRUE(pose.has_value());
        expect_vec(pose->position, {1, 2, 3});
        expect_vec(pose->focal_point, {0.5, 0, 0});
        expect_vec(pose->view_up, {0, 0, 1});
    }

    TEST_F(CameraControllerTest, DefaultPositionDividesOffsetByScale) {
        applyScale({.x = 2.0});
        const auto pose = controller_.defaultPosition({1, 1, 1}, false);
        expect_vec(pose.focal_point, {1, 1, 1});
        expect_vec(pose.position, {1.5, 2, 2});
        expect_vec(pose.view_up, {0, 0, 1});

        const auto negative = controller_.defaultPosition({1, 1, 1}, true);
        expect_vec(negative.position, {0.5, 0, 0});
    }

    TEST_F(CameraControllerTest, DefaultPositionFallsBackToOrigin) {
        const auto pose = controller_.defaultPosition({std::nan(""), 0.0, 4.0}, false);
        expect_vec(pose.focal_point, {0, 0, 0});
        expect_vec(pose.position, {1, 1, 1});
    }

    TEST_F(CameraControllerTest, ViewVectorPosition) {
        const auto pose = controller_.viewVectorPosition({0, -1, 0}, {1, 2, 3}, std::nullopt);
        expect_vec(pose.position, {1, 1, 3});
        expect_vec(pose.focal_point, {1, 2, 3});
        expect_vec(pose.view_up, defaults_.viewup);

        const auto custom = controller_.viewVectorPosition({1, 0, 0}, {0, 0, 0}, glm::dvec3(0, 1, 0));
        expect_vec(custom.view_up, {0, 1, 0});
    }

    TEST_F(CameraControllerTest, DirectSetters) {
        applyScale({.z = 4.0});
        ASSERT_TRUE(controller_.setFocus({0, 0, 1}).has_value());
        EXPECT_FALSE(controller_.isSet());
        expect_vec(backend_.activeCamera().focalPoint(), {0, 0, 4});

        ASSERT_TRUE(controller_.setPosition({0, 0, 2}).has_value());
        EXPECT_TRUE(controller_.isSet());
        expect_vec(backend_.activeCamera().position(), {0, 0, 8});

        controller_.setViewUp({1, 0, 0});
        expect_vec(backend_.activeCamera().viewUp(), {1, 0, 0});
    }

    TEST_F(CameraControllerTest, ParseViewIsCaseInsensitive) {
        EXPECT_EQ(CameraController::parseView("XY").value(), PlanarView::XY);
        EXPECT_EQ(CameraController::parseView("zy").value(), PlanarView::ZY);

        const auto bad = CameraController::parseView("diagonal");
        ASSERT_FALSE(bad.has_value());
        EXPECT_EQ(bad.error().code, core::ErrorCode::INVALID_CAMERA_VIEW);
    }

    TEST_F(CameraControllerTest, PresetTable) {
        const struct {
            PlanarView view;
            glm::dvec3 vector;
            glm::dvec3 view_up;
        } expected[] = {
            {PlanarView::XY, {0, 0, 1}, {0, 1, 0}},
            {PlanarView::YX, {0, 0, -1}, {1, 0, 0}},
            {PlanarView::XZ, {0, -1, 0}, {0, 0, 1}},
            {PlanarView::ZX, {0, 1, 0}, {1, 0, 0}},
            {PlanarView::YZ, {1, 0, 0}, {0, 0, 1}},
            {PlanarView::ZY, {-1, 0, 0}, {0, 1, 0}},
        };
        for (const auto& row : expected) {
            const auto preset = CameraController::preset(row.view, false);
            EXPECT_EQ(preset.vector, row.vector);
            EXPECT_EQ(preset.view_up, row.view_up);

            const auto negated = CameraController::preset(row.view, true);
            EXPECT_EQ(negated.vector, -row.vector);
            EXPECT_EQ(negated.view_up, row.view_up);
        }
    }

    TEST_F(CameraControllerTest, DegenerateModelTransformFailsWithoutMutation) {
        backend_.activeCamera().setModelTransform(glm::dmat4(0.0));
        EXPECT_FALSE(controller_.position().has_value());
        EXPECT_EQ(controller_.state(), CameraState::Unset);
    }

} // namespace vista::vis
