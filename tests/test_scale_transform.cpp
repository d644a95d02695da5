// SPDX-FileCopyrightText: 2025 Vista Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scene/scale_transform.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace vista::vis {

    using test::expect_vec;

    TEST(ScaleTransformTest, PartialRequestsKeepOtherAxes) {
        ScaleTransform scale;
        scale.apply({.x = 2.0});
        scale.apply({.z = 0.5});
        EXPECT_EQ(scale.scale(), glm::dvec3(2.0, 1.0, 0.5));
        EXPECT_FALSE(scale.isIdentity());

        scale.reset();
        EXPECT_TRUE(scale.isIdentity());
    }

    TEST(ScaleTransformTest, DegenerateFactorsBecomeOne) {
        ScaleTransform scale;
        scale.apply({.x = 3.0, .y = 3.0, .z = 3.0});
        scale.apply({.x = 0.0, .y = -2.0, .z = std::numeric_limits<double>::quiet_NaN()});
        EXPECT_EQ(scale.scale(), glm::dvec3(1.0));
    }

    TEST(ScaleTransformTest, MatrixIsDiagonal) {
        ScaleTransform scale;
        scale.apply({.x = 2.0, .y = 3.0, .z = 4.0});
        const glm::dmat4 m = scale.matrix();
        EXPECT_EQ(m[0][0], 2.0);
        EXPECT_EQ(m[1][1], 3.0);
        EXPECT_EQ(m[2][2], 4.0);
        EXPECT_EQ(m[3][3], 1.0);
        EXPECT_EQ(m[1][0], 0.0);
        EXPECT_EQ(m[3][0], 0.0);
    }

    TEST(ScaleTransformTest, IdentityUsesRelativeTolerance) {
        ScaleTransform scale;
        scale.apply({.x = 1.0 + 1e-7});
        EXPECT_TRUE(scale.isIdentity(1e-5));
        EXPECT_FALSE(scale.isIdentity(1e-9));
    }

    TEST(ScaleTransformTest, ScalePointRoundTrips) {
        ScaleTransform scale;
        scale.apply({.x = 2.0});
        rendering::Camera camera;
        camera.setModelTransform(scale.matrix());

        for (const glm::dvec3 p : {glm::dvec3(1.5, -3.0, 0.25), glm::dvec3(0.0), glm::dvec3(-1e6, 7.0, 1e-6)}) {
            const auto forward = ScaleTransform::scalePoint(camera, p, false);
            ASSERT_TRUE(forward.has_value());
            expect_vec(*forward, {2.0 * p.x, p.y, p.z});

            const auto back = ScaleTransform::scalePoint(camera, *forward, true);
            ASSERT_TRUE(back.has_value());
            expect_vec(*back, p, 1e-9 * (1.0 + glm::length(p)));
        }
    }

    TEST(ScaleTransformTest, SingularInverseIsAnError) {
        rendering::Camera camera;
        glm::dmat4 singular(1.0);
        singular[1][1] = 0.0;
        camera.setModelTransform(singular);

        const auto forward = ScaleTransform::scalePoint(camera, {1, 2, 3}, false);
        ASSERT_TRUE(forward.has_value());
        expect_vec(*forward, {1, 0, 3});

        const auto inverse = ScaleTransform::scalePoint(camera, {1, 2, 3}, true);
        ASSERT_FALSE(inverse.has_value());
        EXPECT_EQ(inverse.error().code, core::ErrorCode::DEGENERATE_TRANSFORM);
        EXPECT_TRUE(inverse.error().is_numeric_error());
    }

    TEST(ScaleTransformTest, NonFiniteResultIsAnError) {
        const rendering::Camera camera;
        const double inf = std::numeric_limits<double>::infinity();
        const auto result = ScaleTransform::scalePoint(camera, {inf, 0, 0}, false);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, core::ErrorCode::DEGENERATE_TRANSFORM);
    }

} // namespace vista::vis
