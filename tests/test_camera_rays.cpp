/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/camera.hpp"
#include "core/rng.hpp"
#include "rendering/ray_batch.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <set>

using namespace nps;

namespace {

    void expect_vec_near(const glm::vec3& a, const glm::vec3& b, const float tol = 1e-5f) {
        EXPECT_NEAR(a.x, b.x, tol);
        EXPECT_NEAR(a.y, b.y, tol);
        EXPECT_NEAR(a.z, b.z, tol);
    }

} // namespace

// --- Camera ---

TEST(CameraTest, PrincipalPointMapsToOpticalAxis) {
    const auto camera = test::make_camera(8, 6);
    expect_vec_near(camera.pixel_to_local_ray({4.0f, 3.0f}), {0.0f, 0.0f, 1.0f});
}

TEST(CameraTest, WorldRayUsesTransposedOrientation) {
    // World-to-camera rotation of 90 degrees about y: camera +z looks down world +x
    const glm::mat3 orientation(glm::vec3(0, 0, 1), glm::vec3(0, 1, 0), glm::vec3(-1, 0, 0));
    const core::Camera camera(orientation, glm::vec3(0.0f), 10.0f, glm::vec2(2.0f), glm::ivec2(4, 4));

    expect_vec_near(orientation * glm::vec3(1.0f, 0.0f, 0.0f), {0.0f, 0.0f, 1.0f});
    expect_vec_near(camera.pixel_to_ray({2.0f, 2.0f}), {1.0f, 0.0f, 0.0f});
}

TEST(CameraTest, ScaleAdjustsIntrinsicsTogether) {
    const auto camera = test::make_camera(640, 480, glm::vec3(1.0f), 500.0f);
    const auto half = camera.scale(0.5f);

    EXPECT_EQ(half.image_width(), 320);
    EXPECT_EQ(half.image_height(), 240);
    EXPECT_FLOAT_EQ(half.focal_length(), 250.0f);
    EXPECT_FLOAT_EQ(half.principal_point().x, 160.0f);
    EXPECT_EQ(half.position(), camera.position());
}

TEST(CameraTest, ScaleRoundsHalfPixelsToEven) {
    const auto camera = test::make_camera(5, 7);
    const auto half = camera.scale(0.5f);

    // 2.5 -> 2 and 3.5 -> 4
    EXPECT_EQ(half.image_width(), 2);
    EXPECT_EQ(half.image_height(), 4);
}

TEST(CameraTest, UndistortionInvertsRadialDistortion) {
    const glm::vec3 k(0.1f, -0.05f, 0.01f);
    const glm::vec2 p(0.001f, -0.002f);
    const core::Camera camera(glm::mat3(1.0f), glm::vec3(0.0f), 100.0f, glm::vec2(50.0f), glm::ivec2(100, 100),
                              0.0f, 1.0f, k, p);

    // Distort a known normalized point, then ask the camera for its ray
    const float x = 0.2f;
    const float y = -0.15f;
    const float r = x * x + y * y;
    const float d = 1.0f + r * (k.x + r * (k.y + k.z * r));
    const float xd = d * x + 2.0f * p.x * x * y + p.y * (r + 2.0f * x * x);
    const float yd = d * y + 2.0f * p.y * x * y + p.x * (r + 2.0f * y * y);

    const glm::vec3 ray = camera.pixel_to_local_ray({xd * 100.0f + 50.0f, yd * 100.0f + 50.0f});
    expect_vec_near(ray, glm::normalize(glm::vec3(x, y, 1.0f)), 1e-4f);
}

// --- Ray batch ---

TEST(RayBatchTest, CoversEveryPixelInRowMajorOrder) {
    const auto camera = test::make_camera(4, 3);
    const auto batch = rendering::build_ray_batch(camera);

    ASSERT_TRUE(batch.has_value()) << batch.error().format();
    EXPECT_EQ(batch->height, 3);
    EXPECT_EQ(batch->width, 4);
    ASSERT_EQ(batch->size(), 12u);
    EXPECT_TRUE(batch->is_consistent());

    // Pixel (x=1, y=2) is entry 2*4+1
    expect_vec_near(batch->directions[9], camera.pixel_to_ray({1.5f, 2.5f}));
    for (const auto& o : batch->origins) {
        EXPECT_EQ(o, camera.position());
    }
}

TEST(RayBatchTest, ConditioningIsZeroAndDirectionsAreUnit) {
    const auto batch = rendering::build_ray_batch(test::make_camera(5, 5));
    ASSERT_TRUE(batch.has_value());

    EXPECT_TRUE(std::ranges::all_of(batch->appearance, [](uint32_t v) { return v == 0; }));
    EXPECT_TRUE(std::ranges::all_of(batch->warp, [](uint32_t v) { return v == 0; }));
    for (size_t i = 0; i < batch->size(); ++i) {
        EXPECT_NEAR(glm::length(batch->viewdirs[i]), 1.0f, 1e-5f);
        expect_vec_near(batch->viewdirs[i], batch->directions[i]);
    }
}

TEST(RayBatchTest, EmptyImageIsInvalidCamera) {
    const auto batch = rendering::build_ray_batch(test::make_camera(0, 4));
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error().code, core::ErrorCode::INVALID_CAMERA);
}

TEST(RayBatchTest, NonPositiveFocalIsInvalidCamera) {
    const auto batch = rendering::build_ray_batch(test::make_camera(4, 4, glm::vec3(0.0f), 0.0f));
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error().code, core::ErrorCode::INVALID_CAMERA);
}

TEST(RayBatchTest, MismatchedArraysFailValidation) {
    auto batch = rendering::build_ray_batch(test::make_camera(2, 2));
    ASSERT_TRUE(batch.has_value());
    batch->warp.pop_back();

    const auto valid = rendering::validate_ray_batch(*batch);
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, core::ErrorCode::INVALID_CAMERA);
}

TEST(RayBatchTest, PadRepeatsLastRay) {
    auto batch = rendering::build_ray_batch(test::make_camera(5, 1));
    ASSERT_TRUE(batch.has_value());
    const glm::vec3 last = batch->directions.back();

    EXPECT_EQ(batch->pad_to_multiple(4), 3u);
    EXPECT_EQ(batch->size(), 8u);
    EXPECT_TRUE(batch->is_consistent());
    EXPECT_EQ(batch->directions[7], last);
    EXPECT_EQ(batch->pad_to_multiple(4), 0u);
}

TEST(RayBatchTest, SliceIsAFlatRun) {
    const auto batch = rendering::build_ray_batch(test::make_camera(4, 4));
    ASSERT_TRUE(batch.has_value());

    const auto part = batch->slice(3, 9);
    EXPECT_EQ(part.height, 1);
    EXPECT_EQ(part.width, 6);
    EXPECT_TRUE(part.is_consistent());
    EXPECT_EQ(part.directions.front(), batch->directions[3]);
}

// --- Random keys ---

TEST(RngTest, SplitIsDeterministic) {
    const auto key = core::make_rng_key(42);
    EXPECT_EQ(core::split(key, 4), core::split(key, 4));
    EXPECT_EQ(core::make_rng_key(42), key);
    EXPECT_NE(core::make_rng_key(43), key);
}

TEST(RngTest, SplitKeysAreDistinct) {
    const auto keys = core::split(core::make_rng_key(0), 64);
    std::set<uint64_t> values;
    for (const auto& k : keys) {
        values.insert(k.value);
    }
    EXPECT_EQ(values.size(), 64u);
}

TEST(RngTest, FoldInSeparatesHosts) {
    const auto key = core::make_rng_key(0);
    EXPECT_NE(core::fold_in(key, 0), core::fold_in(key, 1));
    EXPECT_EQ(core::fold_in(key, 1), core::fold_in(key, 1));
}
