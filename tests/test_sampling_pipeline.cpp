/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/point_cloud_container.hpp"
#include "rendering/ray_batch.hpp"
#include "sampling/point_cloud_accumulator.hpp"
#include "sampling/sampling_pipeline.hpp"
#include "test_helpers.hpp"
#include <format>
#include <gtest/gtest.h>
#include <mutex>
#include <utility>

using namespace nps;
using rendering::DistributedRenderExecutor;
using rendering::local_devices;

namespace {

    constexpr int WIDTH = 4;
    constexpr int HEIGHT = 3;

    /// Camera path kept in memory; camera i sits at x = i.
    class InMemoryCameraSource : public io::ICameraSource {
    public:
        explicit InMemoryCameraSource(const size_t count) {
            for (size_t i = 0; i < count; ++i) {
                paths_.push_back(std::format("camera-paths/orbit-mild/{:03d}.json", i));
                cameras_.push_back(test::make_camera(WIDTH, HEIGHT, glm::vec3(static_cast<float>(i), 0.0f, -3.0f)));
            }
        }

        core::Result<std::vector<std::filesystem::path>> glob_cameras(const std::filesystem::path& camera_dir) const override {
            globbed_dir = camera_dir;
            return paths_;
        }

        core::Result<core::Camera> load_camera(const std::filesystem::path& descriptor) const override {
            std::lock_guard lock(mutex_);
            for (size_t i = 0; i < paths_.size(); ++i) {
                if (paths_[i] == descriptor) {
                    loaded.push_back(i);
                    return cameras_[i];
                }
            }
            return core::make_error(core::ErrorCode::PATH_NOT_FOUND, "No such camera", descriptor);
        }

        float near() const override { return 0.5f; }
        float far() const override { return 6.0f; }

        const core::Camera& camera(const size_t i) const { return cameras_[i]; }

        mutable std::vector<size_t> loaded;
        mutable std::filesystem::path globbed_dir;

    private:
        std::vector<std::filesystem::path> paths_;
        std::vector<core::Camera> cameras_;
        mutable std::mutex mutex_;
    };

    class SamplingPipelineTest : public ::testing::Test {
    protected:
        SamplingPipelineTest() {
            params_.output_path = dir_.path() / "out";
            params_.point_cloud_filename = "cloud.npc";
            params_.save_frames = false;
            params_.experiment.random_seed = 3;
        }

        test::TempDir dir_{"sampling"};
        core::param::SamplingParameters params_;
    };

} // namespace

TEST(SelectFramesTest, StepsThroughTheCameraPath) {
    EXPECT_EQ(sampling::select_frames(5, 1), (std::vector<size_t>{0, 1, 2, 3, 4}));
    EXPECT_EQ(sampling::select_frames(5, 2), (std::vector<size_t>{0, 2, 4}));
    EXPECT_EQ(sampling::select_frames(3, 5), (std::vector<size_t>{0}));
    EXPECT_TRUE(sampling::select_frames(0, 1).empty());
    EXPECT_TRUE(sampling::select_frames(4, 0).empty());
}

TEST_F(SamplingPipelineTest, EveryCameraContributesOnePointPerPixel) {
    const InMemoryCameraSource cameras(3);
    auto model = std::make_shared<test::StubSceneModel>();
    const DistributedRenderExecutor executor(model, local_devices(2), 5);
    const auto state = test::make_replicated_state(2);

    sampling::SamplingPipeline pipeline(cameras, executor, state, params_);
    const auto result = pipeline.run();
    ASSERT_TRUE(result.has_value()) << result.error().format();

    EXPECT_EQ(result->camera_count, 3u);
    EXPECT_EQ(result->frames_rendered, 3u);
    EXPECT_EQ(result->point_count, 3u * WIDTH * HEIGHT);
    EXPECT_EQ(result->point_cloud_path, params_.output_path / "cloud.npc");
    EXPECT_EQ(cameras.globbed_dir, "camera-paths/orbit-mild");
    EXPECT_EQ(cameras.loaded, (std::vector<size_t>{0, 1, 2}));

    const auto cloud = io::read_point_cloud_container(result->point_cloud_path);
    ASSERT_TRUE(cloud.has_value()) << cloud.error().format();
    ASSERT_EQ(cloud->size(), result->point_count);

    // Frames are concatenated in camera order, pixels in row-major order
    for (size_t frame = 0; frame < 3; ++frame) {
        const auto rays = rendering::build_ray_batch(cameras.camera(frame));
        ASSERT_TRUE(rays.has_value());
        for (size_t r = 0; r < rays->size(); ++r) {
            const size_t idx = frame * rays->size() + r;
            const glm::vec3 expected = rays->origins[r] + 2.0f * rays->directions[r];
            EXPECT_NEAR(cloud->verts[idx].x, expected.x, 1e-5f);
            EXPECT_NEAR(cloud->verts[idx].y, expected.y, 1e-5f);
            EXPECT_NEAR(cloud->verts[idx].z, expected.z, 1e-5f);
        }
    }
}

TEST_F(SamplingPipelineTest, FrameStepSkipsCameras) {
    const InMemoryCameraSource cameras(3);
    const DistributedRenderExecutor executor(std::make_shared<test::StubSceneModel>(), local_devices(1), 64);
    const auto state = test::make_replicated_state(1);
    params_.frame_step = 2;

    sampling::SamplingPipeline pipeline(cameras, executor, state, params_);
    sampling::SamplingResult result;
    const auto cloud = pipeline.sample(result);
    ASSERT_TRUE(cloud.has_value()) << cloud.error().format();

    EXPECT_EQ(cameras.loaded, (std::vector<size_t>{0, 2}));
    EXPECT_EQ(result.camera_count, 3u);
    EXPECT_EQ(result.frames_rendered, 2u);
    EXPECT_EQ(cloud->size(), 2u * WIDTH * HEIGHT);
    EXPECT_FALSE(std::filesystem::exists(params_.output_path / "cloud.npc"));
}

TEST_F(SamplingPipelineTest, SavedFramesAreNamedByCameraIndex) {
    const InMemoryCameraSource cameras(3);
    const DistributedRenderExecutor executor(std::make_shared<test::StubSceneModel>(), local_devices(1), 64);
    const auto state = test::make_replicated_state(1);
    params_.frame_step = 2;
    params_.save_frames = true;

    sampling::SamplingPipeline pipeline(cameras, executor, state, params_);
    const auto result = pipeline.run();
    ASSERT_TRUE(result.has_value()) << result.error().format();

    EXPECT_TRUE(std::filesystem::exists(params_.output_path / "0000.jpg"));
    EXPECT_FALSE(std::filesystem::exists(params_.output_path / "0001.jpg"));
    EXPECT_TRUE(std::filesystem::exists(params_.output_path / "0002.jpg"));
    EXPECT_TRUE(std::filesystem::exists(result->point_cloud_path));
}

TEST_F(SamplingPipelineTest, InvalidFrameStepIsRejected) {
    const InMemoryCameraSource cameras(2);
    const DistributedRenderExecutor executor(std::make_shared<test::StubSceneModel>(), local_devices(1), 64);
    const auto state = test::make_replicated_state(1);
    params_.frame_step = 0;

    sampling::SamplingPipeline pipeline(cameras, executor, state, params_);
    const auto result = pipeline.run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, core::ErrorCode::INVALID_CONFIG);
    EXPECT_TRUE(cameras.loaded.empty());
}

TEST_F(SamplingPipelineTest, RenderFailureStopsTheRunWithoutContainer) {
    const InMemoryCameraSource cameras(2);
    const DistributedRenderExecutor executor(std::make_shared<test::FailingSceneModel>(false), local_devices(2), 64);
    const auto state = test::make_replicated_state(2);

    sampling::SamplingPipeline pipeline(cameras, executor, state, params_);
    const auto result = pipeline.run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, core::ErrorCode::RENDER_FAILED);
    EXPECT_EQ(cameras.loaded, (std::vector<size_t>{0}));
    EXPECT_FALSE(std::filesystem::exists(params_.output_path / "cloud.npc"));
}

TEST_F(SamplingPipelineTest, DeviceCountMismatchIsReported) {
    const InMemoryCameraSource cameras(1);
    const DistributedRenderExecutor executor(std::make_shared<test::StubSceneModel>(), local_devices(2), 64);
    const auto state = test::make_replicated_state(3);

    sampling::SamplingPipeline pipeline(cameras, executor, state, params_);
    const auto result = pipeline.run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, core::ErrorCode::DEVICE_MISMATCH);
}

TEST_F(SamplingPipelineTest, StateWithoutReplicasIsReportedBeforeRendering) {
    const InMemoryCameraSource cameras(2);
    auto model = std::make_shared<test::StubSceneModel>();
    const DistributedRenderExecutor executor(model, local_devices(2), 64);
    const rendering::ReplicatedState state{};

    sampling::SamplingPipeline pipeline(cameras, executor, state, params_);
    const auto result = pipeline.run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, core::ErrorCode::DEVICE_MISMATCH);
    EXPECT_TRUE(cameras.loaded.empty());
    EXPECT_EQ(model->calls.load(), 0);
    EXPECT_FALSE(std::filesystem::exists(params_.output_path / "cloud.npc"));
}

TEST_F(SamplingPipelineTest, NullStateReplicatesToNothing) {
    const auto state = rendering::ReplicatedState::replicate(nullptr, 2);
    EXPECT_TRUE(state.empty());

    const InMemoryCameraSource cameras(1);
    const DistributedRenderExecutor executor(std::make_shared<test::StubSceneModel>(), local_devices(2), 64);
    sampling::SamplingPipeline pipeline(cameras, executor, state, params_);
    sampling::SamplingResult result;
    const auto cloud = pipeline.sample(result);
    ASSERT_FALSE(cloud.has_value());
    EXPECT_EQ(cloud.error().code, core::ErrorCode::DEVICE_MISMATCH);
}

TEST_F(SamplingPipelineTest, EveryFrameUsesTheSameBaseKey) {
    const InMemoryCameraSource cameras(3);
    auto model = std::make_shared<test::StubSceneModel>();
    const DistributedRenderExecutor executor(model, local_devices(1), 64);
    const auto state = test::make_replicated_state(1, 0.75f);

    sampling::SamplingPipeline pipeline(cameras, executor, state, params_);
    sampling::SamplingResult result;
    ASSERT_TRUE(pipeline.sample(result).has_value());

    ASSERT_EQ(model->seen_coarse_keys.size(), 3u);
    EXPECT_EQ(model->seen_coarse_keys[0], model->seen_coarse_keys[1]);
    EXPECT_EQ(model->seen_coarse_keys[1], model->seen_coarse_keys[2]);
    EXPECT_FLOAT_EQ(model->seen_warp_alpha, 0.75f);
}

TEST_F(SamplingPipelineTest, HostIdSeparatesRandomStreams) {
    const InMemoryCameraSource cameras(1);
    const DistributedRenderExecutor executor(std::make_shared<test::StubSceneModel>(), local_devices(1), 64);
    const auto state = test::make_replicated_state(1);

    const sampling::SamplingPipeline host0(cameras, executor, state, params_);
    auto other = params_;
    other.host_id = 1;
    const sampling::SamplingPipeline host1(cameras, executor, state, other);

    EXPECT_NE(host0.base_key(), host1.base_key());
    EXPECT_EQ(host0.base_key(), core::fold_in(core::make_rng_key(3), 0));
}

TEST(PointCloudAccumulatorTest, CountsAppends) {
    sampling::PointCloudAccumulator accumulator;
    ASSERT_TRUE(accumulator.append({}, {}).has_value());
    EXPECT_EQ(accumulator.append_count(), 1u);
    EXPECT_EQ(accumulator.size(), 0u);
}

TEST(PointCloudAccumulatorTest, FinalizeMovesOutOfTemporary) {
    sampling::PointCloudAccumulator accumulator;
    ASSERT_TRUE(accumulator.append({glm::vec3(1.0f), glm::vec3(2.0f)}, {glm::vec3(0.1f), glm::vec3(0.2f)}).has_value());

    const auto copied = accumulator.finalize();
    EXPECT_EQ(accumulator.size(), 2u);

    const auto moved = std::move(accumulator).finalize();
    EXPECT_EQ(moved.verts, copied.verts);
    EXPECT_EQ(moved.rgb, copied.rgb);
}
