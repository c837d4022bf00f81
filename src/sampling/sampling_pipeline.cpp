/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "sampling/sampling_pipeline.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include "io/frame_writer.hpp"
#include "io/point_cloud_container.hpp"
#include "rendering/point_extraction.hpp"
#include "rendering/ray_batch.hpp"
#include "sampling/point_cloud_accumulator.hpp"
#include <format>
#include <utility>

namespace nps::sampling {

    std::vector<size_t> select_frames(const size_t camera_count, const int frame_step) {
        std::vector<size_t> indices;
        if (frame_step < 1) {
            return indices;
        }
        const auto step = static_cast<size_t>(frame_step);
        indices.reserve((camera_count + step - 1) / step);
        for (size_t i = 0; i < camera_count; i += step) {
            indices.push_back(i);
        }
        return indices;
    }

    SamplingPipeline::SamplingPipeline(const io::ICameraSource& cameras,
                                       const rendering::DistributedRenderExecutor& executor,
                                       const rendering::ReplicatedState& state,
                                       const core::param::SamplingParameters& params)
        : cameras_(cameras),
          executor_(executor),
          state_(state),
          params_(params),
          base_key_(core::fold_in(core::make_rng_key(params.experiment.random_seed), params.host_id)) {}

    core::Result<core::PointCloud> SamplingPipeline::sample(SamplingResult& result) {
        if (params_.frame_step < 1) {
            return core::make_error(core::ErrorCode::INVALID_CONFIG,
                                    std::format("frame_step must be >= 1, got {}", params_.frame_step));
        }

        if (state_.empty() || state_.replica_count() != executor_.device_count()) {
            return core::make_error(core::ErrorCode::DEVICE_MISMATCH,
                                    std::format("Model state has {} replica(s) but {} device(s) are active",
                                                state_.replica_count(), executor_.device_count()));
        }

        if (params_.save_frames) {
            std::error_code ec;
            std::filesystem::create_directories(params_.output_path, ec);
            if (ec) {
                return core::make_error(core::ErrorCode::WRITE_FAILURE,
                                        std::format("Cannot create output directory: {}", ec.message()), params_.output_path);
            }
        }

        auto camera_paths = cameras_.glob_cameras(params_.experiment.camera_path);
        if (!camera_paths) {
            return std::unexpected(camera_paths.error());
        }

        const auto frames = select_frames(camera_paths->size(), params_.frame_step);
        result.camera_count = camera_paths->size();
        LOG_INFO("Sampling {} of {} cameras (step {}) on {} device(s)",
                 frames.size(), camera_paths->size(), params_.frame_step, executor_.device_count());

        PointCloudAccumulator accumulator;
        for (const size_t i : frames) {
            LOG_INFO("Rendering frame {}/{}", i + 1, camera_paths->size());

            auto camera = cameras_.load_camera((*camera_paths)[i]);
            if (!camera) {
                return std::unexpected(camera.error());
            }

            auto rays = rendering::build_ray_batch(*camera);
            if (!rays) {
                return core::make_error(rays.error().code, rays.error().message, (*camera_paths)[i]);
            }

            auto output = executor_.render(state_, *rays, state_.warp_alpha(), base_key_);
            if (!output) {
                return std::unexpected(output.error());
            }

            auto extracted = rendering::extract_points(*output, params_.opaqueness_threshold);
            if (!extracted) {
                return std::unexpected(extracted.error());
            }
            if (auto appended = accumulator.append(extracted->points, extracted->colors); !appended) {
                return std::unexpected(appended.error());
            }

            if (params_.save_frames) {
                if (auto written = io::write_frame(io::frame_path(params_.output_path, i), output->rgb,
                                                   output->width, output->height);
                    !written) {
                    return std::unexpected(written.error());
                }
            }
        }

        result.frames_rendered = accumulator.append_count();
        result.point_count = accumulator.size();
        return std::move(accumulator).finalize();
    }

    core::Result<SamplingResult> SamplingPipeline::run() {
        LOG_TIMER("SamplingPipeline::run");

        SamplingResult result;
        auto cloud = sample(result);
        if (!cloud) {
            return std::unexpected(cloud.error());
        }

        std::error_code ec;
        std::filesystem::create_directories(params_.output_path, ec);
        if (ec) {
            return core::make_error(core::ErrorCode::WRITE_FAILURE,
                                    std::format("Cannot create output directory: {}", ec.message()), params_.output_path);
        }

        result.point_cloud_path = params_.output_path / params_.point_cloud_filename;
        if (auto written = io::write_point_cloud_container(result.point_cloud_path, *cloud); !written) {
            return std::unexpected(written.error());
        }

        LOG_INFO("Wrote {} points from {} frames to {}",
                 result.point_count, result.frames_rendered, core::path_to_utf8(result.point_cloud_path));
        return result;
    }

} // namespace nps::sampling
