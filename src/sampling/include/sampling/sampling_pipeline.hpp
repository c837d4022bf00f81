/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/parameters.hpp"
#include "core/point_cloud.hpp"
#include "core/rng.hpp"
#include "io/camera_source.hpp"
#include "rendering/model_state.hpp"
#include "rendering/render_executor.hpp"
#include <cstddef>
#include <filesystem>
#include <vector>

namespace nps::sampling {

    struct SamplingResult {
        size_t camera_count = 0;   // Cameras in the camera path
        size_t frames_rendered = 0;
        size_t point_count = 0;
        std::filesystem::path point_cloud_path;
    };

    /// Camera indices 0, step, 2*step, ... below camera_count.
    std::vector<size_t> select_frames(size_t camera_count, int frame_step);

    /**
     * @brief Renders a stepped camera path and turns every rendered ray into a point.
     *
     * For each selected camera: build rays, render across the executor's devices,
     * extract one point per ray at the opaqueness threshold, optionally save the
     * color image as <output>/<index:04d>.jpg, and append the points. The unified
     * cloud is written once, after the last frame, to <output>/<point_cloud_filename>.
     *
     * Any failure stops the run; frames already written stay on disk.
     */
    class SamplingPipeline {
    public:
        SamplingPipeline(const io::ICameraSource& cameras,
                         const rendering::DistributedRenderExecutor& executor,
                         const rendering::ReplicatedState& state,
                         const core::param::SamplingParameters& params);

        [[nodiscard]] core::Result<SamplingResult> run();

        /// Same as run() but keeps the cloud in memory instead of writing it.
        [[nodiscard]] core::Result<core::PointCloud> sample(SamplingResult& result);

        // Key shared by every frame; separate per host
        core::RngKey base_key() const { return base_key_; }

    private:
        const io::ICameraSource& cameras_;
        const rendering::DistributedRenderExecutor& executor_;
        const rendering::ReplicatedState& state_;
        const core::param::SamplingParameters& params_;
        core::RngKey base_key_;
    };

} // namespace nps::sampling
