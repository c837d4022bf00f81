/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include "io/camera_source.hpp"
#include "io/checkpoint.hpp"
#include "io/interchange_export.hpp"
#include "models/model_factory.hpp"
#include "rendering/compute_device.hpp"
#include "rendering/render_executor.hpp"
#include "sampling/sampling_pipeline.hpp"
#include <filesystem>

namespace nps::app {

    namespace {

        constexpr const char* CHECKPOINT_DIR = "checkpoints";

        int runSamplePoints(const core::param::SamplingParameters& params) {
            std::error_code ec;
            std::filesystem::create_directories(params.output_path, ec);
            if (ec) {
                LOG_ERROR("Cannot create output directory {}: {}", core::path_to_utf8(params.output_path), ec.message());
                return 1;
            }

            if (const auto result = core::param::save_sampling_parameters_to_json(params, params.output_path); !result) {
                LOG_ERROR("Failed to save sampling config: {}", result.error());
                return 1;
            }

            const auto checkpoint_dir = params.train_path / CHECKPOINT_DIR;
            auto restored = io::restore_checkpoint(checkpoint_dir);
            if (!restored) {
                LOG_ERROR("Failed to restore checkpoint: {}", restored.error().format());
                return 1;
            }
            const int64_t step = restored->step + 1;
            LOG_INFO("Restored model '{}' at step {}", restored->model_type, step);

            const auto& model_config = params.experiment.model;
            if (!model_config.type.empty() && model_config.type != restored->model_type) {
                LOG_ERROR("Checkpoint holds a '{}' model but the experiment config names '{}'",
                          restored->model_type, model_config.type);
                return 1;
            }

            auto source = io::NerfiesDataSource::create(params.data_path, params.experiment.image_scale,
                                                        model_config.near, model_config.far);
            if (!source) {
                LOG_ERROR("Failed to open dataset: {}", source.error().format());
                return 1;
            }

            auto model = models::create_scene_model(model_config, (*source)->near(), (*source)->far());
            if (!model) {
                LOG_ERROR("Failed to create scene model: {}", model.error().format());
                return 1;
            }

            auto devices = rendering::local_devices(params.device_count);
            const auto state = rendering::ReplicatedState::replicate(
                std::make_shared<const rendering::ModelState>(std::move(*restored)), devices.size());
            const rendering::DistributedRenderExecutor executor(*model, std::move(devices),
                                                                static_cast<size_t>(params.effective_chunk()));

            sampling::SamplingPipeline pipeline(**source, executor, state, params);
            const auto result = pipeline.run();
            if (!result) {
                LOG_ERROR("Sampling failed: {}", result.error().format());
                return 1;
            }

            LOG_INFO("Point cloud saved to {}", core::path_to_utf8(result->point_cloud_path));
            return 0;
        }

    } // namespace

    int Application::run(std::unique_ptr<core::param::SamplingParameters> params) {
        auto experiment = core::param::read_experiment_config(params->train_path);
        if (!experiment) {
            LOG_ERROR("Failed to read experiment config: {}", experiment.error());
            return 1;
        }
        params->experiment = std::move(*experiment);

        if (const auto error = params->validate(); !error.empty()) {
            LOG_ERROR("Invalid sampling parameters: {}", error);
            return 1;
        }
        return runSamplePoints(*params);
    }

    int Application::run(const core::param::ExportParameters& params) {
        const auto result = io::convert_point_cloud(params);
        if (!result) {
            LOG_ERROR("Failed to convert point cloud: {}", result.error().format());
            return 1;
        }
        LOG_INFO("Interchange point cloud written to {}", core::path_to_utf8(*result));
        return 0;
    }

} // namespace nps::app
