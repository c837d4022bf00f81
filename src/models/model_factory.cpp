/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "models/model_factory.hpp"
#include "core/logger.hpp"
#include "models/voxel_radiance_field.hpp"
#include <cmath>
#include <format>

namespace nps::models {

    core::Result<std::shared_ptr<const rendering::ISceneModel>> create_scene_model(
        const core::param::ModelConfig& config, const float near, const float far) {

        if (!std::isfinite(near) || !std::isfinite(far) || near < 0.0f || far <= near) {
            return core::make_error(core::ErrorCode::INVALID_CONFIG,
                                    std::format("Invalid scene bounds: near={}, far={}", near, far));
        }

        if (config.type == VOXEL_RADIANCE_FIELD) {
            if (config.num_coarse_samples < 1) {
                return core::make_error(core::ErrorCode::INVALID_CONFIG,
                                        std::format("num_coarse_samples must be >= 1, got {}", config.num_coarse_samples));
            }
            if (config.num_fine_samples < 0) {
                return core::make_error(core::ErrorCode::INVALID_CONFIG,
                                        std::format("num_fine_samples must be >= 0, got {}", config.num_fine_samples));
            }
            if (config.num_fine_samples > 0 && config.num_coarse_samples < 3) {
                return core::make_error(core::ErrorCode::INVALID_CONFIG,
                                        "Fine sampling needs at least 3 coarse samples");
            }

            VoxelFieldOptions options;
            options.num_coarse_samples = config.num_coarse_samples;
            options.num_fine_samples = config.num_fine_samples;
            options.near = near;
            options.far = far;
            options.randomized = config.randomized;

            LOG_DEBUG("Created {} (coarse={}, fine={}, near={}, far={})",
                      VOXEL_RADIANCE_FIELD, options.num_coarse_samples, options.num_fine_samples, near, far);
            return std::make_shared<const VoxelRadianceField>(options);
        }

        return core::make_error(core::ErrorCode::INVALID_CONFIG,
                                std::format("Unknown scene model type '{}'", config.type));
    }

} // namespace nps::models
