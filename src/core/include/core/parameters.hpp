/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace nps::core {
    namespace param {

        struct ModelConfig {
            std::string type = "voxel_radiance_field";
            int num_coarse_samples = 64;
            int num_fine_samples = 128;
            // Scene bounds override; the dataset's scene.json is used when unset
            std::optional<float> near = std::nullopt;
            std::optional<float> far = std::nullopt;
            bool randomized = false; // Stratified jitter; always off for evaluation

            nlohmann::json to_json() const;
            static ModelConfig from_json(const nlohmann::json& j);
        };

        // Settings of the trained experiment, stored as <train_dir>/config.json
        struct ExperimentConfig {
            uint64_t random_seed = 0;
            float image_scale = 1.0f;
            int chunk = 8192;                                 // Rays per dispatch
            std::string camera_path = "camera-paths/orbit-mild"; // Relative to the data dir
            ModelConfig model;

            nlohmann::json to_json() const;
            static ExperimentConfig from_json(const nlohmann::json& j);
        };

        struct SamplingParameters {
            std::filesystem::path data_path = "";
            std::filesystem::path output_path = "";
            std::filesystem::path train_path = "";
            std::string point_cloud_filename = "";
            int frame_step = 1;
            float opaqueness_threshold = 0.5f;
            int device_count = 0;              // 0 = one device per hardware thread
            std::optional<int> chunk = std::nullopt; // Overrides experiment.chunk
            bool save_frames = true;
            uint64_t host_id = 0;

            ExperimentConfig experiment;

            int effective_chunk() const { return chunk.value_or(experiment.chunk); }

            nlohmann::json to_json() const;

            [[nodiscard]] std::string validate() const;
        };

        enum class InterchangeFormat { PCD,
                                       PLY };

        struct ExportParameters {
            std::filesystem::path point_cloud_path;
            InterchangeFormat format = InterchangeFormat::PCD;
            bool drop_degenerate = false;
        };

        std::optional<InterchangeFormat> parse_interchange_format(const std::string& str);
        const char* interchange_extension(InterchangeFormat format);

        // Missing config.json yields defaults; a malformed one is an error.
        std::expected<ExperimentConfig, std::string> read_experiment_config(const std::filesystem::path& train_path);

        std::expected<void, std::string> save_sampling_parameters_to_json(
            const SamplingParameters& params,
            const std::filesystem::path& output_path);

    } // namespace param
} // namespace nps::core
