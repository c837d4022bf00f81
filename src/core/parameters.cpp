/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <chrono>
#include <format>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

namespace nps::core {
    namespace param {
        namespace {
            constexpr const char* EXPERIMENT_CONFIG_FILE = "config.json";
            constexpr const char* SAMPLING_CONFIG_FILE = "sampling_config.json";

            std::expected<nlohmann::json, std::string> read_json_file(const std::filesystem::path& path) {
                std::ifstream file;
                if (!open_file_for_read(path, file)) {
                    return std::unexpected(std::format("Cannot open config: {}", path_to_utf8(path)));
                }

                try {
                    std::stringstream buffer;
                    buffer << file.rdbuf();
                    return nlohmann::json::parse(buffer.str());
                } catch (const nlohmann::json::parse_error& e) {
                    return std::unexpected(std::format("JSON parse error in {}: {}", path_to_utf8(path), e.what()));
                }
            }
        } // namespace

        nlohmann::json ModelConfig::to_json() const {
            nlohmann::json json;
            json["type"] = type;
            json["num_coarse_samples"] = num_coarse_samples;
            json["num_fine_samples"] = num_fine_samples;
            if (near) {
                json["near"] = *near;
            }
            if (far) {
                json["far"] = *far;
            }
            json["randomized"] = randomized;
            return json;
        }

        ModelConfig ModelConfig::from_json(const nlohmann::json& j) {
            ModelConfig config;
            if (j.contains("type")) {
                config.type = j["type"].get<std::string>();
            }
            if (j.contains("num_coarse_samples")) {
                config.num_coarse_samples = j["num_coarse_samples"].get<int>();
            }
            if (j.contains("num_fine_samples")) {
                config.num_fine_samples = j["num_fine_samples"].get<int>();
            }
            if (j.contains("near")) {
                config.near = j["near"].get<float>();
            }
            if (j.contains("far")) {
                config.far = j["far"].get<float>();
            }
            if (j.contains("randomized")) {
                config.randomized = j["randomized"].get<bool>();
            }
            return config;
        }

        nlohmann::json ExperimentConfig::to_json() const {
            nlohmann::json json;
            json["random_seed"] = random_seed;
            json["image_scale"] = image_scale;
            json["chunk"] = chunk;
            json["camera_path"] = camera_path;
            json["model"] = model.to_json();
            return json;
        }

        ExperimentConfig ExperimentConfig::from_json(const nlohmann::json& j) {
            ExperimentConfig config;
            if (j.contains("random_seed")) {
                config.random_seed = j["random_seed"].get<uint64_t>();
            }
            if (j.contains("image_scale")) {
                config.image_scale = j["image_scale"].get<float>();
            }
            if (j.contains("chunk")) {
                config.chunk = j["chunk"].get<int>();
            }
            if (j.contains("camera_path")) {
                config.camera_path = j["camera_path"].get<std::string>();
            }
            if (j.contains("model")) {
                config.model = ModelConfig::from_json(j["model"]);
            }
            return config;
        }

        nlohmann::json SamplingParameters::to_json() const {
            nlohmann::json json;
            json["data_path"] = path_to_utf8(data_path);
            json["output_path"] = path_to_utf8(output_path);
            json["train_path"] = path_to_utf8(train_path);
            json["point_cloud_filename"] = point_cloud_filename;
            json["frame_step"] = frame_step;
            json["opaqueness_threshold"] = opaqueness_threshold;
            json["device_count"] = device_count;
            json["chunk"] = effective_chunk();
            json["save_frames"] = save_frames;
            json["experiment"] = experiment.to_json();
            return json;
        }

        std::string SamplingParameters::validate() const {
            if (frame_step < 1) {
                return std::format("frame step must be >= 1, got {}", frame_step);
            }
            if (opaqueness_threshold < 0.0f || opaqueness_threshold > 1.0f) {
                return std::format("opaqueness threshold must be in [0, 1], got {}", opaqueness_threshold);
            }
            if (effective_chunk() <= 0) {
                return std::format("chunk must be > 0, got {}", effective_chunk());
            }
            if (device_count < 0) {
                return std::format("device count must be >= 0, got {}", device_count);
            }
            if (experiment.image_scale <= 0.0f) {
                return std::format("image_scale must be > 0, got {}", experiment.image_scale);
            }
            if (point_cloud_filename.empty()) {
                return "point cloud filename is empty";
            }
            return {};
        }

        std::optional<InterchangeFormat> parse_interchange_format(const std::string& str) {
            if (str == "pcd" || str == ".pcd")
                return InterchangeFormat::PCD;
            if (str == "ply" || str == ".ply")
                return InterchangeFormat::PLY;
            return std::nullopt;
        }

        const char* interchange_extension(const InterchangeFormat format) {
            switch (format) {
            case InterchangeFormat::PLY: return ".ply";
            case InterchangeFormat::PCD:
            default: return ".pcd";
            }
        }

        std::expected<ExperimentConfig, std::string> read_experiment_config(const std::filesystem::path& train_path) {
            const auto config_path = train_path / EXPERIMENT_CONFIG_FILE;
            if (!std::filesystem::exists(config_path)) {
                LOG_WARN("No {} in {}, using default experiment config", EXPERIMENT_CONFIG_FILE, path_to_utf8(train_path));
                return ExperimentConfig{};
            }

            LOG_INFO("Loading config from {}", path_to_utf8(config_path));
            const auto json_result = read_json_file(config_path);
            if (!json_result) {
                return std::unexpected(json_result.error());
            }

            try {
                return ExperimentConfig::from_json(*json_result);
            } catch (const std::exception& e) {
                return std::unexpected(std::format("Error parsing experiment config: {}", e.what()));
            }
        }

        std::expected<void, std::string> save_sampling_parameters_to_json(
            const SamplingParameters& params,
            const std::filesystem::path& output_path) {
            try {
                nlohmann::json json = params.to_json();

                const auto now = std::chrono::system_clock::now();
                const auto time_t = std::chrono::system_clock::to_time_t(now);
                std::tm tm{};
                localtime_r(&time_t, &tm);
                std::stringstream ss;
                ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
                json["timestamp"] = ss.str();

                const std::filesystem::path filepath = (output_path.extension() == ".json")
                                                           ? output_path
                                                           : output_path / SAMPLING_CONFIG_FILE;
                std::ofstream file;
                if (!open_file_for_write(filepath, file)) {
                    return std::unexpected(std::format("Cannot write: {}", path_to_utf8(filepath)));
                }

                file << json.dump(4);
                LOG_INFO("Saved config: {}", path_to_utf8(filepath));
                return {};
            } catch (const std::exception& e) {
                return std::unexpected(std::format("Error saving sampling parameters: {}", e.what()));
            }
        }

    } // namespace param
} // namespace nps::core
