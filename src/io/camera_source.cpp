/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/camera_source.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace nps::io {

    namespace {
        constexpr const char* SCENE_FILE = "scene.json";

        core::Result<nlohmann::json> read_json(const std::filesystem::path& path, const core::ErrorCode on_parse_error) {
            std::ifstream file;
            if (!core::open_file_for_read(path, file)) {
                return core::make_error(core::ErrorCode::READ_FAILURE, "Cannot open file", path);
            }
            try {
                std::stringstream buffer;
                buffer << file.rdbuf();
                return nlohmann::json::parse(buffer.str());
            } catch (const nlohmann::json::parse_error& e) {
                return core::make_error(on_parse_error, std::format("JSON parse error: {}", e.what()), path);
            }
        }

        template <int N>
        glm::vec<N, float> read_vec(const nlohmann::json& j, const char* key, const glm::vec<N, float>& fallback) {
            if (!j.contains(key)) {
                return fallback;
            }
            const auto& arr = j.at(key);
            if (!arr.is_array() || arr.size() != static_cast<size_t>(N)) {
                throw std::invalid_argument(std::format("'{}' must have {} entries", key, N));
            }
            glm::vec<N, float> v;
            for (int i = 0; i < N; ++i) {
                v[i] = arr[static_cast<size_t>(i)].get<float>();
            }
            return v;
        }
    } // namespace

    core::Result<core::Camera> camera_from_json(const nlohmann::json& j) {
        try {
            for (const char* key : {"orientation", "position", "focal_length", "principal_point", "image_size"}) {
                if (!j.contains(key)) {
                    return core::make_error(core::ErrorCode::INVALID_CAMERA, std::format("Camera is missing '{}'", key));
                }
            }

            const auto& rows = j.at("orientation");
            if (!rows.is_array() || rows.size() != 3) {
                return core::make_error(core::ErrorCode::INVALID_CAMERA, "Camera orientation must be 3x3");
            }
            glm::mat3 orientation(1.0f);
            for (int r = 0; r < 3; ++r) {
                const auto& row = rows[static_cast<size_t>(r)];
                if (!row.is_array() || row.size() != 3) {
                    return core::make_error(core::ErrorCode::INVALID_CAMERA, "Camera orientation must be 3x3");
                }
                for (int c = 0; c < 3; ++c) {
                    orientation[c][r] = row[static_cast<size_t>(c)].get<float>(); // glm is column-major
                }
            }

            const auto& size = j.at("image_size");
            if (!size.is_array() || size.size() != 2) {
                return core::make_error(core::ErrorCode::INVALID_CAMERA, "Camera image_size must be [width, height]");
            }
            const glm::ivec2 image_size(size[0].get<int>(), size[1].get<int>());

            return core::Camera(orientation,
                                read_vec<3>(j, "position", glm::vec3(0.0f)),
                                j.at("focal_length").get<float>(),
                                read_vec<2>(j, "principal_point", glm::vec2(0.0f)),
                                image_size,
                                j.value("skew", 0.0f),
                                j.value("pixel_aspect_ratio", 1.0f),
                                read_vec<3>(j, "radial_distortion", glm::vec3(0.0f)),
                                read_vec<2>(j, "tangential_distortion", glm::vec2(0.0f)));
        } catch (const std::exception& e) {
            return core::make_error(core::ErrorCode::INVALID_CAMERA, std::format("Malformed camera: {}", e.what()));
        }
    }

    nlohmann::json camera_to_json(const core::Camera& camera) {
        nlohmann::json j;
        const auto& m = camera.orientation();
        j["orientation"] = {{m[0][0], m[1][0], m[2][0]},
                            {m[0][1], m[1][1], m[2][1]},
                            {m[0][2], m[1][2], m[2][2]}};
        j["position"] = {camera.position().x, camera.position().y, camera.position().z};
        j["focal_length"] = camera.focal_length();
        j["principal_point"] = {camera.principal_point().x, camera.principal_point().y};
        j["skew"] = camera.skew();
        j["pixel_aspect_ratio"] = camera.pixel_aspect_ratio();
        j["radial_distortion"] = {camera.radial_distortion().x, camera.radial_distortion().y, camera.radial_distortion().z};
        j["tangential_distortion"] = {camera.tangential_distortion().x, camera.tangential_distortion().y};
        j["image_size"] = {camera.image_width(), camera.image_height()};
        return j;
    }

    NerfiesDataSource::NerfiesDataSource(std::filesystem::path data_dir, SceneInfo scene, const float image_scale)
        : data_dir_(std::move(data_dir)),
          scene_(scene),
          image_scale_(image_scale) {}

    core::Result<std::unique_ptr<NerfiesDataSource>> NerfiesDataSource::create(const std::filesystem::path& data_dir,
                                                                               const float image_scale,
                                                                               const std::optional<float> near_override,
                                                                               const std::optional<float> far_override) {
        std::error_code ec;
        if (!std::filesystem::exists(data_dir, ec)) {
            return core::make_error(core::ErrorCode::PATH_NOT_FOUND, "Data directory not found", data_dir);
        }
        if (!std::filesystem::is_directory(data_dir, ec)) {
            return core::make_error(core::ErrorCode::NOT_A_DIRECTORY, "Data path is not a directory", data_dir);
        }
        if (!(image_scale > 0.0f)) {
            return core::make_error(core::ErrorCode::INVALID_CONFIG, std::format("image_scale must be > 0, got {}", image_scale));
        }

        SceneInfo scene;
        bool have_bounds = false;

        const auto scene_path = data_dir / SCENE_FILE;
        if (std::filesystem::exists(scene_path, ec)) {
            auto json = read_json(scene_path, core::ErrorCode::INVALID_DATASET);
            if (!json) {
                return std::unexpected(json.error());
            }
            try {
                scene.scale = json->value("scale", 1.0f);
                scene.center = read_vec<3>(*json, "center", glm::vec3(0.0f));
                if (json->contains("near") && json->contains("far")) {
                    scene.near = json->at("near").get<float>();
                    scene.far = json->at("far").get<float>();
                    have_bounds = true;
                }
            } catch (const std::exception& e) {
                return core::make_error(core::ErrorCode::INVALID_DATASET, std::format("Malformed scene.json: {}", e.what()), scene_path);
            }
        } else {
            LOG_WARN("No {} in {}, cameras are used unnormalized", SCENE_FILE, core::path_to_utf8(data_dir));
        }

        if (near_override) {
            scene.near = *near_override;
        }
        if (far_override) {
            scene.far = *far_override;
        }
        if (!have_bounds && !(near_override && far_override)) {
            return core::make_error(core::ErrorCode::INVALID_DATASET,
                                    "Scene bounds unknown: scene.json has no near/far and the model config sets none", data_dir);
        }

        LOG_DEBUG("Scene: near={}, far={}, scale={}, center=({}, {}, {})",
                  scene.near, scene.far, scene.scale, scene.center.x, scene.center.y, scene.center.z);
        return std::unique_ptr<NerfiesDataSource>(new NerfiesDataSource(data_dir, scene, image_scale));
    }

    core::Result<std::vector<std::filesystem::path>> NerfiesDataSource::glob_cameras(const std::filesystem::path& camera_dir) const {
        const auto dir = camera_dir.is_absolute() ? camera_dir : data_dir_ / camera_dir;

        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) {
            return core::make_error(core::ErrorCode::PATH_NOT_FOUND, "Camera path directory not found", dir);
        }

        std::vector<std::filesystem::path> paths;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json") {
                paths.push_back(entry.path());
            }
        }
        if (ec) {
            return core::make_error(core::ErrorCode::READ_FAILURE, ec.message(), dir);
        }
        std::ranges::sort(paths);

        if (paths.empty()) {
            return core::make_error(core::ErrorCode::EMPTY_DATASET, "No camera files in camera path", dir);
        }
        LOG_DEBUG("Found {} cameras in {}", paths.size(), core::path_to_utf8(dir));
        return paths;
    }

    core::Result<core::Camera> NerfiesDataSource::load_camera(const std::filesystem::path& descriptor) const {
        auto json = read_json(descriptor, core::ErrorCode::INVALID_CAMERA);
        if (!json) {
            return std::unexpected(json.error());
        }

        auto camera = camera_from_json(*json);
        if (!camera) {
            return core::make_error(camera.error().code, camera.error().message, descriptor);
        }

        core::Camera scaled = camera->scale(1.0f / image_scale_);
        scaled.set_position((scaled.position() - scene_.center) * scene_.scale);
        return scaled;
    }

} // namespace nps::io
