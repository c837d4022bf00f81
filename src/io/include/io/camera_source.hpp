/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/camera.hpp"
#include "core/error.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace nps::io {

    /// Source of evaluation cameras and the scene depth bounds.
    class ICameraSource {
    public:
        virtual ~ICameraSource() = default;

        /// Camera descriptors of a camera path, in path order.
        [[nodiscard]] virtual core::Result<std::vector<std::filesystem::path>> glob_cameras(
            const std::filesystem::path& camera_dir) const = 0;

        [[nodiscard]] virtual core::Result<core::Camera> load_camera(const std::filesystem::path& descriptor) const = 0;

        virtual float near() const = 0;
        virtual float far() const = 0;
    };

    /// Scene normalization stored in scene.json.
    struct SceneInfo {
        float near = 0.0f;
        float far = 1.0f;
        float scale = 1.0f;
        glm::vec3 center{0.0f};
    };

    /**
     * @brief Dataset laid out as <data_dir>/scene.json plus camera JSON files.
     *
     * Each loaded camera is rescaled by 1/image_scale, then moved into the
     * normalized scene frame: position = (position - center) * scale.
     */
    class NerfiesDataSource final : public ICameraSource {
    public:
        /**
         * @param near_override, far_override Replace the scene.json bounds when set
         * @return INVALID_DATASET if bounds are missing or scene.json is malformed
         */
        static core::Result<std::unique_ptr<NerfiesDataSource>> create(const std::filesystem::path& data_dir,
                                                                       float image_scale,
                                                                       std::optional<float> near_override = std::nullopt,
                                                                       std::optional<float> far_override = std::nullopt);

        core::Result<std::vector<std::filesystem::path>> glob_cameras(const std::filesystem::path& camera_dir) const override;
        core::Result<core::Camera> load_camera(const std::filesystem::path& descriptor) const override;

        float near() const override { return scene_.near; }
        float far() const override { return scene_.far; }

        const SceneInfo& scene() const { return scene_; }
        const std::filesystem::path& data_dir() const { return data_dir_; }

    private:
        NerfiesDataSource(std::filesystem::path data_dir, SceneInfo scene, float image_scale);

        std::filesystem::path data_dir_;
        SceneInfo scene_;
        float image_scale_;
    };

    /// Parses one camera JSON object (orientation is row-major world-to-camera).
    core::Result<core::Camera> camera_from_json(const nlohmann::json& j);

    nlohmann::json camera_to_json(const core::Camera& camera);

} // namespace nps::io
