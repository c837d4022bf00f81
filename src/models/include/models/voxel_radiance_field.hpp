/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "rendering/model_state.hpp"
#include "rendering/scene_model.hpp"
#include <functional>
#include <glm/glm.hpp>
#include <span>
#include <vector>

namespace nps::models {

    inline constexpr const char* VOXEL_RADIANCE_FIELD = "voxel_radiance_field";

    // Parameter names inside the ModelState
    inline constexpr const char* PARAM_DENSITY = "density";                   // [X,Y,Z]
    inline constexpr const char* PARAM_COLOR = "color";                       // [X,Y,Z,3]
    inline constexpr const char* PARAM_BBOX = "bbox";                         // [2,3] min, max
    inline constexpr const char* PARAM_WARP_OFFSETS = "warp_offsets";         // [K,3], optional
    inline constexpr const char* PARAM_APPEARANCE_GAINS = "appearance_gains"; // [K,3], optional

    struct VoxelFieldOptions {
        int num_coarse_samples = 64;
        int num_fine_samples = 128;
        float near = 0.0f;
        float far = 1.0f;
        bool randomized = false;
    };

    /**
     * @brief Dense voxel grid of density and color, rendered by alpha compositing.
     *
     * Grid values sit on the vertices of a regular lattice spanning the bbox and are
     * looked up trilinearly; outside the box density is zero. Sample positions are
     * displaced by warp_alpha * warp_offsets[warp_id] before the lookup, and colors
     * are multiplied by appearance_gains[appearance_id], when those tables exist.
     *
     * The coarse level takes num_coarse_samples stratified depths in [near, far]. The
     * fine level adds num_fine_samples depths drawn from the coarse weights by inverse
     * CDF sampling and renders the merged, sorted set.
     */
    class VoxelRadianceField final : public rendering::ISceneModel {
    public:
        explicit VoxelRadianceField(const VoxelFieldOptions& options);

        core::Result<rendering::ModelOutput> render(const rendering::ModelState& params,
                                                    const rendering::RayBatch& rays,
                                                    float warp_alpha,
                                                    core::RngKey coarse_key,
                                                    core::RngKey fine_key) const override;

        const char* name() const override { return VOXEL_RADIANCE_FIELD; }

        const VoxelFieldOptions& options() const { return options_; }

    private:
        VoxelFieldOptions options_;
    };

    /// Validates the parameter tables of a voxel field state.
    core::Result<void> validate_voxel_state(const rendering::ModelState& state);

    struct VoxelGridSpec {
        glm::ivec3 resolution{32};
        glm::vec3 bbox_min{-1.0f};
        glm::vec3 bbox_max{1.0f};
    };

    /// Builds a state by evaluating density and color at every lattice vertex.
    rendering::ModelState make_voxel_state(const VoxelGridSpec& spec,
                                           const std::function<float(const glm::vec3&)>& density,
                                           const std::function<glm::vec3(const glm::vec3&)>& color);

    /**
     * @brief Inverse transform sampling of a piecewise-constant pdf.
     *
     * `bins` has one more entry than `weights`. With `u` empty the samples are evenly
     * spaced in [0, 1]; otherwise `u` supplies them.
     */
    std::vector<float> sample_piecewise_constant_pdf(std::span<const float> bins,
                                                     std::span<const float> weights,
                                                     int num_samples,
                                                     std::span<const float> u = {});

} // namespace nps::models
