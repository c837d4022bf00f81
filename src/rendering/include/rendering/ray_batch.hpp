/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/camera.hpp"
#include "core/error.hpp"
#include <cstddef>
#include <cstdint>
#include <glm/glm.hpp>
#include <vector>

namespace nps::rendering {

    /**
     * @brief One ray per pixel, stored as flat row-major [H*W] arrays.
     *
     * Metadata carries the per-ray conditioning ids (appearance, warp); evaluation
     * leaves them at zero. A batch produced by slice() is a flat run of rays with
     * height 1.
     */
    struct RayBatch {
        int height = 0;
        int width = 0;

        std::vector<glm::vec3> origins;
        std::vector<glm::vec3> directions;
        std::vector<glm::vec3> viewdirs;

        std::vector<uint32_t> appearance;
        std::vector<uint32_t> warp;

        size_t size() const { return origins.size(); }
        bool empty() const { return origins.empty(); }

        // All arrays share the [H*W] leading dimension
        bool is_consistent() const;

        RayBatch slice(size_t begin, size_t end) const;

        // Repeats the last ray until size() is a multiple of `multiple`. Returns the pad count.
        size_t pad_to_multiple(size_t multiple);
    };

    /// Every pixel center of the camera, with zeroed conditioning metadata.
    core::Result<RayBatch> build_ray_batch(const core::Camera& camera);

    core::Result<void> validate_ray_batch(const RayBatch& batch);

} // namespace nps::rendering
