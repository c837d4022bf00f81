/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "rendering/render_output.hpp"
#include <cstdint>
#include <glm/glm.hpp>
#include <span>
#include <vector>

namespace nps::rendering {

    inline constexpr float DEFAULT_OPAQUENESS_THRESHOLD = 0.5f;

    /**
     * @brief Marks the sample at which the running sum of weights first reaches `threshold`.
     *
     * At most one entry is set. A ray whose weights never reach the threshold gets an
     * all-zero mask.
     */
    std::vector<uint8_t> compute_opaqueness_mask(std::span<const float> weights,
                                                 float threshold = DEFAULT_OPAQUENESS_THRESHOLD);

    /// Index of the masked sample, or -1 when the ray stays transparent.
    int first_opaque_sample(std::span<const float> weights,
                            float threshold = DEFAULT_OPAQUENESS_THRESHOLD);

    struct ExtractedPoints {
        std::vector<glm::vec3> points;
        std::vector<glm::vec3> colors;
    };

    /**
     * @brief One surface point per ray, paired with the ray's rendered color.
     *
     * The point is sum(mask * sample_position) over the ray's samples. Rays that never
     * reach the threshold produce (0,0,0) and keep their color.
     *
     * @return INVALID_ARGUMENT if the output arrays are inconsistent
     */
    core::Result<ExtractedPoints> extract_points(const RenderOutput& output,
                                                 float threshold = DEFAULT_OPAQUENESS_THRESHOLD);

} // namespace nps::rendering
