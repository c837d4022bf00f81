/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <glm/glm.hpp>
#include <optional>
#include <vector>

namespace nps::rendering {

    /**
     * @brief Per-ray render result, flat over rays.
     *
     * Per-ray maps (rgb, depth, median_depth, acc) have size() entries.
     * Per-sample arrays (points, weights) are ray-major: sample s of ray r
     * lives at r * num_samples + s.
     */
    struct RenderOutput {
        int height = 0;
        int width = 0;
        int num_samples = 0;

        std::vector<glm::vec3> rgb;
        std::vector<float> depth;
        std::vector<float> median_depth;
        std::vector<float> acc;

        std::vector<glm::vec3> points;
        std::vector<float> weights;

        size_t size() const { return rgb.size(); }
        bool empty() const { return rgb.empty(); }

        bool is_consistent() const;

        void reserve(size_t num_rays, int samples);

        // Appends the rays of `other`; sample counts must agree (or this is empty)
        bool append(const RenderOutput& other);

        void drop_tail(size_t count);

        bool operator==(const RenderOutput&) const = default;
    };

    /// Output of one scene-model call: the coarse level and, when the model resamples, the fine level.
    struct ModelOutput {
        RenderOutput coarse;
        std::optional<RenderOutput> fine;

        const RenderOutput& finest() const { return fine ? *fine : coarse; }
    };

} // namespace nps::rendering
