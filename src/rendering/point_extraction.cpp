/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/point_extraction.hpp"
#include "core/logger.hpp"
#include <format>

namespace nps::rendering {

    int first_opaque_sample(const std::span<const float> weights, const float threshold) {
        float cumsum = 0.0f;
        for (size_t s = 0; s < weights.size(); ++s) {
            cumsum += weights[s];
            if (cumsum >= threshold) {
                return static_cast<int>(s);
            }
        }
        return -1;
    }

    std::vector<uint8_t> compute_opaqueness_mask(const std::span<const float> weights, const float threshold) {
        std::vector<uint8_t> mask(weights.size(), 0);
        if (const int s = first_opaque_sample(weights, threshold); s >= 0) {
            mask[static_cast<size_t>(s)] = 1;
        }
        return mask;
    }

    core::Result<ExtractedPoints> extract_points(const RenderOutput& output, const float threshold) {
        if (!output.is_consistent()) {
            return core::make_error(core::ErrorCode::INVALID_ARGUMENT,
                                    std::format("Render output is inconsistent: {} rays, {} samples, {} points, {} weights",
                                                output.size(), output.num_samples, output.points.size(), output.weights.size()));
        }

        const size_t num_rays = output.size();
        const size_t num_samples = static_cast<size_t>(output.num_samples);

        ExtractedPoints extracted;
        extracted.points.reserve(num_rays);
        extracted.colors = output.rgb;

        size_t transparent = 0;
        for (size_t r = 0; r < num_rays; ++r) {
            const std::span<const float> ray_weights(output.weights.data() + r * num_samples, num_samples);
            const int s = first_opaque_sample(ray_weights, threshold);
            if (s < 0) {
                extracted.points.emplace_back(0.0f);
                ++transparent;
            } else {
                extracted.points.push_back(output.points[r * num_samples + static_cast<size_t>(s)]);
            }
        }

        if (transparent > 0) {
            LOG_DEBUG("{} of {} rays never reached opaqueness {}", transparent, num_rays, threshold);
        }
        return extracted;
    }

} // namespace nps::rendering
