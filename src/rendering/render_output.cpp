/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/render_output.hpp"
#include <algorithm>

namespace nps::rendering {

    bool RenderOutput::is_consistent() const {
        const size_t n = rgb.size();
        const size_t s = static_cast<size_t>(std::max(num_samples, 0));
        return depth.size() == n &&
               median_depth.size() == n &&
               acc.size() == n &&
               points.size() == n * s &&
               weights.size() == n * s;
    }

    void RenderOutput::reserve(const size_t num_rays, const int samples) {
        const size_t total = num_rays * static_cast<size_t>(std::max(samples, 0));
        rgb.reserve(num_rays);
        depth.reserve(num_rays);
        median_depth.reserve(num_rays);
        acc.reserve(num_rays);
        points.reserve(total);
        weights.reserve(total);
    }

    bool RenderOutput::append(const RenderOutput& other) {
        if (empty()) {
            num_samples = other.num_samples;
        } else if (other.num_samples != num_samples) {
            return false;
        }

        rgb.insert(rgb.end(), other.rgb.begin(), other.rgb.end());
        depth.insert(depth.end(), other.depth.begin(), other.depth.end());
        median_depth.insert(median_depth.end(), other.median_depth.begin(), other.median_depth.end());
        acc.insert(acc.end(), other.acc.begin(), other.acc.end());
        points.insert(points.end(), other.points.begin(), other.points.end());
        weights.insert(weights.end(), other.weights.begin(), other.weights.end());

        height = 1;
        width = static_cast<int>(size());
        return true;
    }

    void RenderOutput::drop_tail(const size_t count) {
        const size_t keep = size() - std::min(count, size());
        const size_t s = static_cast<size_t>(std::max(num_samples, 0));

        rgb.resize(keep);
        depth.resize(keep);
        median_depth.resize(keep);
        acc.resize(keep);
        points.resize(keep * s);
        weights.resize(keep * s);

        height = keep > 0 ? 1 : 0;
        width = static_cast<int>(keep);
    }

} // namespace nps::rendering
