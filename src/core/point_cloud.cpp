/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/point_cloud.hpp"
#include "core/logger.hpp"
#include <algorithm>

namespace nps::core {

    PointCloud filter_degenerate_points(const PointCloud& cloud) {
        PointCloud filtered;
        filtered.verts.reserve(cloud.size());
        filtered.rgb.reserve(cloud.size());

        const size_t count = std::min(cloud.verts.size(), cloud.rgb.size());
        for (size_t i = 0; i < count; ++i) {
            if (cloud.verts[i] == glm::vec3(0.0f)) {
                continue;
            }
            filtered.verts.push_back(cloud.verts[i]);
            filtered.rgb.push_back(cloud.rgb[i]);
        }

        LOG_DEBUG("Dropped {} degenerate points of {}", count - filtered.size(), count);
        return filtered;
    }

} // namespace nps::core
