/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "sampling/point_cloud_accumulator.hpp"
#include <format>

namespace nps::sampling {

    core::Result<void> PointCloudAccumulator::append(const std::vector<glm::vec3>& points,
                                                     const std::vector<glm::vec3>& colors) {
        if (points.size() != colors.size()) {
            return core::make_error(core::ErrorCode::INVALID_ARGUMENT,
                                    std::format("Cannot append {} points with {} colors", points.size(), colors.size()));
        }
        cloud_.verts.insert(cloud_.verts.end(), points.begin(), points.end());
        cloud_.rgb.insert(cloud_.rgb.end(), colors.begin(), colors.end());
        ++append_count_;
        return {};
    }

    void PointCloudAccumulator::reserve(const size_t points) {
        cloud_.verts.reserve(points);
        cloud_.rgb.reserve(points);
    }

} // namespace nps::sampling
