/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/point_cloud.hpp"
#include <cstddef>
#include <glm/glm.hpp>
#include <utility>
#include <vector>

namespace nps::sampling {

    /**
     * @brief Collects per-frame points and colors into one point cloud.
     *
     * Chunks are kept in append order. Nothing is deduplicated or filtered:
     * every appended ray stays in the result.
     */
    class PointCloudAccumulator {
    public:
        /// INVALID_ARGUMENT if the two sequences differ in length.
        core::Result<void> append(const std::vector<glm::vec3>& points, const std::vector<glm::vec3>& colors);

        /// Concatenation of every appended chunk, in append order.
        [[nodiscard]] core::PointCloud finalize() const& { return cloud_; }
        [[nodiscard]] core::PointCloud finalize() && { return std::move(cloud_); }

        size_t append_count() const { return append_count_; }
        size_t size() const { return cloud_.size(); }

        void reserve(size_t points);

    private:
        core::PointCloud cloud_;
        size_t append_count_ = 0;
    };

} // namespace nps::sampling
