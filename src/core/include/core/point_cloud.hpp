/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <glm/glm.hpp>
#include <vector>

namespace nps::core {

    // Index-aligned point positions and colors. Colors keep whatever range the
    // producer wrote ([0,1] from the renderer); nothing here renormalizes them.
    struct PointCloud {
        std::vector<glm::vec3> verts; // [N, 3]
        std::vector<glm::vec3> rgb;   // [N, 3]

        PointCloud() = default;
        PointCloud(std::vector<glm::vec3> v, std::vector<glm::vec3> c)
            : verts(std::move(v)),
              rgb(std::move(c)) {}

        size_t size() const { return verts.size(); }
        bool empty() const { return verts.empty(); }
        bool is_consistent() const { return verts.size() == rgb.size(); }

        bool operator==(const PointCloud&) const = default;
    };

    /// Drops points sitting exactly at the origin. Rays that never reach the
    /// opaqueness threshold collapse there, so this removes background rays.
    PointCloud filter_degenerate_points(const PointCloud& cloud);

} // namespace nps::core
