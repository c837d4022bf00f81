/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/parameters.hpp"
#include "core/point_cloud.hpp"
#include <array>
#include <cstdint>
#include <filesystem>

namespace nps::io {

    /// True when every channel of every color is <= 1, i.e. the cloud stores [0,1] colors.
    bool colors_are_normalized(const core::PointCloud& cloud);

    /// 8-bit color; `normalized` selects [0,1] input over [0,255].
    std::array<uint8_t, 3> color_to_rgb8(const glm::vec3& color, bool normalized);

    /// PCD v0.7, binary, fields x y z rgb (packed 0x00RRGGBB reinterpreted as float).
    core::Result<void> write_pcd(const std::filesystem::path& path, const core::PointCloud& cloud);

    /// PLY binary little endian: float x y z, uchar red green blue.
    core::Result<void> write_ply(const std::filesystem::path& path, const core::PointCloud& cloud);

    core::Result<void> export_point_cloud(const std::filesystem::path& path,
                                          const core::PointCloud& cloud,
                                          core::param::InterchangeFormat format);

    /// Path of the interchange file written beside a container: "<stem>_o3d.<ext>".
    std::filesystem::path interchange_path(const std::filesystem::path& container_path,
                                           core::param::InterchangeFormat format);

    /**
     * @brief Reads a point-cloud container and writes its interchange sibling.
     * @return Path of the written file
     */
    core::Result<std::filesystem::path> convert_point_cloud(const core::param::ExportParameters& params);

} // namespace nps::io
