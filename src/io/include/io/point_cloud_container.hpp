/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/point_cloud.hpp"
#include <filesystem>

namespace nps::io {

    inline constexpr const char* CONTAINER_KEY_VERTS = "verts";
    inline constexpr const char* CONTAINER_KEY_RGB = "rgb";

    /**
     * @brief Writes the cloud as a tagged container holding `verts` [N,3] and `rgb` [N,3].
     *
     * Colors are stored as given. Fails with INVALID_ARGUMENT for mismatched
     * lengths and WRITE_FAILURE when the file cannot be written.
     */
    core::Result<void> write_point_cloud_container(const std::filesystem::path& path,
                                                   const core::PointCloud& cloud);

    /**
     * @brief Reads a container written by write_point_cloud_container().
     *
     * PATH_NOT_FOUND if the file is missing; CORRUPTED_DATA for a bad header,
     * truncation, absent keys, or verts/rgb that are not equal-length [N,3] arrays.
     * Extra keys are ignored.
     */
    core::Result<core::PointCloud> read_point_cloud_container(const std::filesystem::path& path);

} // namespace nps::io
