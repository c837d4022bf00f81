/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include <cstdint>
#include <filesystem>
#include <glm/glm.hpp>
#include <span>
#include <vector>

namespace nps::io {

    /// "<dir>/<index:04d>.jpg"
    std::filesystem::path frame_path(const std::filesystem::path& output_dir, size_t index);

    /// Interleaved 8-bit RGB: each channel is clip(x, 0, 1) * 255, truncated.
    std::vector<uint8_t> image_to_uint8(std::span<const glm::vec3> rgb);

    /// Encodes a row-major [height, width] color image; the format follows the extension.
    core::Result<void> write_frame(const std::filesystem::path& path,
                                   std::span<const glm::vec3> rgb,
                                   int width,
                                   int height);

} // namespace nps::io
