/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "rendering/model_state.hpp"
#include <cstdint>
#include <filesystem>

namespace nps::io {

    inline constexpr const char* CHECKPOINT_PREFIX = "checkpoint_";

    struct CheckpointHeader {
        uint32_t magic = 0;
        uint32_t version = 0;
        int64_t step = 0;
        float warp_alpha = 0.0f;
    };

    /// Writes `<checkpoint_dir>/checkpoint_<step>`, creating the directory. Returns the file path.
    core::Result<std::filesystem::path> save_checkpoint(const std::filesystem::path& checkpoint_dir,
                                                        const rendering::ModelState& state);

    /// The checkpoint with the highest step in the directory.
    core::Result<std::filesystem::path> latest_checkpoint(const std::filesystem::path& checkpoint_dir);

    core::Result<rendering::ModelState> load_checkpoint(const std::filesystem::path& checkpoint_path);

    /**
     * @brief Restores the latest checkpoint of a directory. Read-only.
     * @return PATH_NOT_FOUND if there is no checkpoint, CORRUPTED_DATA if it cannot be parsed
     */
    core::Result<rendering::ModelState> restore_checkpoint(const std::filesystem::path& checkpoint_dir);

} // namespace nps::io
