/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/checkpoint.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include "io/tagged_arrays.hpp"
#include <algorithm>
#include <charconv>
#include <format>
#include <fstream>
#include <optional>
#include <string_view>

namespace nps::io {

    namespace {
        constexpr uint32_t CHECKPOINT_MAGIC = 0x4B43504E; // "NPCK"
        constexpr uint32_t CHECKPOINT_VERSION = 1;
        constexpr uint32_t MAX_MODEL_TYPE_LENGTH = 256;

        // "checkpoint_<digits>" -> step
        std::optional<int64_t> parse_checkpoint_step(const std::string& filename) {
            const std::string_view prefix = CHECKPOINT_PREFIX;
            if (filename.size() <= prefix.size() || filename.compare(0, prefix.size(), prefix) != 0) {
                return std::nullopt;
            }
            const char* first = filename.data() + prefix.size();
            const char* last = filename.data() + filename.size();

            int64_t step = 0;
            const auto [ptr, ec] = std::from_chars(first, last, step);
            if (ec != std::errc{} || ptr != last || step < 0) {
                return std::nullopt;
            }
            return step;
        }
    } // namespace

    core::Result<std::filesystem::path> save_checkpoint(const std::filesystem::path& checkpoint_dir,
                                                        const rendering::ModelState& state) {
        if (checkpoint_dir.empty()) {
            return core::make_error(core::ErrorCode::INVALID_ARGUMENT, "Checkpoint directory is empty");
        }

        std::error_code ec;
        std::filesystem::create_directories(checkpoint_dir, ec);
        if (ec) {
            return core::make_error(core::ErrorCode::WRITE_FAILURE,
                                    std::format("Failed to create checkpoint directory: {}", ec.message()), checkpoint_dir);
        }

        const auto path = checkpoint_dir / std::format("{}{}", CHECKPOINT_PREFIX, state.step);

        std::ofstream file;
        if (!core::open_file_for_write(path, std::ios::binary, file)) {
            return core::make_error(core::ErrorCode::WRITE_FAILURE, "Failed to open checkpoint file", path);
        }

        CheckpointHeader header;
        header.magic = CHECKPOINT_MAGIC;
        header.version = CHECKPOINT_VERSION;
        header.step = state.step;
        header.warp_alpha = state.warp_alpha;

        write_value(file, header.magic);
        write_value(file, header.version);
        write_value(file, header.step);
        write_value(file, header.warp_alpha);
        write_string(file, state.model_type);

        write_tagged_arrays(file, state.params);
        file.flush();

        if (!file) {
            return core::make_error(core::ErrorCode::WRITE_FAILURE, "Failed writing checkpoint", path);
        }

        LOG_INFO("Checkpoint saved: {} (step {}, {} arrays)", core::path_to_utf8(path), state.step, state.params.size());
        return path;
    }

    core::Result<std::filesystem::path> latest_checkpoint(const std::filesystem::path& checkpoint_dir) {
        std::error_code ec;
        if (!std::filesystem::exists(checkpoint_dir, ec)) {
            return core::make_error(core::ErrorCode::PATH_NOT_FOUND, "Checkpoint directory not found", checkpoint_dir);
        }
        if (!std::filesystem::is_directory(checkpoint_dir, ec)) {
            return core::make_error(core::ErrorCode::NOT_A_DIRECTORY, "Checkpoint path is not a directory", checkpoint_dir);
        }

        std::optional<std::pair<int64_t, std::filesystem::path>> best;
        for (const auto& entry : std::filesystem::directory_iterator(checkpoint_dir, ec)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            const auto step = parse_checkpoint_step(entry.path().filename().string());
            if (step && (!best || *step > best->first)) {
                best.emplace(*step, entry.path());
            }
        }
        if (ec) {
            return core::make_error(core::ErrorCode::READ_FAILURE, ec.message(), checkpoint_dir);
        }
        if (!best) {
            return core::make_error(core::ErrorCode::PATH_NOT_FOUND, "No checkpoint found", checkpoint_dir);
        }
        return best->second;
    }

    core::Result<rendering::ModelState> load_checkpoint(const std::filesystem::path& checkpoint_path) {
        std::error_code ec;
        const auto file_size = std::filesystem::file_size(checkpoint_path, ec);
        if (ec) {
            return core::make_error(core::ErrorCode::PATH_NOT_FOUND, ec.message(), checkpoint_path);
        }

        std::ifstream file;
        if (!core::open_file_for_read(checkpoint_path, std::ios::binary, file)) {
            return core::make_error(core::ErrorCode::READ_FAILURE, "Failed to open checkpoint", checkpoint_path);
        }

        CheckpointHeader header;
        if (!read_value(file, header.magic) || !read_value(file, header.version) ||
            !read_value(file, header.step) || !read_value(file, header.warp_alpha)) {
            return core::make_error(core::ErrorCode::CORRUPTED_DATA, "Truncated checkpoint header", checkpoint_path);
        }
        if (header.magic != CHECKPOINT_MAGIC) {
            return core::make_error(core::ErrorCode::CORRUPTED_DATA, "Invalid checkpoint: wrong magic", checkpoint_path);
        }
        if (header.version > CHECKPOINT_VERSION) {
            return core::make_error(core::ErrorCode::CORRUPTED_DATA,
                                    std::format("Unsupported checkpoint version {}", header.version), checkpoint_path);
        }

        rendering::ModelState state;
        state.step = header.step;
        state.warp_alpha = header.warp_alpha;
        if (!read_string(file, state.model_type, MAX_MODEL_TYPE_LENGTH)) {
            return core::make_error(core::ErrorCode::CORRUPTED_DATA, "Bad model type in checkpoint", checkpoint_path);
        }

        const auto consumed = static_cast<uint64_t>(file.tellg());
        auto arrays = read_tagged_arrays(file, file_size - std::min<uint64_t>(file_size, consumed), checkpoint_path);
        if (!arrays) {
            return std::unexpected(arrays.error());
        }
        state.params = std::move(*arrays);

        LOG_DEBUG("Loaded checkpoint {} (model '{}', step {}, warp_alpha {})",
                  core::path_to_utf8(checkpoint_path), state.model_type, state.step, state.warp_alpha);
        return state;
    }

    core::Result<rendering::ModelState> restore_checkpoint(const std::filesystem::path& checkpoint_dir) {
        LOG_INFO("Restoring checkpoint from {}", core::path_to_utf8(checkpoint_dir));

        auto path = latest_checkpoint(checkpoint_dir);
        if (!path) {
            return std::unexpected(path.error());
        }
        return load_checkpoint(*path);
    }

} // namespace nps::io
