/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/point_cloud_container.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include "io/tagged_arrays.hpp"
#include <format>
#include <fstream>

namespace nps::io {

    namespace {
        constexpr uint32_t CONTAINER_MAGIC = 0x4353504E; // "NPSC"
        constexpr uint32_t CONTAINER_VERSION = 1;

        rendering::ParamArray pack_vec3(const std::vector<glm::vec3>& values) {
            rendering::ParamArray array;
            array.shape = {static_cast<int64_t>(values.size()), 3};
            array.data.reserve(values.size() * 3);
            for (const auto& v : values) {
                array.data.insert(array.data.end(), {v.x, v.y, v.z});
            }
            return array;
        }

        std::vector<glm::vec3> unpack_vec3(const rendering::ParamArray& array) {
            std::vector<glm::vec3> values;
            values.reserve(array.data.size() / 3);
            for (size_t i = 0; i + 2 < array.data.size(); i += 3) {
                values.emplace_back(array.data[i], array.data[i + 1], array.data[i + 2]);
            }
            return values;
        }

        bool is_vec3_array(const rendering::ParamArray& array) {
            return array.shape.size() == 2 && array.shape[1] == 3 && array.is_consistent();
        }
    } // namespace

    core::Result<void> write_point_cloud_container(const std::filesystem::path& path,
                                                   const core::PointCloud& cloud) {
        if (!cloud.is_consistent()) {
            return core::make_error(core::ErrorCode::INVALID_ARGUMENT,
                                    std::format("verts ({}) and rgb ({}) differ in length", cloud.verts.size(), cloud.rgb.size()));
        }

        std::ofstream file;
        if (!core::open_file_for_write(path, std::ios::binary, file)) {
            return core::make_error(core::ErrorCode::WRITE_FAILURE, "Cannot open point cloud for writing", path);
        }

        TaggedArrays arrays;
        arrays.emplace(CONTAINER_KEY_VERTS, pack_vec3(cloud.verts));
        arrays.emplace(CONTAINER_KEY_RGB, pack_vec3(cloud.rgb));

        write_value(file, CONTAINER_MAGIC);
        write_value(file, CONTAINER_VERSION);
        write_tagged_arrays(file, arrays);
        file.flush();

        if (!file) {
            return core::make_error(core::ErrorCode::WRITE_FAILURE, "Failed writing point cloud", path);
        }

        LOG_INFO("Saved point cloud: {} ({} points)", core::path_to_utf8(path), cloud.size());
        return {};
    }

    core::Result<core::PointCloud> read_point_cloud_container(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return core::make_error(core::ErrorCode::PATH_NOT_FOUND, "Point cloud not found", path);
        }
        if (!std::filesystem::is_regular_file(path, ec)) {
            return core::make_error(core::ErrorCode::NOT_A_FILE, "Point cloud path is not a file", path);
        }
        const auto file_size = std::filesystem::file_size(path, ec);
        if (ec) {
            return core::make_error(core::ErrorCode::READ_FAILURE, ec.message(), path);
        }

        std::ifstream file;
        if (!core::open_file_for_read(path, std::ios::binary, file)) {
            return core::make_error(core::ErrorCode::READ_FAILURE, "Cannot open point cloud", path);
        }

        uint32_t magic = 0;
        uint32_t version = 0;
        if (!read_value(file, magic) || !read_value(file, version)) {
            return core::make_error(core::ErrorCode::CORRUPTED_DATA, "Truncated point cloud header", path);
        }
        if (magic != CONTAINER_MAGIC) {
            return core::make_error(core::ErrorCode::CORRUPTED_DATA, "Not a point cloud container (wrong magic)", path);
        }
        if (version > CONTAINER_VERSION) {
            return core::make_error(core::ErrorCode::CORRUPTED_DATA,
                                    std::format("Unsupported container version {}", version), path);
        }

        constexpr uint64_t HEADER_BYTES = sizeof(magic) + sizeof(version);
        auto arrays = read_tagged_arrays(file, file_size - HEADER_BYTES, path);
        if (!arrays) {
            return std::unexpected(arrays.error());
        }

        const auto verts = arrays->find(CONTAINER_KEY_VERTS);
        const auto rgb = arrays->find(CONTAINER_KEY_RGB);
        if (verts == arrays->end() || rgb == arrays->end()) {
            return core::make_error(core::ErrorCode::CORRUPTED_DATA,
                                    std::format("Container lacks '{}' or '{}'", CONTAINER_KEY_VERTS, CONTAINER_KEY_RGB), path);
        }
        if (!is_vec3_array(verts->second) || !is_vec3_array(rgb->second) ||
            verts->second.shape[0] != rgb->second.shape[0]) {
            return core::make_error(core::ErrorCode::CORRUPTED_DATA,
                                    "verts and rgb must be equal-length [N,3] arrays", path);
        }

        core::PointCloud cloud(unpack_vec3(verts->second), unpack_vec3(rgb->second));
        LOG_DEBUG("Loaded point cloud: {} ({} points)", core::path_to_utf8(path), cloud.size());
        return cloud;
    }

} // namespace nps::io
