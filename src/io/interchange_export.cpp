/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/interchange_export.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include "io/point_cloud_container.hpp"
#include "io/tagged_arrays.hpp"
#include <algorithm>
#include <bit>
#include <cmath>
#include <format>
#include <fstream>

namespace nps::io {

    namespace {
        constexpr const char* INTERCHANGE_SUFFIX = "_o3d";

        core::Result<std::ofstream> open_output(const std::filesystem::path& path, const core::PointCloud& cloud) {
            if (!cloud.is_consistent()) {
                return core::make_error(core::ErrorCode::INVALID_ARGUMENT,
                                        std::format("verts ({}) and rgb ({}) differ in length", cloud.verts.size(), cloud.rgb.size()));
            }
            std::ofstream file;
            if (!core::open_file_for_write(path, std::ios::binary, file)) {
                return core::make_error(core::ErrorCode::WRITE_FAILURE, "Cannot open file for writing", path);
            }
            return file;
        }

        core::Result<void> finish(std::ofstream& file, const std::filesystem::path& path, const size_t points) {
            file.flush();
            if (!file) {
                return core::make_error(core::ErrorCode::WRITE_FAILURE, "Write failed", path);
            }
            LOG_INFO("Exported {} points to {}", points, core::path_to_utf8(path));
            return {};
        }
    } // namespace

    bool colors_are_normalized(const core::PointCloud& cloud) {
        return std::ranges::all_of(cloud.rgb, [](const glm::vec3& c) {
            return c.r <= 1.0f && c.g <= 1.0f && c.b <= 1.0f;
        });
    }

    std::array<uint8_t, 3> color_to_rgb8(const glm::vec3& color, const bool normalized) {
        const float scale = normalized ? 255.0f : 1.0f;
        std::array<uint8_t, 3> out{};
        for (int ch = 0; ch < 3; ++ch) {
            const float value = std::round(color[ch] * scale);
            out[static_cast<size_t>(ch)] = static_cast<uint8_t>(std::clamp(value, 0.0f, 255.0f));
        }
        return out;
    }

    core::Result<void> write_pcd(const std::filesystem::path& path, const core::PointCloud& cloud) {
        auto file = open_output(path, cloud);
        if (!file) {
            return std::unexpected(file.error());
        }

        const size_t n = cloud.size();
        *file << "# .PCD v0.7 - Point Cloud Data file format\n"
              << "VERSION 0.7\n"
              << "FIELDS x y z rgb\n"
              << "SIZE 4 4 4 4\n"
              << "TYPE F F F F\n"
              << "COUNT 1 1 1 1\n"
              << "WIDTH " << n << "\n"
              << "HEIGHT 1\n"
              << "VIEWPOINT 0 0 0 1 0 0 0\n"
              << "POINTS " << n << "\n"
              << "DATA binary\n";

        const bool normalized = colors_are_normalized(cloud);
        for (size_t i = 0; i < n; ++i) {
            const auto rgb8 = color_to_rgb8(cloud.rgb[i], normalized);
            const uint32_t packed = (static_cast<uint32_t>(rgb8[0]) << 16) |
                                    (static_cast<uint32_t>(rgb8[1]) << 8) |
                                    static_cast<uint32_t>(rgb8[2]);
            write_value(*file, cloud.verts[i].x);
            write_value(*file, cloud.verts[i].y);
            write_value(*file, cloud.verts[i].z);
            write_value(*file, std::bit_cast<float>(packed));
        }
        return finish(*file, path, n);
    }

    core::Result<void> write_ply(const std::filesystem::path& path, const core::PointCloud& cloud) {
        auto file = open_output(path, cloud);
        if (!file) {
            return std::unexpected(file.error());
        }

        const size_t n = cloud.size();
        *file << "ply\n"
              << "format binary_little_endian 1.0\n"
              << "comment NeuralPseudoScan point cloud\n"
              << "element vertex " << n << "\n"
              << "property float x\n"
              << "property float y\n"
              << "property float z\n"
              << "property uchar red\n"
              << "property uchar green\n"
              << "property uchar blue\n"
              << "end_header\n";

        const bool normalized = colors_are_normalized(cloud);
        for (size_t i = 0; i < n; ++i) {
            const auto rgb8 = color_to_rgb8(cloud.rgb[i], normalized);
            write_value(*file, cloud.verts[i].x);
            write_value(*file, cloud.verts[i].y);
            write_value(*file, cloud.verts[i].z);
            file->write(reinterpret_cast<const char*>(rgb8.data()), 3);
        }
        return finish(*file, path, n);
    }

    core::Result<void> export_point_cloud(const std::filesystem::path& path,
                                          const core::PointCloud& cloud,
                                          const core::param::InterchangeFormat format) {
        switch (format) {
        case core::param::InterchangeFormat::PLY: return write_ply(path, cloud);
        case core::param::InterchangeFormat::PCD: return write_pcd(path, cloud);
        }
        return core::make_error(core::ErrorCode::UNSUPPORTED_FORMAT, "Unknown interchange format", path);
    }

    std::filesystem::path interchange_path(const std::filesystem::path& container_path,
                                           const core::param::InterchangeFormat format) {
        return core::sibling_path(container_path, INTERCHANGE_SUFFIX, core::param::interchange_extension(format));
    }

    core::Result<std::filesystem::path> convert_point_cloud(const core::param::ExportParameters& params) {
        LOG_TIMER("convert_point_cloud");

        auto cloud = read_point_cloud_container(params.point_cloud_path);
        if (!cloud) {
            return std::unexpected(cloud.error());
        }

        if (params.drop_degenerate) {
            *cloud = core::filter_degenerate_points(*cloud);
        }

        const auto output = interchange_path(params.point_cloud_path, params.format);
        if (auto written = export_point_cloud(output, *cloud, params.format); !written) {
            return std::unexpected(written.error());
        }
        return output;
    }

} // namespace nps::io
