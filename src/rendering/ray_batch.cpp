/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/ray_batch.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace nps::rendering {

    bool RayBatch::is_consistent() const {
        const size_t n = origins.size();
        return directions.size() == n &&
               viewdirs.size() == n &&
               appearance.size() == n &&
               warp.size() == n &&
               static_cast<size_t>(height) * static_cast<size_t>(width) == n;
    }

    RayBatch RayBatch::slice(const size_t begin, const size_t end) const {
        const size_t b = std::min(begin, size());
        const size_t e = std::clamp(end, b, size());

        RayBatch out;
        out.height = e > b ? 1 : 0;
        out.width = static_cast<int>(e - b);
        out.origins.assign(origins.begin() + b, origins.begin() + e);
        out.directions.assign(directions.begin() + b, directions.begin() + e);
        out.viewdirs.assign(viewdirs.begin() + b, viewdirs.begin() + e);
        out.appearance.assign(appearance.begin() + b, appearance.begin() + e);
        out.warp.assign(warp.begin() + b, warp.begin() + e);
        return out;
    }

    size_t RayBatch::pad_to_multiple(const size_t multiple) {
        if (multiple == 0 || empty()) {
            return 0;
        }

        const size_t remainder = size() % multiple;
        if (remainder == 0) {
            return 0;
        }

        const size_t padding = multiple - remainder;
        origins.insert(origins.end(), padding, origins.back());
        directions.insert(directions.end(), padding, directions.back());
        viewdirs.insert(viewdirs.end(), padding, viewdirs.back());
        appearance.insert(appearance.end(), padding, appearance.back());
        warp.insert(warp.end(), padding, warp.back());

        height = 1;
        width = static_cast<int>(size());
        return padding;
    }

    core::Result<RayBatch> build_ray_batch(const core::Camera& camera) {
        const int width = camera.image_width();
        const int height = camera.image_height();

        if (width <= 0 || height <= 0) {
            return core::make_error(core::ErrorCode::INVALID_CAMERA,
                                    std::format("Camera yields no rays (image size {}x{})", width, height));
        }
        if (camera.focal_length() <= 0.0f) {
            return core::make_error(core::ErrorCode::INVALID_CAMERA,
                                    std::format("Camera focal length must be positive, got {}", camera.focal_length()));
        }

        const size_t num_rays = static_cast<size_t>(width) * static_cast<size_t>(height);

        RayBatch batch;
        batch.height = height;
        batch.width = width;
        batch.origins.assign(num_rays, camera.position());
        batch.directions.reserve(num_rays);
        batch.appearance.assign(num_rays, 0u);
        batch.warp.assign(num_rays, 0u);

        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                const glm::vec2 pixel(static_cast<float>(x) + 0.5f, static_cast<float>(y) + 0.5f);
                batch.directions.push_back(camera.pixel_to_ray(pixel));
            }
        }

        batch.viewdirs.reserve(num_rays);
        for (const auto& d : batch.directions) {
            batch.viewdirs.push_back(glm::normalize(d));
        }

        if (auto valid = validate_ray_batch(batch); !valid) {
            return std::unexpected(valid.error());
        }

        LOG_TRACE("Built {}x{} ray batch", width, height);
        return batch;
    }

    core::Result<void> validate_ray_batch(const RayBatch& batch) {
        if (batch.empty()) {
            return core::make_error(core::ErrorCode::INVALID_CAMERA, "Ray batch is empty");
        }
        if (!batch.is_consistent()) {
            return core::make_error(core::ErrorCode::INVALID_CAMERA,
                                    std::format("Ray batch arrays disagree with {}x{}: origins={}, directions={}, viewdirs={}, appearance={}, warp={}",
                                                batch.height, batch.width, batch.origins.size(), batch.directions.size(),
                                                batch.viewdirs.size(), batch.appearance.size(), batch.warp.size()));
        }

        const auto finite = [](const glm::vec3& v) {
            return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
        };
        if (!std::ranges::all_of(batch.origins, finite) || !std::ranges::all_of(batch.directions, finite)) {
            return core::make_error(core::ErrorCode::INVALID_CAMERA, "Ray batch contains non-finite values");
        }
        return {};
    }

} // namespace nps::rendering
