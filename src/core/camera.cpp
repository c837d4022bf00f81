/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/camera.hpp"
#include <cmath>

namespace nps::core {

    namespace {
        constexpr int UNDISTORT_MAX_ITERATIONS = 10;
        constexpr float UNDISTORT_EPS = 1e-9f;

        // Inverts the distortion model with Newton steps on the 2D residual.
        glm::vec2 radial_and_tangential_undistort(const glm::vec2& distorted,
                                                  const glm::vec3& k,
                                                  const glm::vec2& p) {
            float x = distorted.x;
            float y = distorted.y;

            for (int i = 0; i < UNDISTORT_MAX_ITERATIONS; ++i) {
                const float r = x * x + y * y;
                const float d = 1.0f + r * (k.x + r * (k.y + k.z * r));

                const float fx = d * x + 2.0f * p.x * x * y + p.y * (r + 2.0f * x * x) - distorted.x;
                const float fy = d * y + 2.0f * p.y * x * y + p.x * (r + 2.0f * y * y) - distorted.y;

                const float d_r = k.x + r * (2.0f * k.y + 3.0f * k.z * r);
                const float d_x = 2.0f * x * d_r;
                const float d_y = 2.0f * y * d_r;

                const float fx_x = d + d_x * x + 2.0f * p.x * y + 6.0f * p.y * x;
                const float fx_y = d_y * x + 2.0f * p.x * x + 2.0f * p.y * y;
                const float fy_x = d_x * y + 2.0f * p.y * y + 2.0f * p.x * x;
                const float fy_y = d + d_y * y + 2.0f * p.y * x + 6.0f * p.x * y;

                const float denominator = fy_x * fx_y - fx_x * fy_y;
                if (std::abs(denominator) <= UNDISTORT_EPS) {
                    break;
                }
                x += (fx * fy_y - fy * fx_y) / denominator;
                y += (fy * fx_x - fx * fy_x) / denominator;
            }
            return {x, y};
        }
    } // namespace

    Camera::Camera(const glm::mat3& orientation,
                   const glm::vec3& position,
                   const float focal_length,
                   const glm::vec2& principal_point,
                   const glm::ivec2& image_size,
                   const float skew,
                   const float pixel_aspect_ratio,
                   const glm::vec3& radial_distortion,
                   const glm::vec2& tangential_distortion)
        : _orientation(orientation),
          _position(position),
          _focal_length(focal_length),
          _principal_point(principal_point),
          _image_size(image_size),
          _skew(skew),
          _pixel_aspect_ratio(pixel_aspect_ratio),
          _radial_distortion(radial_distortion),
          _tangential_distortion(tangential_distortion) {}

    Camera Camera::scale(const float factor) const {
        const glm::ivec2 new_size(static_cast<int>(std::nearbyint(static_cast<float>(_image_size.x) * factor)),
                                  static_cast<int>(std::nearbyint(static_cast<float>(_image_size.y) * factor)));
        return Camera(_orientation, _position,
                      _focal_length * factor,
                      _principal_point * factor,
                      new_size,
                      _skew,
                      _pixel_aspect_ratio,
                      _radial_distortion,
                      _tangential_distortion);
    }

    glm::vec3 Camera::pixel_to_local_ray(const glm::vec2& pixel) const {
        const float y = (pixel.y - _principal_point.y) / scale_factor_y();
        const float x = (pixel.x - _principal_point.x - y * _skew) / scale_factor_x();

        glm::vec2 xy(x, y);
        if (has_radial_distortion() || has_tangential_distortion()) {
            xy = radial_and_tangential_undistort(xy, _radial_distortion, _tangential_distortion);
        }
        return glm::normalize(glm::vec3(xy, 1.0f));
    }

    glm::vec3 Camera::pixel_to_ray(const glm::vec2& pixel) const {
        return glm::normalize(glm::transpose(_orientation) * pixel_to_local_ray(pixel));
    }

} // namespace nps::core
