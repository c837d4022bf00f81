/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>

namespace nps::core {

    /**
     * @brief Pinhole camera with skew, pixel aspect ratio and Brown-Conrady distortion.
     *
     * The orientation is the world-to-camera rotation: a world point X maps to camera
     * coordinates as orientation * (X - position). Camera space looks down +z, with
     * +x to the right and +y down the image.
     */
    class Camera {
    public:
        Camera() = default;

        Camera(const glm::mat3& orientation,
               const glm::vec3& position,
               float focal_length,
               const glm::vec2& principal_point,
               const glm::ivec2& image_size,
               float skew = 0.0f,
               float pixel_aspect_ratio = 1.0f,
               const glm::vec3& radial_distortion = glm::vec3(0.0f),
               const glm::vec2& tangential_distortion = glm::vec2(0.0f));

        const glm::mat3& orientation() const noexcept { return _orientation; }
        const glm::vec3& position() const noexcept { return _position; }
        void set_position(const glm::vec3& position) noexcept { _position = position; }

        float focal_length() const noexcept { return _focal_length; }
        const glm::vec2& principal_point() const noexcept { return _principal_point; }
        float skew() const noexcept { return _skew; }
        float pixel_aspect_ratio() const noexcept { return _pixel_aspect_ratio; }
        const glm::vec3& radial_distortion() const noexcept { return _radial_distortion; }
        const glm::vec2& tangential_distortion() const noexcept { return _tangential_distortion; }

        int image_width() const noexcept { return _image_size.x; }
        int image_height() const noexcept { return _image_size.y; }

        float scale_factor_x() const noexcept { return _focal_length; }
        float scale_factor_y() const noexcept { return _focal_length * _pixel_aspect_ratio; }

        bool has_radial_distortion() const noexcept { return glm::any(glm::notEqual(_radial_distortion, glm::vec3(0.0f))); }
        bool has_tangential_distortion() const noexcept { return glm::any(glm::notEqual(_tangential_distortion, glm::vec2(0.0f))); }

        /// Resolution change: focal length, principal point and image size scale together.
        Camera scale(float factor) const;

        /// Unit ray direction in camera space for a pixel coordinate (pixel centers at +0.5).
        glm::vec3 pixel_to_local_ray(const glm::vec2& pixel) const;

        /// Unit ray direction in world space for a pixel coordinate.
        glm::vec3 pixel_to_ray(const glm::vec2& pixel) const;

    private:
        glm::mat3 _orientation{1.0f};
        glm::vec3 _position{0.0f};
        float _focal_length = 0.0f;
        glm::vec2 _principal_point{0.0f};
        glm::ivec2 _image_size{0};
        float _skew = 0.0f;
        float _pixel_aspect_ratio = 1.0f;
        glm::vec3 _radial_distortion{0.0f};
        glm::vec2 _tangential_distortion{0.0f};
    };

} // namespace nps::core
