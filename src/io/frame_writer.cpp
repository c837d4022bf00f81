/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/frame_writer.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <OpenImageIO/imageio.h>
#include <algorithm>
#include <format>

namespace nps::io {

    std::filesystem::path frame_path(const std::filesystem::path& output_dir, const size_t index) {
        return output_dir / std::format("{:04d}.jpg", index);
    }

    std::vector<uint8_t> image_to_uint8(const std::span<const glm::vec3> rgb) {
        std::vector<uint8_t> pixels;
        pixels.reserve(rgb.size() * 3);
        for (const auto& c : rgb) {
            for (int ch = 0; ch < 3; ++ch) {
                pixels.push_back(static_cast<uint8_t>(std::clamp(c[ch], 0.0f, 1.0f) * 255.0f));
            }
        }
        return pixels;
    }

    core::Result<void> write_frame(const std::filesystem::path& path,
                                   const std::span<const glm::vec3> rgb,
                                   const int width,
                                   const int height) {
        if (width <= 0 || height <= 0 ||
            rgb.size() != static_cast<size_t>(width) * static_cast<size_t>(height)) {
            return core::make_error(core::ErrorCode::INVALID_ARGUMENT,
                                    std::format("Frame has {} pixels, expected {}x{}", rgb.size(), width, height), path);
        }

        const auto pixels = image_to_uint8(rgb);
        const std::string filename = core::path_to_utf8(path);

        auto out = OIIO::ImageOutput::create(filename);
        if (!out) {
            return core::make_error(core::ErrorCode::UNSUPPORTED_FORMAT,
                                    std::format("No image writer: {}", OIIO::geterror()), path);
        }

        const OIIO::ImageSpec spec(width, height, 3, OIIO::TypeDesc::UINT8);
        if (!out->open(filename, spec)) {
            return core::make_error(core::ErrorCode::WRITE_FAILURE,
                                    std::format("Cannot open image: {}", out->geterror()), path);
        }
        if (!out->write_image(OIIO::TypeDesc::UINT8, pixels.data())) {
            const std::string error = out->geterror();
            out->close();
            return core::make_error(core::ErrorCode::WRITE_FAILURE, std::format("Cannot write image: {}", error), path);
        }
        if (!out->close()) {
            return core::make_error(core::ErrorCode::WRITE_FAILURE,
                                    std::format("Cannot finish image: {}", out->geterror()), path);
        }

        LOG_TRACE("Wrote frame {}", filename);
        return {};
    }

} // namespace nps::io
