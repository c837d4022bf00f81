/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/frame_writer.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace nps;

TEST(FrameWriterTest, FramePathUsesZeroPaddedIndex) {
    EXPECT_EQ(io::frame_path("out", 0), std::filesystem::path("out") / "0000.jpg");
    EXPECT_EQ(io::frame_path("out", 42), std::filesystem::path("out") / "0042.jpg");
    EXPECT_EQ(io::frame_path("out", 12345), std::filesystem::path("out") / "12345.jpg");
}

TEST(FrameWriterTest, ColorsAreClippedAndTruncated) {
    const std::vector<glm::vec3> rgb = {glm::vec3(0.0f, 1.0f, 0.5f), glm::vec3(-0.2f, 1.7f, 0.999f)};
    const auto pixels = io::image_to_uint8(rgb);
    EXPECT_EQ(pixels, (std::vector<uint8_t>{0, 255, 127, 0, 255, 254}));
}

TEST(FrameWriterTest, WritesJpeg) {
    test::TempDir dir("frames");
    const std::vector<glm::vec3> rgb(6 * 4, glm::vec3(0.25f, 0.5f, 0.75f));
    const auto path = io::frame_path(dir.path(), 3);

    const auto written = io::write_frame(path, rgb, 6, 4);
    ASSERT_TRUE(written.has_value()) << written.error().format();
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_GT(std::filesystem::file_size(path), 0u);
}

TEST(FrameWriterTest, PixelCountMustMatchSize) {
    test::TempDir dir("frames");
    const std::vector<glm::vec3> rgb(5, glm::vec3(0.0f));
    const auto path = io::frame_path(dir.path(), 0);

    const auto written = io::write_frame(path, rgb, 3, 2);
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, core::ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(std::filesystem::exists(path));
}
