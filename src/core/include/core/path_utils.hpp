/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <filesystem>
#include <fstream>
#include <string>

namespace nps::core {

    // Paths are handed to spdlog, nlohmann and OpenImageIO as UTF-8 strings.
    // On the POSIX platforms we build for, the native encoding already is UTF-8.
    inline std::string path_to_utf8(const std::filesystem::path& p) {
        return p.string();
    }

    inline std::filesystem::path utf8_to_path(const std::string& utf8_str) {
        return std::filesystem::path(utf8_str);
    }

    inline bool open_file_for_read(const std::filesystem::path& p, std::ios::openmode mode, std::ifstream& file) {
        file.open(p, mode | std::ios::in);
        return file.is_open();
    }

    inline bool open_file_for_read(const std::filesystem::path& p, std::ifstream& file) {
        return open_file_for_read(p, std::ios::in, file);
    }

    inline bool open_file_for_write(const std::filesystem::path& p, std::ios::openmode mode, std::ofstream& file) {
        file.open(p, mode | std::ios::out | std::ios::trunc);
        return file.is_open();
    }

    inline bool open_file_for_write(const std::filesystem::path& p, std::ofstream& file) {
        return open_file_for_write(p, std::ios::out, file);
    }

    /// "<dir>/<stem><suffix><extension>" beside the given file, e.g. points.npc -> points_o3d.pcd
    inline std::filesystem::path sibling_path(const std::filesystem::path& p,
                                              const std::string& suffix,
                                              const std::string& extension) {
        auto result = p.parent_path() / (p.stem().string() + suffix);
        result += extension;
        return result;
    }

} // namespace nps::core
