/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/path_utils.hpp"
#include <expected>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>

namespace nps::core {

    /// Error codes shared by every module. Ranges group related failures.
    enum class ErrorCode {
        SUCCESS = 0,

        // Filesystem (100-199)
        PATH_NOT_FOUND = 100,
        NOT_A_DIRECTORY = 101,
        NOT_A_FILE = 102,
        PERMISSION_DENIED = 103,

        // Validation (200-299)
        INVALID_DATASET = 200,
        EMPTY_DATASET = 201,
        CORRUPTED_DATA = 202,
        UNSUPPORTED_FORMAT = 203,
        INVALID_CONFIG = 204,
        INVALID_ARGUMENT = 205,
        INVALID_CAMERA = 206,

        // Save/Export (300-399)
        WRITE_FAILURE = 300,

        // Load/Import (400-499)
        READ_FAILURE = 400,

        // Execution (500-599)
        DEVICE_MISMATCH = 500,
        RENDER_FAILED = 501,
        INTERNAL_ERROR = 502,
    };

    constexpr std::string_view error_code_to_string(const ErrorCode code) {
        switch (code) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::PATH_NOT_FOUND: return "Path not found";
        case ErrorCode::NOT_A_DIRECTORY: return "Not a directory";
        case ErrorCode::NOT_A_FILE: return "Not a file";
        case ErrorCode::PERMISSION_DENIED: return "Permission denied";
        case ErrorCode::INVALID_DATASET: return "Invalid dataset";
        case ErrorCode::EMPTY_DATASET: return "Empty dataset";
        case ErrorCode::CORRUPTED_DATA: return "Corrupted data";
        case ErrorCode::UNSUPPORTED_FORMAT: return "Unsupported format";
        case ErrorCode::INVALID_CONFIG: return "Invalid config";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::INVALID_CAMERA: return "Invalid camera";
        case ErrorCode::WRITE_FAILURE: return "Write failed";
        case ErrorCode::READ_FAILURE: return "Read failed";
        case ErrorCode::DEVICE_MISMATCH: return "Device mismatch";
        case ErrorCode::RENDER_FAILED: return "Render failed";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
        }
    }

    /// Structured error with code, message, and optional path
    struct Error {
        ErrorCode code;
        std::string message;
        std::filesystem::path path;

        Error(ErrorCode c, std::string msg)
            : code(c),
              message(std::move(msg)) {}

        Error(ErrorCode c, std::string msg, std::filesystem::path p)
            : code(c),
              message(std::move(msg)),
              path(std::move(p)) {}

        [[nodiscard]] std::string format() const {
            if (path.empty()) {
                return std::format("[{}] {}", error_code_to_string(code), message);
            }
            return std::format("[{}] {}: {}", error_code_to_string(code), message, path_to_utf8(path));
        }
    };

    template <typename T>
    using Result = std::expected<T, Error>;

    inline std::unexpected<Error> make_error(ErrorCode code, std::string message) {
        return std::unexpected(Error{code, std::move(message)});
    }

    inline std::unexpected<Error> make_error(ErrorCode code, std::string message,
                                             const std::filesystem::path& path) {
        return std::unexpected(Error{code, std::move(message), path});
    }

} // namespace nps::core
