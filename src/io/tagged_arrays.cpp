/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/tagged_arrays.hpp"
#include <algorithm>
#include <format>

namespace nps::io {

    namespace {
        constexpr uint8_t DTYPE_FLOAT32 = 1;
        constexpr uint32_t MAX_TAG_LENGTH = 1024;
        constexpr uint32_t MAX_NDIM = 8;
    } // namespace

    void write_string(std::ostream& os, const std::string& value) {
        const auto len = static_cast<uint32_t>(value.size());
        write_value(os, len);
        os.write(value.data(), len);
    }

    bool read_string(std::istream& is, std::string& value, const uint32_t max_length) {
        uint32_t len = 0;
        if (!read_value(is, len) || len > max_length) {
            return false;
        }
        value.assign(len, '\0');
        is.read(value.data(), len);
        return static_cast<bool>(is);
    }

    void write_tagged_arrays(std::ostream& os, const TaggedArrays& arrays) {
        write_value(os, static_cast<uint32_t>(arrays.size()));

        for (const auto& [tag, array] : arrays) {
            write_string(os, tag);
            write_value(os, DTYPE_FLOAT32);
            write_value(os, static_cast<uint32_t>(array.shape.size()));
            for (const int64_t dim : array.shape) {
                write_value(os, dim);
            }
            os.write(reinterpret_cast<const char*>(array.data.data()),
                     static_cast<std::streamsize>(array.data.size() * sizeof(float)));
        }
    }

    core::Result<TaggedArrays> read_tagged_arrays(std::istream& is,
                                                  const uint64_t available,
                                                  const std::filesystem::path& source) {
        const auto corrupt = [&source](const std::string& what) {
            return core::make_error(core::ErrorCode::CORRUPTED_DATA, what, source);
        };

        const auto start = is.tellg();
        const auto consumed = [&is, start]() -> uint64_t {
            const auto pos = is.tellg();
            return pos >= start ? static_cast<uint64_t>(pos - start) : 0;
        };

        uint32_t count = 0;
        if (!read_value(is, count)) {
            return corrupt("Truncated array table");
        }

        TaggedArrays arrays;
        for (uint32_t i = 0; i < count; ++i) {
            std::string tag;
            if (!read_string(is, tag, MAX_TAG_LENGTH)) {
                return corrupt(std::format("Bad tag for array {}", i));
            }

            uint8_t dtype = 0;
            uint32_t ndim = 0;
            if (!read_value(is, dtype) || !read_value(is, ndim)) {
                return corrupt(std::format("Truncated header of '{}'", tag));
            }
            if (dtype != DTYPE_FLOAT32) {
                return corrupt(std::format("Unsupported dtype {} for '{}'", dtype, tag));
            }
            if (ndim == 0 || ndim > MAX_NDIM) {
                return corrupt(std::format("Bad rank {} for '{}'", ndim, tag));
            }

            rendering::ParamArray array;
            array.shape.resize(ndim);
            uint64_t numel = 1;
            for (auto& dim : array.shape) {
                if (!read_value(is, dim) || dim < 0 || static_cast<uint64_t>(dim) > available) {
                    return corrupt(std::format("Bad shape for '{}'", tag));
                }
                numel *= static_cast<uint64_t>(dim);
                if (numel > available) {
                    return corrupt(std::format("Shape of '{}' exceeds the data size", tag));
                }
            }

            const uint64_t bytes = numel * sizeof(float);
            if (bytes > available - std::min(available, consumed())) {
                return corrupt(std::format("'{}' claims {} bytes past the end of the data", tag, bytes));
            }

            array.data.resize(static_cast<size_t>(numel));
            is.read(reinterpret_cast<char*>(array.data.data()), static_cast<std::streamsize>(bytes));
            if (!is) {
                return corrupt(std::format("Truncated data of '{}'", tag));
            }

            if (!arrays.emplace(std::move(tag), std::move(array)).second) {
                return corrupt(std::format("Duplicate array tag in entry {}", i));
            }
        }
        return arrays;
    }

} // namespace nps::io
