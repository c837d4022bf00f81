/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "rendering/model_state.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <map>
#include <ostream>
#include <string>

namespace nps::io {

    using TaggedArrays = std::map<std::string, rendering::ParamArray, std::less<>>;

    /**
     * Stream layout, native little endian:
     *   uint32 count
     *   count x { uint32 tag_len, char tag[tag_len], uint8 dtype (1 = float32),
     *             uint32 ndim, int64 shape[ndim], float32 data[prod(shape)] }
     */
    void write_tagged_arrays(std::ostream& os, const TaggedArrays& arrays);

    /**
     * @param available Bytes left in the stream; entries claiming more data are rejected
     * @param source File name for error messages
     * @return CORRUPTED_DATA on truncation or malformed entries
     */
    core::Result<TaggedArrays> read_tagged_arrays(std::istream& is,
                                                  uint64_t available,
                                                  const std::filesystem::path& source);

    // Raw value helpers for the fixed headers that precede the arrays
    template <typename T>
    void write_value(std::ostream& os, const T& value) {
        os.write(reinterpret_cast<const char*>(&value), sizeof(T));
    }

    template <typename T>
    bool read_value(std::istream& is, T& value) {
        is.read(reinterpret_cast<char*>(&value), sizeof(T));
        return static_cast<bool>(is);
    }

    void write_string(std::ostream& os, const std::string& value);
    bool read_string(std::istream& is, std::string& value, uint32_t max_length);

} // namespace nps::io
