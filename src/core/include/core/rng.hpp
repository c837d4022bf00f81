/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace nps::core {

    /// Counter-free random key. A key never advances; new streams are derived
    /// from it with split(), so the same seed always yields the same streams.
    struct RngKey {
        uint64_t value = 0;

        bool operator==(const RngKey&) const = default;
    };

    RngKey make_rng_key(uint64_t seed);

    /// Derives n independent keys from one key. Deterministic in (key, n).
    std::vector<RngKey> split(RngKey key, size_t n);

    /// Mixes extra data (e.g. a host index) into a key.
    RngKey fold_in(RngKey key, uint64_t data);

    /// Generator seeded from a key, for consumers that draw samples.
    std::mt19937_64 make_generator(RngKey key);

} // namespace nps::core
