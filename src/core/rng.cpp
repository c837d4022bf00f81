/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/rng.hpp"

namespace nps::core {

    namespace {
        constexpr uint64_t SPLIT_SALT = 0x9E3779B97F4A7C15ull;
        constexpr uint64_t FOLD_SALT = 0xD1B54A32D192ED03ull;

        std::seed_seq make_seed_seq(const uint64_t a, const uint64_t b) {
            return std::seed_seq{static_cast<uint32_t>(a), static_cast<uint32_t>(a >> 32),
                                 static_cast<uint32_t>(b), static_cast<uint32_t>(b >> 32)};
        }
    } // namespace

    RngKey make_rng_key(const uint64_t seed) {
        auto seq = make_seed_seq(seed, 0);
        std::mt19937_64 gen(seq);
        return RngKey{gen()};
    }

    std::vector<RngKey> split(const RngKey key, const size_t n) {
        auto seq = make_seed_seq(key.value, SPLIT_SALT);
        std::mt19937_64 gen(seq);

        std::vector<RngKey> keys;
        keys.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            keys.push_back(RngKey{gen()});
        }
        return keys;
    }

    RngKey fold_in(const RngKey key, const uint64_t data) {
        auto seq = make_seed_seq(key.value ^ FOLD_SALT, data);
        std::mt19937_64 gen(seq);
        return RngKey{gen()};
    }

    std::mt19937_64 make_generator(const RngKey key) {
        auto seq = make_seed_seq(key.value, 0);
        return std::mt19937_64(seq);
    }

} // namespace nps::core
