/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace nps::rendering {

    /// Dense float parameter array, row-major.
    struct ParamArray {
        std::vector<int64_t> shape;
        std::vector<float> data;

        size_t numel() const;
        bool is_consistent() const { return numel() == data.size(); }

        bool operator==(const ParamArray&) const = default;
    };

    /**
     * @brief Restored model parameters plus the scalar schedule values.
     *
     * Never mutated once restored; evaluation only reads it.
     */
    struct ModelState {
        std::string model_type;
        std::map<std::string, ParamArray, std::less<>> params;
        float warp_alpha = 0.0f;
        int64_t step = 0;

        const ParamArray* find(std::string_view name) const;

        bool operator==(const ModelState&) const = default;
    };

    /**
     * @brief One read-only ModelState copy per compute device.
     *
     * Replicas share ownership of an immutable state, so replication costs no copies.
     */
    class ReplicatedState {
    public:
        ReplicatedState() = default;

        // A null state yields no replicas
        static ReplicatedState replicate(std::shared_ptr<const ModelState> state, size_t replica_count);

        size_t replica_count() const { return replicas_.size(); }
        bool empty() const { return replicas_.empty(); }

        const ModelState& replica(size_t device_index) const { return *replicas_.at(device_index); }

        // Replica 0; the values every device agrees on. Requires !empty()
        const ModelState& host() const { return *replicas_.front(); }

        float warp_alpha() const { return host().warp_alpha; }
        int64_t step() const { return host().step; }

    private:
        std::vector<std::shared_ptr<const ModelState>> replicas_;
    };

} // namespace nps::rendering
