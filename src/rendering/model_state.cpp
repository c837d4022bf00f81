/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/model_state.hpp"

namespace nps::rendering {

    size_t ParamArray::numel() const {
        if (shape.empty()) {
            return 0;
        }
        size_t n = 1;
        for (const auto dim : shape) {
            if (dim < 0) {
                return 0;
            }
            n *= static_cast<size_t>(dim);
        }
        return n;
    }

    const ParamArray* ModelState::find(const std::string_view name) const {
        const auto it = params.find(name);
        return it != params.end() ? &it->second : nullptr;
    }

    ReplicatedState ReplicatedState::replicate(std::shared_ptr<const ModelState> state, const size_t replica_count) {
        ReplicatedState replicated;
        if (!state) {
            return replicated;
        }
        replicated.replicas_.assign(replica_count, std::move(state));
        return replicated;
    }

} // namespace nps::rendering
