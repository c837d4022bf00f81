/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/rng.hpp"
#include "rendering/compute_device.hpp"
#include "rendering/model_state.hpp"
#include "rendering/ray_batch.hpp"
#include "rendering/render_output.hpp"
#include "rendering/scene_model.hpp"
#include <cstddef>
#include <memory>
#include <vector>

namespace nps::rendering {

    /**
     * @brief Data-parallel evaluation of a scene model over a full image of rays.
     *
     * Rays are flattened and processed in chunks. Each chunk is edge-padded to a
     * multiple of the device count, split into contiguous equal shards (shard i goes
     * to device i), evaluated concurrently, and gathered back in device order with the
     * padding removed. The result has the input's [H,W] shape and pixel order, and does
     * not depend on the chunk size.
     *
     * Per call, the base key is split into three; the second and third keys are each
     * split once more per device to give every device its own coarse and fine stream.
     */
    class DistributedRenderExecutor {
    public:
        DistributedRenderExecutor(std::shared_ptr<const ISceneModel> model,
                                  std::vector<ComputeDevice> devices,
                                  size_t chunk);

        /**
         * @brief Render every ray of the batch.
         * @return DEVICE_MISMATCH if the state is not replicated once per device,
         *         INVALID_CAMERA for malformed batches, RENDER_FAILED if any device fails.
         */
        [[nodiscard]] core::Result<RenderOutput> render(const ReplicatedState& state,
                                                        const RayBatch& rays,
                                                        float warp_alpha,
                                                        core::RngKey rng) const;

        size_t device_count() const { return devices_.size(); }
        size_t chunk() const { return chunk_; }
        const std::vector<ComputeDevice>& devices() const { return devices_; }

    private:
        struct DeviceKeys {
            std::vector<core::RngKey> coarse;
            std::vector<core::RngKey> fine;
        };

        core::Result<RenderOutput> render_chunk(const ReplicatedState& state,
                                                RayBatch chunk_rays,
                                                float warp_alpha,
                                                const DeviceKeys& keys) const;

        std::shared_ptr<const ISceneModel> model_;
        std::vector<ComputeDevice> devices_;
        size_t chunk_;
    };

} // namespace nps::rendering
