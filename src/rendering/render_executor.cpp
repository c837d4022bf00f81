/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/render_executor.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <exception>
#include <format>
#include <future>
#include <optional>

namespace nps::rendering {

    DistributedRenderExecutor::DistributedRenderExecutor(std::shared_ptr<const ISceneModel> model,
                                                         std::vector<ComputeDevice> devices,
                                                         const size_t chunk)
        : model_(std::move(model)),
          devices_(std::move(devices)),
          chunk_(std::max<size_t>(chunk, 1)) {}

    core::Result<RenderOutput> DistributedRenderExecutor::render(const ReplicatedState& state,
                                                                 const RayBatch& rays,
                                                                 const float warp_alpha,
                                                                 const core::RngKey rng) const {
        if (!model_) {
            return core::make_error(core::ErrorCode::INTERNAL_ERROR, "No scene model attached to the executor");
        }
        if (devices_.empty() || state.replica_count() != devices_.size()) {
            return core::make_error(core::ErrorCode::DEVICE_MISMATCH,
                                    std::format("Model state has {} replica(s) but {} device(s) are active",
                                                state.replica_count(), devices_.size()));
        }
        if (auto valid = validate_ray_batch(rays); !valid) {
            return std::unexpected(valid.error());
        }

        LOG_TIMER_DEBUG("DistributedRenderExecutor::render");

        const auto base_keys = core::split(rng, 3);
        const DeviceKeys keys{core::split(base_keys[1], devices_.size()),
                              core::split(base_keys[2], devices_.size())};

        const size_t num_rays = rays.size();
        RenderOutput gathered;

        for (size_t begin = 0; begin < num_rays; begin += chunk_) {
            const size_t end = std::min(begin + chunk_, num_rays);

            auto chunk_result = render_chunk(state, rays.slice(begin, end), warp_alpha, keys);
            if (!chunk_result) {
                return std::unexpected(chunk_result.error());
            }
            if (gathered.empty()) {
                gathered.reserve(num_rays, chunk_result->num_samples);
            }
            if (!gathered.append(*chunk_result)) {
                return core::make_error(core::ErrorCode::RENDER_FAILED,
                                        std::format("Sample count changed between chunks ({} vs {})",
                                                    gathered.num_samples, chunk_result->num_samples));
            }
        }

        gathered.height = rays.height;
        gathered.width = rays.width;
        return gathered;
    }

    core::Result<RenderOutput> DistributedRenderExecutor::render_chunk(const ReplicatedState& state,
                                                                       RayBatch chunk_rays,
                                                                       const float warp_alpha,
                                                                       const DeviceKeys& keys) const {
        const size_t device_count = devices_.size();
        const size_t padding = chunk_rays.pad_to_multiple(device_count);
        const size_t shard_size = chunk_rays.size() / device_count;

        std::vector<std::future<core::Result<ModelOutput>>> futures;
        futures.reserve(device_count);

        for (size_t d = 0; d < device_count; ++d) {
            futures.push_back(std::async(std::launch::async,
                                         [this, &state, &chunk_rays, &keys, warp_alpha, shard_size, d]() {
                                             const RayBatch shard = chunk_rays.slice(d * shard_size, (d + 1) * shard_size);
                                             return model_->render(state.replica(d), shard, warp_alpha,
                                                                   keys.coarse[d], keys.fine[d]);
                                         }));
        }

        // Barrier: every device finishes before anything is returned
        std::vector<std::optional<ModelOutput>> outputs(device_count);
        std::optional<core::Error> first_error;

        for (size_t d = 0; d < device_count; ++d) {
            try {
                auto result = futures[d].get();
                if (result) {
                    outputs[d] = std::move(*result);
                } else if (!first_error) {
                    first_error = core::Error{core::ErrorCode::RENDER_FAILED,
                                              std::format("Device {} failed: {}", devices_[d].name, result.error().format())};
                }
            } catch (const std::exception& e) {
                if (!first_error) {
                    first_error = core::Error{core::ErrorCode::RENDER_FAILED,
                                              std::format("Device {} raised: {}", devices_[d].name, e.what())};
                }
            }
        }

        if (first_error) {
            LOG_ERROR("{}", first_error->format());
            return std::unexpected(*first_error);
        }

        RenderOutput chunk_output;
        chunk_output.reserve(chunk_rays.size(), outputs.front()->finest().num_samples);

        for (size_t d = 0; d < device_count; ++d) {
            const RenderOutput& level = outputs[d]->finest();
            if (level.size() != shard_size || !level.is_consistent()) {
                return core::make_error(core::ErrorCode::RENDER_FAILED,
                                        std::format("Device {} returned {} ray(s) for a shard of {}",
                                                    devices_[d].name, level.size(), shard_size));
            }
            if (!chunk_output.append(level)) {
                return core::make_error(core::ErrorCode::RENDER_FAILED,
                                        std::format("Device {} returned {} samples per ray, expected {}",
                                                    devices_[d].name, level.num_samples, chunk_output.num_samples));
            }
        }

        chunk_output.drop_tail(padding);
        return chunk_output;
    }

} // namespace nps::rendering
