/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/rng.hpp"
#include "rendering/model_state.hpp"
#include "rendering/ray_batch.hpp"
#include "rendering/render_output.hpp"

namespace nps::rendering {

    /**
     * @brief Volumetric scene model evaluated on a flat run of rays.
     *
     * Implementations must be safe to call concurrently from several devices:
     * render() may only read `params` and its own immutable configuration.
     * Conditioning ids travel in the batch metadata.
     */
    class ISceneModel {
    public:
        virtual ~ISceneModel() = default;

        /**
         * @param params Device replica of the model parameters
         * @param rays Ray shard for one device (height 1, width = shard size)
         * @param warp_alpha Deformation schedule value
         * @param coarse_key Random stream of the coarse level
         * @param fine_key Random stream of the fine level
         */
        virtual core::Result<ModelOutput> render(const ModelState& params,
                                                 const RayBatch& rays,
                                                 float warp_alpha,
                                                 core::RngKey coarse_key,
                                                 core::RngKey fine_key) const = 0;

        virtual const char* name() const = 0;
    };

} // namespace nps::rendering
