/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/parameters.hpp"
#include "rendering/scene_model.hpp"
#include <memory>
#include <string>
#include <vector>

namespace nps::models {

    /// Scene model named by config.type, sampling between near and far.
    core::Result<std::shared_ptr<const rendering::ISceneModel>> create_scene_model(
        const core::param::ModelConfig& config, float near, float far);

} // namespace nps::models
