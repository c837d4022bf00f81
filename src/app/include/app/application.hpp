/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include <memory>

namespace nps::app {

    class Application {
    public:
        /// Runs a sample-points invocation. Returns the process exit status.
        int run(std::unique_ptr<core::param::SamplingParameters> params);

        /// Runs a visualize-point-cloud invocation. Returns the process exit status.
        int run(const core::param::ExportParameters& params);
    };

} // namespace nps::app
