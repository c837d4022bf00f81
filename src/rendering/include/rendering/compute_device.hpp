/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <string>
#include <vector>

namespace nps::rendering {

    /// A data-parallel worker. Each device evaluates one shard per dispatch on its own thread.
    struct ComputeDevice {
        int id = 0;
        std::string name;
    };

    /// `requested` local CPU devices; 0 means one per hardware thread.
    std::vector<ComputeDevice> local_devices(int requested = 0);

} // namespace nps::rendering
