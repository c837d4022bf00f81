/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "rendering/compute_device.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <format>
#include <thread>

namespace nps::rendering {

    std::vector<ComputeDevice> local_devices(const int requested) {
        int count = requested;
        if (count <= 0) {
            count = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
        }

        std::vector<ComputeDevice> devices;
        devices.reserve(static_cast<size_t>(count));
        for (int i = 0; i < count; ++i) {
            devices.push_back(ComputeDevice{i, std::format("cpu:{}", i)});
        }

        LOG_DEBUG("Using {} compute device(s)", count);
        return devices;
    }

} // namespace nps::rendering
