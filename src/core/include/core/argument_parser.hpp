/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include <expected>
#include <memory>
#include <string>
#include <variant>

namespace nps::core::args {

    struct SamplePointsMode {
        std::unique_ptr<param::SamplingParameters> params;
    };

    struct VisualizePointCloudMode {
        param::ExportParameters params;
    };

    struct HelpMode {};
    struct VersionMode {};

    using ParsedArgs = std::variant<HelpMode, VersionMode, SamplePointsMode, VisualizePointCloudMode>;

    /**
     * @brief Parse the command line into one of the run modes.
     *
     * argv[1] selects the subcommand (sample-points, visualize-point-cloud). Logging
     * flags are accepted by every subcommand and initialize the Logger as a side effect;
     * the LOG_LEVEL environment variable is the fallback level.
     */
    std::expected<ParsedArgs, std::string> parse_args(int argc, const char* const argv[]);

} // namespace nps::core::args
