/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "core/argument_parser.hpp"
#include "core/logger.hpp"

#include <print>
#include <type_traits>
#include <variant>

#ifndef NPS_VERSION
#define NPS_VERSION "0.0.0"
#endif

int main(int argc, char* argv[]) {
    auto parsed = nps::core::args::parse_args(argc, argv);
    if (!parsed) {
        std::println(stderr, "{}", parsed.error());
        return 1;
    }

    return std::visit([](auto&& mode) -> int {
        using Mode = std::decay_t<decltype(mode)>;
        using namespace nps::core::args;

        if constexpr (std::is_same_v<Mode, HelpMode>) {
            return 0;
        } else if constexpr (std::is_same_v<Mode, VersionMode>) {
            std::println("neural-pseudo-scan {}", NPS_VERSION);
            return 0;
        } else if constexpr (std::is_same_v<Mode, SamplePointsMode>) {
            nps::app::Application app;
            const int status = app.run(std::move(mode.params));
            nps::core::Logger::get().flush();
            return status;
        } else {
            nps::app::Application app;
            const int status = app.run(mode.params);
            nps::core::Logger::get().flush();
            return status;
        }
    },
                      *parsed);
}
