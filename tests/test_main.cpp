/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <gtest/gtest.h>

int main(int argc, char** argv) {
    // Initialize loggers - check LOG_LEVEL env var
    auto log_level = nps::core::LogLevel::Warn;
    if (const char* env = std::getenv("LOG_LEVEL")) {
        log_level = nps::core::parse_log_level(env);
    }
    if (auto initialized = nps::core::Logger::get().init(log_level); !initialized) {
        std::fprintf(stderr, "%s\n", initialized.error().c_str());
        return 1;
    }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
