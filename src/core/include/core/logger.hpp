/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace nps::core {

    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Performance = 3,
        Warn = 4,
        Error = 5,
        Critical = 6,
        Off = 7
    };

    enum class LogModule : uint8_t {
        Core = 0,
        Rendering = 1,
        Models = 2,
        IO = 3,
        Sampling = 4,
        App = 5,
        Unknown = 6,
        Count = 7
    };

    // Parses "trace", "debug", "info", "perf", "warn", "error", "critical", "off".
    // Unknown strings map to Info.
    LogLevel parse_log_level(std::string_view level_str);

    // "core", "rendering", "models", "io", "sampling", "app"
    std::optional<LogModule> parse_log_module(std::string_view module_str);

    class Logger {
    public:
        static Logger& get();

        // Re-enables every module. Fails if the log file cannot be opened; the previous sinks stay active.
        std::expected<void, std::string> init(LogLevel console_level = LogLevel::Info,
                                              const std::string& log_file = "");

        // Log a pre-formatted message (called by macros)
        void log(LogLevel level, const std::source_location& loc, std::string_view msg);

        void enable_module(LogModule module, bool enabled = true);
        void flush();

        bool is_enabled(LogLevel level) const {
            return static_cast<uint8_t>(level) >= global_level_.load(std::memory_order_relaxed);
        }

        void log_internal(LogLevel level, const std::source_location& loc, const std::string& msg) {
            if (static_cast<uint8_t>(level) < global_level_.load(std::memory_order_relaxed))
                return;
            log(level, loc, msg);
        }

        // Skips std::format entirely when the level is filtered out globally.
        template <typename... Args>
        void log_internal(LogLevel level, const std::source_location& loc,
                          std::format_string<Args...> fmt, Args&&... args) {
            if (static_cast<uint8_t>(level) < global_level_.load(std::memory_order_relaxed))
                return;

            log(level, loc, std::format(fmt, std::forward<Args>(args)...));
        }

    private:
        Logger();
        ~Logger();
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        struct Impl;
        std::unique_ptr<Impl> impl_;

        std::atomic<uint8_t> global_level_{static_cast<uint8_t>(LogLevel::Info)};
        std::array<std::atomic<bool>, static_cast<size_t>(LogModule::Count)> module_enabled_{};
    };

    // Scoped timer for performance measurement
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string name, LogLevel level = LogLevel::Performance,
                             std::source_location loc = std::source_location::current());
        ~ScopedTimer();

    private:
        std::chrono::steady_clock::time_point start_;
        std::string name_;
        LogLevel level_;
        std::source_location loc_;
    };

} // namespace nps::core

#define LOG_TRACE(...) \
    ::nps::core::Logger::get().log_internal(::nps::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(...) \
    ::nps::core::Logger::get().log_internal(::nps::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(...) \
    ::nps::core::Logger::get().log_internal(::nps::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)

#define LOG_PERF(...) \
    ::nps::core::Logger::get().log_internal(::nps::core::LogLevel::Performance, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...) \
    ::nps::core::Logger::get().log_internal(::nps::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(...) \
    ::nps::core::Logger::get().log_internal(::nps::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)

#define LOG_CRITICAL(...) \
    ::nps::core::Logger::get().log_internal(::nps::core::LogLevel::Critical, std::source_location::current(), __VA_ARGS__)

#define _NPS_TIMER_CONCAT_IMPL(x, y)  x##y
#define _NPS_TIMER_MACRO_CONCAT(x, y) _NPS_TIMER_CONCAT_IMPL(x, y)

#define LOG_TIMER(name)       ::nps::core::ScopedTimer _NPS_TIMER_MACRO_CONCAT(_timer_, __COUNTER__)(name)
#define LOG_TIMER_DEBUG(name) ::nps::core::ScopedTimer _NPS_TIMER_MACRO_CONCAT(_timer_, __COUNTER__)(name, ::nps::core::LogLevel::Debug)
