/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <array>
#include <cstdio>
#include <ctime>
#include <format>
#include <mutex>
#include <vector>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace nps::core {

    namespace {
        constexpr const char* ANSI_RESET = "\033[0m";
        constexpr const char* ANSI_PERF = "\033[95m";
        constexpr std::string_view PERF_TAG = "[PERF] ";

        class ColorSink final : public spdlog::sinks::base_sink<std::mutex> {
        protected:
            void sink_it_(const spdlog::details::log_msg& msg) override {
                const auto time_t_val = std::chrono::system_clock::to_time_t(msg.time);
                std::tm tm{};
                localtime_r(&time_t_val, &tm);
                const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                        msg.time.time_since_epoch())
                                        .count() %
                                    1000;

                std::string_view filename;
                if (msg.source.filename) {
                    const std::string_view full_path(msg.source.filename);
                    const auto pos = full_path.find_last_of('/');
                    filename = (pos != std::string_view::npos) ? full_path.substr(pos + 1) : full_path;
                }

                std::string_view payload(msg.payload.data(), msg.payload.size());
                const bool is_perf = payload.starts_with(PERF_TAG);
                if (is_perf) {
                    payload.remove_prefix(PERF_TAG.size());
                }

                const char* color = COLORS[2];
                const char* level_str = "info";
                if (is_perf) {
                    color = ANSI_PERF;
                    level_str = "perf";
                } else {
                    switch (msg.level) {
                    case spdlog::level::trace: color = COLORS[0]; level_str = "trace"; break;
                    case spdlog::level::debug: color = COLORS[1]; level_str = "debug"; break;
                    case spdlog::level::warn: color = COLORS[3]; level_str = "warn"; break;
                    case spdlog::level::err: color = COLORS[4]; level_str = "error"; break;
                    case spdlog::level::critical: color = COLORS[5]; level_str = "critical"; break;
                    default: break;
                    }
                }

                // Warnings and errors go to stderr so stdout stays clean for piping
                FILE* const stream = msg.level >= spdlog::level::warn ? stderr : stdout;
                std::fprintf(stream, "[%02d:%02d:%02d.%03d] %s[%s]%s %.*s:%d  %.*s\n",
                             tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis),
                             color, level_str, ANSI_RESET,
                             static_cast<int>(filename.size()), filename.data(), msg.source.line,
                             static_cast<int>(payload.size()), payload.data());
            }

            void flush_() override {
                std::fflush(stdout);
                std::fflush(stderr);
            }

        private:
            static constexpr std::array<const char*, 6> COLORS = {
                "\033[37m", "\033[36m", "\033[32m", "\033[33m", "\033[31m", "\033[1;31m"};
        };

        LogModule detect_module(const std::string_view path) {
            if (path.find("/rendering/") != std::string_view::npos)
                return LogModule::Rendering;
            if (path.find("/models/") != std::string_view::npos)
                return LogModule::Models;
            if (path.find("/io/") != std::string_view::npos)
                return LogModule::IO;
            if (path.find("/sampling/") != std::string_view::npos)
                return LogModule::Sampling;
            if (path.find("/app/") != std::string_view::npos)
                return LogModule::App;
            if (path.find("/core/") != std::string_view::npos)
                return LogModule::Core;
            return LogModule::Unknown;
        }

        constexpr spdlog::level::level_enum to_spdlog_level(const LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            case LogLevel::Performance: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            default: return spdlog::level::info;
            }
        }
    } // anonymous namespace

    LogLevel parse_log_level(const std::string_view level_str) {
        if (level_str == "trace")
            return LogLevel::Trace;
        if (level_str == "debug")
            return LogLevel::Debug;
        if (level_str == "info")
            return LogLevel::Info;
        if (level_str == "perf" || level_str == "performance")
            return LogLevel::Performance;
        if (level_str == "warn" || level_str == "warning")
            return LogLevel::Warn;
        if (level_str == "error")
            return LogLevel::Error;
        if (level_str == "critical")
            return LogLevel::Critical;
        if (level_str == "off")
            return LogLevel::Off;
        return LogLevel::Info;
    }

    std::optional<LogModule> parse_log_module(const std::string_view module_str) {
        if (module_str == "core")
            return LogModule::Core;
        if (module_str == "rendering")
            return LogModule::Rendering;
        if (module_str == "models")
            return LogModule::Models;
        if (module_str == "io")
            return LogModule::IO;
        if (module_str == "sampling")
            return LogModule::Sampling;
        if (module_str == "app")
            return LogModule::App;
        return std::nullopt;
    }

    struct Logger::Impl {
        std::shared_ptr<spdlog::logger> logger;
        std::mutex mutex;
    };

    Logger::Logger() : impl_(std::make_unique<Impl>()) {
        for (size_t i = 0; i < static_cast<size_t>(LogModule::Count); ++i) {
            module_enabled_[i] = true;
        }
    }

    Logger::~Logger() = default;

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    std::expected<void, std::string> Logger::init(const LogLevel console_level, const std::string& log_file) {
        std::lock_guard lock(impl_->mutex);

        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<ColorSink>();
        console_sink->set_level(to_spdlog_level(console_level));
        sinks.push_back(console_sink);

        if (!log_file.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %s:%# %v");
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& e) {
                return std::unexpected(std::format("Cannot open log file '{}': {}", log_file, e.what()));
            }
        }

        impl_->logger = std::make_shared<spdlog::logger>("nps", sinks.begin(), sinks.end());
        impl_->logger->set_level(spdlog::level::trace);
        spdlog::set_default_logger(impl_->logger);

        global_level_ = static_cast<uint8_t>(console_level);
        for (auto& enabled : module_enabled_) {
            enabled = true;
        }
        return {};
    }

    void Logger::log(const LogLevel level, const std::source_location& loc, const std::string_view msg) {
        if (!impl_->logger)
            return;

        const auto module_idx = static_cast<size_t>(detect_module(loc.file_name()));
        if (!module_enabled_[module_idx]) {
            return;
        }

        // Performance level is exclusive: it shows only timings, and timings only show there
        const auto global_lvl = static_cast<LogLevel>(global_level_.load());
        if (global_lvl == LogLevel::Performance) {
            if (level != LogLevel::Performance)
                return;
        } else {
            if (level == LogLevel::Performance)
                return;
            if (static_cast<uint8_t>(level) < global_level_)
                return;
        }

        const spdlog::source_loc source{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
        if (level == LogLevel::Performance) {
            impl_->logger->log(source, to_spdlog_level(level), "{}{}", PERF_TAG, msg);
        } else {
            impl_->logger->log(source, to_spdlog_level(level), "{}", msg);
        }
    }

    void Logger::enable_module(const LogModule module, const bool enabled) {
        module_enabled_[static_cast<size_t>(module)] = enabled;
    }

    void Logger::flush() {
        if (impl_->logger)
            impl_->logger->flush();
    }

    ScopedTimer::ScopedTimer(std::string name, const LogLevel level, const std::source_location loc)
        : start_(std::chrono::steady_clock::now()),
          name_(std::move(name)),
          level_(level),
          loc_(loc) {}

    ScopedTimer::~ScopedTimer() {
        const auto duration = std::chrono::steady_clock::now() - start_;
        const auto ms = std::chrono::duration<double, std::milli>(duration).count();
        Logger::get().log_internal(level_, loc_, "{} took {:.2f}ms", name_, ms);
    }

} // namespace nps::core
