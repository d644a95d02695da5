/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include "core/export.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <string_view>

namespace vista::core {

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
        Scene = 2,
        Camera = 3,
        Decoration = 4,
        ScalarBar = 5,
        Config = 6,
        Unknown = 7,
        Count = 8
    };

    class VISTA_LOGGER_API Logger {
    public:
        static Logger& get();

        void init(LogLevel console_level = LogLevel::Info,
                  const std::string& log_file = "",
                  const std::string& filter_pattern = "");

        // Log a pre-formatted message (called by macros)
        void log(LogLevel level, const std::source_location& loc, std::string_view msg);

        // Module control
        void enable_module(LogModule module, bool enabled = true);
        void set_module_level(LogModule module, LogLevel level);
        void set_level(LogLevel level);
        [[nodiscard]] LogLevel level() const {
            return static_cast<LogLevel>(global_level_.load(std::memory_order_relaxed));
        }
        void flush();

        bool is_enabled(LogLevel level) const {
            return static_cast<uint8_t>(level) >= global_level_.load(std::memory_order_relaxed);
        }

        // Runtime string logging, no format args
        void log_internal(LogLevel level, const std::source_location& loc, const std::string& msg) {
            if (static_cast<uint8_t>(level) < global_level_.load(std::memory_order_relaxed))
                return;
            log(level, loc, msg);
        }

        // Checks the global threshold before formatting so disabled levels cost
        // a single atomic load.
        template <typename... Args>
        void log_internal(LogLevel level, const std::source_location& loc,
                          fmt::format_string<Args...> format, Args&&... args) {
            if (static_cast<uint8_t>(level) < global_level_.load(std::memory_order_relaxed))
                return;

            log(level, loc, fmt::format(format, std::forward<Args>(args)...));
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
        std::array<std::atomic<uint8_t>, static_cast<size_t>(LogModule::Count)> module_level_{};
    };

    // Scoped timer for performance measurement
    class VISTA_LOGGER_API ScopedTimer {
    public:
        explicit ScopedTimer(std::string name, LogLevel level = LogLevel::Performance,
                             std::source_location loc = std::source_location::current());
        ~ScopedTimer();

    private:
        std::chrono::high_resolution_clock::time_point start_;
        std::string name_;
        LogLevel level_;
        std::source_location loc_;
    };

} // namespace vista::core

// Global macros
#define LOG_TRACE(...) \
    ::vista::core::Logger::get().log_internal(::vista::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(...) \
    ::vista::core::Logger::get().log_internal(::vista::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(...) \
    ::vista::core::Logger::get().log_internal(::vista::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)

#define LOG_PERF(...) \
    ::vista::core::Logger::get().log_internal(::vista::core::LogLevel::Performance, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...) \
    ::vista::core::Logger::get().log_internal(::vista::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(...) \
    ::vista::core::Logger::get().log_internal(::vista::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)

#define LOG_CRITICAL(...) \
    ::vista::core::Logger::get().log_internal(::vista::core::LogLevel::Critical, std::source_location::current(), __VA_ARGS__)

// Helper macros to force expansion of __COUNTER__ before concatenation
#define _LOG_TIMER_CONCAT_IMPL(x, y)  x##y
#define _LOG_TIMER_MACRO_CONCAT(x, y) _LOG_TIMER_CONCAT_IMPL(x, y)

#define LOG_TIMER(name)       ::vista::core::ScopedTimer _LOG_TIMER_MACRO_CONCAT(_timer_, __COUNTER__)(name)
#define LOG_TIMER_TRACE(name) ::vista::core::ScopedTimer _LOG_TIMER_MACRO_CONCAT(_timer_, __COUNTER__)(name, ::vista::core::LogLevel::Trace)
#define LOG_TIMER_DEBUG(name) ::vista::core::ScopedTimer _LOG_TIMER_MACRO_CONCAT(_timer_, __COUNTER__)(name, ::vista::core::LogLevel::Debug)
