/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"

#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace vista::core {

    namespace {
        constexpr const char* LOGGER_NAME = "vista";
        constexpr const char* LOG_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";

        spdlog::level::level_enum to_spdlog_level(const LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            case LogLevel::Performance: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            }
            return spdlog::level::info;
        }

        // Module is derived from the path of the file that emitted the message
        LogModule module_from_path(const std::string_view path) {
            if (path.find("camera_controller") != std::string_view::npos ||
                path.find("scale_transform") != std::string_view::npos)
                return LogModule::Camera;
            if (path.find("decoration") != std::string_view::npos)
                return LogModule::Decoration;
            if (path.find("scalar_bar") != std::string_view::npos)
                return LogModule::ScalarBar;
            if (path.find("parameters") != std::string_view::npos)
                return LogModule::Config;
            if (path.find("/scene/") != std::string_view::npos || path.find("\\scene\\") != std::string_view::npos)
                return LogModule::Scene;
            if (path.find("/rendering/") != std::string_view::npos || path.find("\\rendering\\") != std::string_view::npos)
                return LogModule::Rendering;
            if (path.find("/core/") != std::string_view::npos || path.find("\\core\\") != std::string_view::npos)
                return LogModule::Core;
            return LogModule::Unknown;
        }

        std::string_view file_name(const std::string_view path) {
            const auto pos = path.find_last_of("/\\");
            return pos == std::string_view::npos ? path : path.substr(pos + 1);
        }
    } // namespace

    struct Logger::Impl {
        std::shared_ptr<spdlog::logger> logger;
        std::string filter_pattern;
        std::mutex mutex;
    };

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    Logger::Logger() : impl_(std::make_unique<Impl>()) {
        for (auto& enabled : module_enabled_)
            enabled.store(true, std::memory_order_relaxed);
        for (auto& level : module_level_)
            level.store(static_cast<uint8_t>(LogLevel::Trace), std::memory_order_relaxed);

        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        impl_->logger = std::make_shared<spdlog::logger>(LOGGER_NAME, console);
        impl_->logger->set_pattern(LOG_PATTERN);
        impl_->logger->set_level(spdlog::level::trace);
    }

    Logger::~Logger() {
        if (impl_ && impl_->logger)
            impl_->logger->flush();
    }

    void Logger::init(const LogLevel console_level, const std::string& log_file, const std::string& filter_pattern) {
        std::lock_guard lock(impl_->mutex);

        std::vector<spdlog::sink_ptr> sinks;
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_level(to_spdlog_level(console_level));
        sinks.push_back(console);

        std::string file_error;
        if (!log_file.empty()) {
            try {
                auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file->set_level(spdlog::level::trace);
                sinks.push_back(file);
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }

        impl_->logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        impl_->logger->set_pattern(LOG_PATTERN);
        impl_->logger->set_level(spdlog::level::trace);
        impl_->logger->flush_on(spdlog::level::err);
        impl_->filter_pattern = filter_pattern;
        if (!file_error.empty())
            impl_->logger->warn("Cannot open log file '{}': {}", log_file, file_error);

        // File sink sees everything, the global gate follows the most verbose sink
        const LogLevel gate = (sinks.size() > 1) ? LogLevel::Trace : console_level;
        global_level_.store(static_cast<uint8_t>(gate), std::memory_order_relaxed);
    }

    void Logger::log(const LogLevel level, const std::source_location& loc, const std::string_view msg) {
        const LogModule module = module_from_path(loc.file_name());
        const auto module_index = static_cast<size_t>(module);
        if (!module_enabled_[module_index].load(std::memory_order_relaxed))
            return;
        if (static_cast<uint8_t>(level) < module_level_[module_index].load(std::memory_order_relaxed))
            return;

        std::lock_guard lock(impl_->mutex);
        if (!impl_->filter_pattern.empty() && msg.find(impl_->filter_pattern) == std::string_view::npos)
            return;

        if (level == LogLevel::Performance) {
            impl_->logger->log(spdlog::level::info, "[PERF] {} ({}:{})", msg, file_name(loc.file_name()), loc.line());
        } else if (level >= LogLevel::Warn || level <= LogLevel::Debug) {
            impl_->logger->log(to_spdlog_level(level), "{} ({}:{})", msg, file_name(loc.file_name()), loc.line());
        } else {
            impl_->logger->log(to_spdlog_level(level), "{}", msg);
        }
    }

    void Logger::enable_module(const LogModule module, const bool enabled) {
        module_enabled_[static_cast<size_t>(module)].store(enabled, std::memory_order_relaxed);
    }

    void Logger::set_module_level(const LogModule module, const LogLevel level) {
        module_level_[static_cast<size_t>(module)].store(static_cast<uint8_t>(level), std::memory_order_relaxed);
    }

    void Logger::set_level(const LogLevel level) {
        global_level_.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
    }

    void Logger::flush() {
        std::lock_guard lock(impl_->mutex);
        impl_->logger->flush();
    }

    ScopedTimer::ScopedTimer(std::string name, const LogLevel level, const std::source_location loc)
        : start_(std::chrono::high_resolution_clock::now()),
          name_(std::move(name)),
          level_(level),
          loc_(loc) {}

    ScopedTimer::~ScopedTimer() {
        auto& logger = Logger::get();
        if (!logger.is_enabled(level_))
            return;
        const auto elapsed = std::chrono::high_resolution_clock::now() - start_;
        const double ms = std::chrono::duration<double, std::milli>(elapsed).count();
        logger.log(level_, loc_, fmt::format("{} took {:.3f} ms", name_, ms));
    }

} // namespace vista::core
