/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace gv::core {

    namespace {

        // First match wins
        constexpr std::array<std::pair<std::string_view, LogModule>, 7> MODULE_PATHS{{
            {"geometry", LogModule::Geometry},
            {"loader", LogModule::Loader},
            {"scene", LogModule::Scene},
            {"rendering", LogModule::Rendering},
            {"visualizer", LogModule::Visualizer},
            {"tools", LogModule::Tools},
            {"core", LogModule::Core},
        }};

        constexpr std::array<std::pair<std::string_view, LogLevel>, 8> LEVEL_NAMES{{
            {"trace", LogLevel::Trace},
            {"debug", LogLevel::Debug},
            {"info", LogLevel::Info},
            {"warn", LogLevel::Warn},
            {"warning", LogLevel::Warn},
            {"error", LogLevel::Error},
            {"critical", LogLevel::Critical},
            {"off", LogLevel::Off},
        }};

        spdlog::level::level_enum to_spdlog_level(LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            default: return spdlog::level::info;
            }
        }

    } // namespace

    std::string_view to_string(LogModule module) {
        for (const auto& [name, value] : MODULE_PATHS) {
            if (value == module)
                return name;
        }
        return "unknown";
    }

    std::optional<LogLevel> parse_log_level(std::string_view name) {
        for (const auto& [spelling, level] : LEVEL_NAMES) {
            if (spelling == name)
                return level;
        }
        return std::nullopt;
    }

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    void Logger::init(LogLevel console_level, const std::string& log_file) {
        std::lock_guard lock(mutex_);

        std::vector<spdlog::sink_ptr> sinks;

        // Console output goes to stderr
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_level(to_spdlog_level(console_level));
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %s:%# %v");
        sinks.push_back(std::move(console));

        if (!log_file.empty()) {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
            file->set_level(spdlog::level::trace);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %s:%# %v");
            sinks.push_back(std::move(file));
        }

        logger_ = std::make_shared<spdlog::logger>("gv", sinks.begin(), sinks.end());
        logger_->set_level(spdlog::level::trace);
        spdlog::set_default_logger(logger_);

        // A file sink wants everything; the console sink filters on its own
        global_level_ = static_cast<uint8_t>(log_file.empty() ? console_level : LogLevel::Trace);
        for (size_t i = 0; i < module_enabled_.size(); ++i) {
            module_enabled_[i] = true;
            module_level_[i] = static_cast<uint8_t>(LogLevel::Trace);
        }
    }

    bool Logger::accepts(LogLevel level, LogModule module) const {
        const auto index = static_cast<size_t>(module);
        const auto value = static_cast<uint8_t>(level);
        return module_enabled_[index] && value >= module_level_[index] && value >= global_level_;
    }

    void Logger::write(LogLevel level, const std::source_location& loc, const std::string& message) {
        logger_->log(spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
                     to_spdlog_level(level), message);
    }

    void Logger::enable_module(LogModule module, bool enabled) {
        module_enabled_[static_cast<size_t>(module)] = enabled;
    }

    void Logger::set_module_level(LogModule module, LogLevel level) {
        module_level_[static_cast<size_t>(module)] = static_cast<uint8_t>(level);
    }

    void Logger::set_level(LogLevel level) {
        global_level_ = static_cast<uint8_t>(level);
    }

    void Logger::flush() {
        if (logger_)
            logger_->flush();
    }

    LogModule Logger::detect_module(std::string_view path) {
        for (const auto& [needle, module] : MODULE_PATHS) {
            if (path.find(needle) != std::string_view::npos)
                return module;
        }
        return LogModule::Unknown;
    }

} // namespace gv::core
