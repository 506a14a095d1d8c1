/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace spdlog {
    class logger;
}

namespace gv::core {

    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5,
        Off = 6
    };

    // Derived from the directory a message was logged from
    enum class LogModule : uint8_t {
        Core = 0,
        Geometry = 1,
        Loader = 2,
        Scene = 3,
        Rendering = 4,
        Visualizer = 5,
        Tools = 6,
        Unknown = 7,
        Count = 8
    };

    std::string_view to_string(LogModule module);

    // "trace" .. "off"; "warning" is accepted for warn
    std::optional<LogLevel> parse_log_level(std::string_view name);

    /**
     * @brief Process-wide logger on top of spdlog
     *
     * Messages go to a colored stderr sink and, optionally, a file sink that
     * records everything down to trace. Nothing is logged before init().
     * Each message is filtered by the global level and by its module's level.
     */
    class Logger {
    public:
        static Logger& get();

        void init(LogLevel console_level = LogLevel::Info, const std::string& log_file = "");

        [[nodiscard]] bool initialized() const { return logger_ != nullptr; }

        template <typename... Args>
        void log_internal(LogLevel level, const std::source_location& loc,
                          std::format_string<Args...> fmt, Args&&... args) {
            if (!logger_ || !accepts(level, detect_module(loc.file_name())))
                return;
            write(level, loc, std::format(fmt, std::forward<Args>(args)...));
        }

        void enable_module(LogModule module, bool enabled = true);
        void set_module_level(LogModule module, LogLevel level);
        void set_level(LogLevel level);
        void flush();

        static LogModule detect_module(std::string_view path);

    private:
        Logger() = default;

        bool accepts(LogLevel level, LogModule module) const;
        void write(LogLevel level, const std::source_location& loc, const std::string& message);

        std::shared_ptr<spdlog::logger> logger_;
        std::mutex mutex_;
        std::atomic<uint8_t> global_level_{static_cast<uint8_t>(LogLevel::Info)};
        std::array<std::atomic<bool>, static_cast<size_t>(LogModule::Count)> module_enabled_{};
        std::array<std::atomic<uint8_t>, static_cast<size_t>(LogModule::Count)> module_level_{};
    };

    // Logs "<name> took <ms>ms" when it goes out of scope
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string name, LogLevel level = LogLevel::Debug,
                             std::source_location loc = std::source_location::current())
            : name_(std::move(name)),
              level_(level),
              loc_(loc),
              start_(std::chrono::steady_clock::now()) {}

        ~ScopedTimer() {
            const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start_;
            Logger::get().log_internal(level_, loc_, "{} took {:.2f}ms", name_, elapsed.count());
        }

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::string name_;
        LogLevel level_;
        std::source_location loc_;
        std::chrono::steady_clock::time_point start_;
    };

} // namespace gv::core

#define GV_LOG_AT(level, ...) \
    ::gv::core::Logger::get().log_internal((level), std::source_location::current(), __VA_ARGS__)

#define LOG_TRACE(...)    GV_LOG_AT(::gv::core::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...)    GV_LOG_AT(::gv::core::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...)     GV_LOG_AT(::gv::core::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...)     GV_LOG_AT(::gv::core::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...)    GV_LOG_AT(::gv::core::LogLevel::Error, __VA_ARGS__)
#define LOG_CRITICAL(...) GV_LOG_AT(::gv::core::LogLevel::Critical, __VA_ARGS__)

#define GV_TIMER_CONCAT_INNER(a, b) a##b
#define GV_TIMER_CONCAT(a, b)       GV_TIMER_CONCAT_INNER(a, b)

#define LOG_TIMER(name)       ::gv::core::ScopedTimer GV_TIMER_CONCAT(gv_timer_, __LINE__)(name, ::gv::core::LogLevel::Info)
#define LOG_TIMER_DEBUG(name) ::gv::core::ScopedTimer GV_TIMER_CONCAT(gv_timer_, __LINE__)(name, ::gv::core::LogLevel::Debug)
#define LOG_TIMER_TRACE(name) ::gv::core::ScopedTimer GV_TIMER_CONCAT(gv_timer_, __LINE__)(name, ::gv::core::LogLevel::Trace)
