#pragma once

/**
 * Logger.hpp
 *
 * Centralized logging for the transfer manager and the CLI.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <filesystem>

namespace fetchkit::core {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logger class - Thread-safe singleton logger
 *
 * Provides formatted logging with two output sinks:
 * - Console output with colors
 * - Rotating file output (optional)
 *
 * Messages logged before initialize() go to a console-only logger
 * created on first use.
 */
class Logger {
public:
    /**
     * Get singleton instance
     * @return Reference to Logger instance
     */
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Initialize the logger
     * @param level Minimum log level
     * @param logDir Log file directory (empty = ./logs)
     * @param fileOutput Write to the rotating log file
     */
    void initialize(LogLevel level = LogLevel::Info,
                    const std::string& logDir = "",
                    bool fileOutput = true) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);

            if (fileOutput) {
                std::filesystem::path logPath = logDir.empty()
                    ? std::filesystem::current_path() / "logs" / "fetchkit.log"
                    : std::filesystem::path(logDir) / "fetchkit.log";

                std::filesystem::create_directories(logPath.parent_path());

                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath.string(),
                    1024 * 1024 * 10, // 10 MB
                    5,                // 5 rotated files
                    false
                );
                fileSink->set_level(spdlog::level::trace);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }

            m_logger = std::make_shared<spdlog::logger>("fetchkit", sinks.begin(), sinks.end());
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->flush_on(spdlog::level::warn);

        } catch (const std::exception& ex) {
            // spdlog_ex and filesystem_error both land here
            m_logger = makeConsoleLogger("fetchkit_fallback");
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->error("Logger initialization failed: {}", ex.what());
        }
    }

    /**
     * Set log level
     * @param level New log level
     */
    void setLevel(LogLevel level) {
        get()->set_level(toSpdlogLevel(level));
    }

    /**
     * Flush all log sinks
     */
    void flush() {
        get()->flush();
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->critical(fmt, std::forward<Args>(args)...);
    }

    /**
     * Parse a level name from configuration ("debug", "warn", ...)
     * @param name Level name, case-sensitive
     * @param fallback Level returned for unknown names
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::Info) {
        if (name == "trace")    return LogLevel::Trace;
        if (name == "debug")    return LogLevel::Debug;
        if (name == "info")     return LogLevel::Info;
        if (name == "warn")     return LogLevel::Warn;
        if (name == "error")    return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off")      return LogLevel::Off;
        return fallback;
    }

private:
    Logger() = default;
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<spdlog::logger> get() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_logger) {
            m_logger = makeConsoleLogger("fetchkit_console");
        }
        return m_logger;
    }

    static std::shared_ptr<spdlog::logger> makeConsoleLogger(const std::string& name) {
        auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        return std::make_shared<spdlog::logger>(name, sink);
    }

    /**
     * Convert LogLevel to spdlog::level
     */
    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::info;
        }
    }

private:
    std::mutex m_mutex;
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace fetchkit::core

// Convenience macros
#define LOG_TRACE(...)    fetchkit::core::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...)    fetchkit::core::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)     fetchkit::core::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)     fetchkit::core::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...)    fetchkit::core::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) fetchkit::core::Logger::instance().critical(__VA_ARGS__)
