#pragma once

/**
 * Logger.hpp
 *
 * Centralized logging for the rotation engine.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

namespace keyrotor::core {

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
 * Parse a level name as written in config.json ("debug", "warn", ...)
 * @param name Level name
 * @return Parsed level, Info when unrecognized
 */
inline LogLevel parseLogLevel(const std::string& name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    return LogLevel::Info;
}

/**
 * Logger class - Thread-safe singleton logger
 *
 * Output sinks:
 * - Console output with colors (stderr, so CLI output stays clean)
 * - Rotating file output
 *
 * Messages logged before initialize() go to a plain console logger.
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
     * @param logDir Log file directory (optional, console only when empty)
     */
    void initialize(LogLevel level = LogLevel::Info,
                   const std::string& logDir = "") {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (!logDir.empty()) {
                std::filesystem::path logPath = std::filesystem::path(logDir) / "keyrotor.log";
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

            m_logger = std::make_shared<spdlog::logger>("keyrotor", sinks.begin(), sinks.end());
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->flush_on(spdlog::level::warn);

            spdlog::set_default_logger(m_logger);
            m_initialized = true;

        } catch (const spdlog::spdlog_ex& ex) {
            m_logger = fallbackLogger();
            m_logger->error("Logger initialization failed: {}", ex.what());
        } catch (const std::filesystem::filesystem_error& ex) {
            m_logger = fallbackLogger();
            m_logger->error("Log directory unavailable: {}", ex.what());
        }
    }

    /**
     * Set log level
     * @param level New log level
     */
    void setLevel(LogLevel level) {
        ensureLogger()->set_level(toSpdlogLevel(level));
    }

    bool isInitialized() const { return m_initialized; }

    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        ensureLogger()->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        ensureLogger()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        ensureLogger()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        ensureLogger()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        ensureLogger()->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        ensureLogger()->critical(fmt, std::forward<Args>(args)...);
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

    std::shared_ptr<spdlog::logger>& ensureLogger() {
        if (!m_logger) {
            m_logger = fallbackLogger();
        }
        return m_logger;
    }

    static std::shared_ptr<spdlog::logger> fallbackLogger() {
        auto existing = spdlog::get("keyrotor_fallback");
        if (existing) {
            return existing;
        }
        auto logger = spdlog::stderr_color_mt("keyrotor_fallback");
        logger->set_level(spdlog::level::warn);
        return logger;
    }

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
    std::shared_ptr<spdlog::logger> m_logger;
    bool m_initialized{false};
};

} // namespace keyrotor::core

// Convenience macros
#define KR_LOG_TRACE(...)    keyrotor::core::Logger::instance().trace(__VA_ARGS__)
#define KR_LOG_DEBUG(...)    keyrotor::core::Logger::instance().debug(__VA_ARGS__)
#define KR_LOG_INFO(...)     keyrotor::core::Logger::instance().info(__VA_ARGS__)
#define KR_LOG_WARN(...)     keyrotor::core::Logger::instance().warn(__VA_ARGS__)
#define KR_LOG_ERROR(...)    keyrotor::core::Logger::instance().error(__VA_ARGS__)
#define KR_LOG_CRITICAL(...) keyrotor::core::Logger::instance().critical(__VA_ARGS__)
