// =================================================================
// include/Convoy/Logger.hpp
// =================================================================
// Header for logging and audit trails of repository operations.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Convoy {

class CommandError;
struct UncommittedWorkStatus;

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger with console and rotating file output
 *
 * Console output goes to stderr so command results on stdout stay
 * machine-readable. File output is off until enableFileLogging() is
 * called; the CLI turns it on, library users and tests do not.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Start writing log files
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void enableFileLogging(const std::string& log_dir = ".convoy/logs",
                           size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                           size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     * @param level Minimum level to write to files
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log a failed git invocation with its raw output
     * @param component Component that issued the command
     * @param error The failure
     * @param level Level to log at
     */
    void logCommandFailure(const std::string& component, const CommandError& error,
                           LogLevel level = LogLevel::ERROR);

    /**
     * @brief Log the result of a work-state audit
     * @param repo_path Audited workspace
     * @param status Audit result
     */
    void logAudit(const std::string& repo_path, const UncommittedWorkStatus& status);

    /**
     * @brief Log session start
     * @param command Command being executed
     * @param repo_path Repository the command runs against
     */
    void logSessionStart(const std::string& command, const std::string& repo_path);

    /**
     * @brief Log session end
     * @param command Command that was executed
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Parse a level name as used in the config file
     * @param name debug, info, warning, error or critical (case-insensitive)
     * @param fallback Returned for unknown names
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback);

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::WARNING;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;
    std::mutex m_mutex;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);
    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    std::string generateLogFilename();
};

// Convenience macros for logging
#define CONVOY_LOG_DEBUG(component, message) \
    Convoy::Logger::getInstance().debug(component, message)

#define CONVOY_LOG_INFO(component, message) \
    Convoy::Logger::getInstance().info(component, message)

#define CONVOY_LOG_WARNING(component, message) \
    Convoy::Logger::getInstance().warning(component, message)

#define CONVOY_LOG_ERROR(component, message) \
    Convoy::Logger::getInstance().error(component, message)

#define CONVOY_LOG_CRITICAL(component, message) \
    Convoy::Logger::getInstance().critical(component, message)

} // namespace Convoy
