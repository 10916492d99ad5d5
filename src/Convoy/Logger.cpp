// =================================================================
// src/Convoy/Logger.cpp
// =================================================================
// Implementation for the logging system.

#include "Convoy/Logger.hpp"
#include "Convoy/GitError.hpp"
#include "Convoy/WorkStateAuditor.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <vector>

namespace Convoy {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::enableFileLogging(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_log_dir = log_dir;
        m_max_log_size = max_log_size;
        m_max_log_files = max_log_files;
        m_current_log_size = 0;

        try {
            std::filesystem::create_directories(m_log_dir);
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Cannot create log directory: " << e.what() << std::endl;
            // Fall back to current directory
            m_log_dir = ".";
        }

        m_current_log_filename = generateLogFilename();
        m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
    }

    debug("Logger", "File logging enabled", log_dir);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_enabled = enabled;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logCommandFailure(const std::string& component, const CommandError& error, LogLevel level) {
    std::ostringstream context;
    context << "exit " << error.exitCode() << ", args:";
    for (const auto& arg : error.args()) {
        context << " " << arg;
    }

    logEntry(LogEntry(level, component, "git " + error.command() + " failed", context.str()));
    if (!error.stderrText().empty()) {
        debug(component, "stderr: " + error.stderrText());
    }
    if (!error.stdoutText().empty()) {
        debug(component, "stdout: " + error.stdoutText());
    }
}

void Logger::logAudit(const std::string& repo_path, const UncommittedWorkStatus& status) {
    std::ostringstream context;
    context << "Modified: " << status.modified_files.size() << ", ";
    context << "Untracked: " << status.untracked_files.size() << ", ";
    context << "Stashes: " << status.stash_count << ", ";
    context << "Unpushed: " << status.unpushed_commits;

    if (status.clean()) {
        info("WorkStateAuditor", repo_path + " is clean", context.str());
    } else {
        warning("WorkStateAuditor", repo_path + " has " + status.summary(), context.str());
    }
}

void Logger::logSessionStart(const std::string& command, const std::string& repo_path) {
    info("Session", "Session started", "Command: " + command + ", Repository: " + repo_path);
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Command: " << command << ", ";
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        info("Session", "Session completed successfully", context.str());
    } else {
        info("Session", "Session completed with non-zero exit", context.str());
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    return fallback;
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    std::cerr << formatEntry(entry, true) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << std::endl;
    m_current_log_size += formatted.length() + 1; // +1 for newline

    // Flush critical and error messages immediately
    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m"; // Reset color
    }
    formatted << " ";

    formatted << entry.component << ": ";
    formatted << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    m_current_log_file.reset();
    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    m_current_log_size = 0;

    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // Newest first
        std::sort(log_files.begin(), log_files.end(),
                  [](const std::filesystem::path& a, const std::filesystem::path& b) {
                      return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                  });

        for (size_t i = m_max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }
    } catch (const std::exception& e) {
        // Log rotation failure shouldn't stop the program
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream stem;
    stem << m_log_dir << "/convoy_";
    stem << std::put_time(&local_tm, "%Y%m%d_%H%M%S");

    // Several rotations can land in the same second
    std::string filename = stem.str() + ".log";
    std::error_code ec;
    for (int sequence = 1; std::filesystem::exists(filename, ec); ++sequence) {
        filename = stem.str() + "_" + std::to_string(sequence) + ".log";
    }
    return filename;
}

} // namespace Convoy
