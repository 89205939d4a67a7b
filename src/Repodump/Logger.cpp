// =================================================================
// src/Repodump/Logger.cpp
// =================================================================
// Implementation for the logging system.

#include "Repodump/Logger.hpp"
#include "Repodump/BudgetEnforcer.hpp"
#include "Repodump/FileCollector.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace Repodump {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_console_color = isatty(STDERR_FILENO) != 0;
    m_current_log_size = 0;
    m_current_log_file.reset();

    if (m_log_dir.empty()) {
        return;
    }

    if (!ensureLogDirectory()) {
        m_log_dir.clear();
        return;
    }

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
    if (!m_current_log_file->is_open()) {
        std::cerr << "[WARN] Cannot open log file " << m_current_log_filename << std::endl;
        m_current_log_file.reset();
        return;
    }

    info("Logger", "Logging system initialized", m_log_dir);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
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

void Logger::logCollection(const CollectionStats& stats) {
    std::ostringstream context;
    context << "Directories: " << stats.directories_visited << ", ";
    context << "Files seen: " << stats.files_seen << ", ";
    context << "Excluded: " << stats.excluded_paths << ", ";
    context << ".gitignore files: " << stats.gitignore_files;

    info("FileCollector", "File collection completed", context.str());

    // Everything collected stays in memory until rendering
    debug("FileCollector", "Content held in memory",
          std::to_string(stats.bytes_loaded) + " bytes");

    if (stats.unreadable_directories > 0 || stats.cycles_skipped > 0) {
        std::ostringstream problems;
        problems << "Unreadable directories: " << stats.unreadable_directories << ", ";
        problems << "Cycles skipped: " << stats.cycles_skipped;
        warning("FileCollector", "Some directories were not traversed", problems.str());
    }
}

void Logger::logBudget(const BudgetResult& result, std::uint64_t max_tokens) {
    std::ostringstream context;
    context << "Tokens before: " << result.tokens_before << ", ";
    context << "Tokens after: " << result.total_tokens << ", ";
    context << "Cap: " << (max_tokens > 0 ? std::to_string(max_tokens) : std::string("none")) << ", ";
    context << "Truncated: " << result.truncated_count << ", ";
    context << "Dropped: " << result.dropped_count;

    info("BudgetEnforcer", "Budget enforcement completed", context.str());

    if (result.infeasible) {
        warning("BudgetEnforcer",
                "Token budget is smaller than the smallest file",
                "Cap: " + std::to_string(max_tokens));
    } else if (result.truncated_count > 0 || result.dropped_count > 0) {
        warning("BudgetEnforcer", "Some files were truncated or dropped due to token limits");
    }
}

void Logger::logSessionStart(const std::string& root, const std::string& format) {
    std::ostringstream context;
    context << "Root: " << root << ", ";
    context << "Format: " << format;

    info("Session", "Session started", context.str());
}

void Logger::logSessionEnd(int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        info("Session", "Session completed successfully", context.str());
    } else {
        error("Session", "Session completed with errors", context.str());
    }
}

void Logger::flush() {
    std::cerr.flush();
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (entry.level < m_console_level) {
        return;
    }

    std::cerr << formatEntry(entry, m_console_color) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();
    if (!m_current_log_file) {
        return;
    }

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << '\n';
    m_current_log_size += formatted.length() + 1; // +1 for newline

    // Flush error messages immediately
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
    if (!m_current_log_file->is_open()) {
        std::cerr << "[WARN] Cannot open log file " << m_current_log_filename << std::endl;
        m_current_log_file.reset();
        return;
    }

    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // Names embed timestamp and sequence, so newest sorts last
        std::sort(log_files.begin(), log_files.end(),
                  [](const std::filesystem::path& a, const std::filesystem::path& b) {
                      return a.filename().string() > b.filename().string();
                  });

        for (size_t i = m_max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::tm local_time{};
    localtime_r(&time_t, &local_time);

    std::ostringstream oss;
    oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

bool Logger::ensureLogDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        std::cerr << "[ERROR] Cannot create log directory " << m_log_dir << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_time{};
    localtime_r(&time_t, &local_time);

    std::ostringstream filename;
    filename << m_log_dir << "/repodump_";
    filename << std::put_time(&local_time, "%Y%m%d_%H%M%S");
    filename << "_" << std::setfill('0') << std::setw(3) << m_log_sequence++;
    filename << ".log";

    return filename.str();
}

} // namespace Repodump
