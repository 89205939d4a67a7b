// =================================================================
// include/Repodump/Logger.hpp
// =================================================================
// Header for leveled diagnostics on stderr and rotating log files.

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>

namespace Repodump {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR       ///< Error conditions
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

struct CollectionStats;
struct BudgetResult;

/**
 * @brief Process-wide logger
 *
 * Console output goes to stderr so that a dump written to stdout stays
 * clean. File output is off until initialize() is given a directory.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files (empty disables file logging)
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = "",
                    size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                    size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log file collection results
     * @param stats Counters gathered by the collector
     */
    void logCollection(const CollectionStats& stats);

    /**
     * @brief Log budget enforcement results
     * @param result Outcome of the budget pass
     * @param max_tokens Configured cap (0 when unset)
     */
    void logBudget(const BudgetResult& result, std::uint64_t max_tokens);

    /**
     * @brief Log session start
     * @param root Directory being dumped
     * @param format Output format
     */
    void logSessionStart(const std::string& root, const std::string& format);

    /**
     * @brief Log session end
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

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
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_color = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;
    size_t m_log_sequence = 0;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Start a new file once the current one passes the size limit,
     *        keeping at most m_max_log_files files
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    bool ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging; an optional third argument is the context
#define LOG_DEBUG(component, ...) \
    Repodump::Logger::getInstance().debug(component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    Repodump::Logger::getInstance().info(component, __VA_ARGS__)

#define LOG_WARNING(component, ...) \
    Repodump::Logger::getInstance().warning(component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    Repodump::Logger::getInstance().error(component, __VA_ARGS__)

} // namespace Repodump
