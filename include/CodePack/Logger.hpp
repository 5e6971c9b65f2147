// =================================================================
// include/CodePack/Logger.hpp
// =================================================================
// Header for levelled console and rotating file logging.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>

namespace CodePack {

struct PackResult;

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
 * @brief Process-wide logger with console and rotating file outputs
 *
 * Console output goes to stderr so that packed content written to stdout
 * stays clean. The file sink is opened lazily on the first entry unless
 * file logging has been disabled.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize the file sink
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".codepack/logs",
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

    /**
     * @brief Enable or disable the rotating file sink
     * @param enabled True to write log files
     */
    void setFileLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of a tree scan
     * @param root_path Scanned root
     * @param project_type Detected project type
     * @param total_files Number of files in the tree
     * @param duration_ms Scan duration in milliseconds
     */
    void logScanCompleted(const std::string& root_path, const std::string& project_type,
                          size_t total_files, long duration_ms);

    /**
     * @brief Log packing statistics and any skipped files
     * @param result Pack result
     * @param format_name Export format name
     */
    void logPackCompleted(const PackResult& result, const std::string& format_name);

    /**
     * @brief Log secret scan totals
     * @param files_scanned Number of files read
     * @param files_flagged Number of files with at least one match
     * @param total_matches Number of matches across all files
     */
    void logSecretScan(size_t files_scanned, size_t files_flagged, size_t total_matches);

    /**
     * @brief Log session start
     * @param command Command being executed
     * @param target Project root or argument the command works on
     */
    void logSessionStart(const std::string& command, const std::string& target);

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

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

    /**
     * @brief Parse a level name such as "debug" or "warning"
     * @param name Level name (case-insensitive)
     * @param level Receives the parsed level
     * @return True if the name was recognized
     */
    static bool parseLevel(const std::string& name, LogLevel& level);

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
    bool m_console_enabled = true;
    bool m_file_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);
    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging; an optional third argument is the context
#define LOG_DEBUG(component, ...) \
    CodePack::Logger::getInstance().debug(component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    CodePack::Logger::getInstance().info(component, __VA_ARGS__)

#define LOG_WARNING(component, ...) \
    CodePack::Logger::getInstance().warning(component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    CodePack::Logger::getInstance().error(component, __VA_ARGS__)

#define LOG_CRITICAL(component, ...) \
    CodePack::Logger::getInstance().critical(component, __VA_ARGS__)

} // namespace CodePack
