#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>

namespace zc {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL,
    OFF
};

/**
 * @brief Process-wide logger shared by the engine, the coordinator and the API
 */
class Logger {
public:
    /**
     * @brief Get the singleton instance of the Logger
     *
     * @return Logger& The logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Set the global log level
     *
     * @param level The new log level
     */
    void setLogLevel(LogLevel level);

    /**
     * @brief Get the current log level
     *
     * @return LogLevel The current log level
     */
    LogLevel getLogLevel() const;

    /**
     * @brief Set the output file for logging
     *
     * @param filename Path to the log file
     * @return true if file was opened successfully, false otherwise
     */
    bool setOutputFile(const std::string& filename);

    /**
     * @brief Close the current log file if open
     */
    void closeLogFile();

    /**
     * @brief Enable or disable console logging
     *
     * @param enable True to enable console logging, false to disable
     */
    void enableConsoleLogging(bool enable);

    /**
     * @brief Log a message at the specified level
     *
     * @param level The log level for this message
     * @param source The source of the log message (e.g., class name)
     * @param message The message to log
     */
    void log(LogLevel level, const std::string& source, const std::string& message);

    // Convenience methods for different log levels
    void trace(const std::string& source, const std::string& message);
    void debug(const std::string& source, const std::string& message);
    void info(const std::string& source, const std::string& message);
    void warn(const std::string& source, const std::string& message);
    void error(const std::string& source, const std::string& message);
    void fatal(const std::string& source, const std::string& message);

    /**
     * @brief Parse a lowercase level name ("trace" .. "off")
     *
     * @param name Level name
     * @param level Receives the parsed level
     * @return true if the name was recognised
     */
    static bool parseLevel(const std::string& name, LogLevel& level);

    /**
     * @brief Lowercase name of a level, the inverse of parseLevel()
     */
    static std::string levelName(LogLevel level);

    ~Logger();

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // Fixed-width tag used in the log line
    static std::string levelTag(LogLevel level);

    static std::string getCurrentTimestamp();

    std::atomic<LogLevel> currentLevel_;
    std::atomic<bool> consoleLogging_;
    std::ofstream logFile_;
    std::mutex logMutex_;
};

#define LOG_TRACE(source, message) zc::Logger::getInstance().trace(source, message)
#define LOG_DEBUG(source, message) zc::Logger::getInstance().debug(source, message)
#define LOG_INFO(source, message) zc::Logger::getInstance().info(source, message)
#define LOG_WARN(source, message) zc::Logger::getInstance().warn(source, message)
#define LOG_ERROR(source, message) zc::Logger::getInstance().error(source, message)
#define LOG_FATAL(source, message) zc::Logger::getInstance().fatal(source, message)

} // namespace zc
