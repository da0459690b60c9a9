#include "logger.h"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>
#include <filesystem>
#include <ctime>

namespace zc {

Logger::Logger()
    : currentLevel_(LogLevel::INFO),
      consoleLogging_(true) {
}

Logger::~Logger() {
    closeLogFile();
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setLogLevel(LogLevel level) {
    currentLevel_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::getLogLevel() const {
    return currentLevel_.load(std::memory_order_relaxed);
}

bool Logger::setOutputFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(logMutex_);

    if (logFile_.is_open()) {
        logFile_.close();
    }

    std::filesystem::path directory = std::filesystem::path(filename).parent_path();
    if (!directory.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            std::cerr << "Failed to create log directory " << directory << ": " << ec.message() << std::endl;
            return false;
        }
    }

    logFile_.open(filename, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        return false;
    }

    return true;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::enableConsoleLogging(bool enable) {
    consoleLogging_.store(enable, std::memory_order_relaxed);
}

void Logger::log(LogLevel level, const std::string& source, const std::string& message) {
    if (level == LogLevel::OFF || level < currentLevel_.load(std::memory_order_relaxed)) {
        return;
    }

    std::stringstream logStream;
    logStream << getCurrentTimestamp() << " ["
              << levelTag(level) << "] ["
              << source << "] "
              << message;

    std::string logMessage = logStream.str();

    std::lock_guard<std::mutex> lock(logMutex_);

    if (consoleLogging_.load(std::memory_order_relaxed)) {
        if (level >= LogLevel::ERROR) {
            std::cerr << logMessage << std::endl;
        } else {
            std::cout << logMessage << std::endl;
        }
    }

    if (logFile_.is_open()) {
        logFile_ << logMessage << std::endl;
    }
}

void Logger::trace(const std::string& source, const std::string& message) {
    log(LogLevel::TRACE, source, message);
}

void Logger::debug(const std::string& source, const std::string& message) {
    log(LogLevel::DEBUG, source, message);
}

void Logger::info(const std::string& source, const std::string& message) {
    log(LogLevel::INFO, source, message);
}

void Logger::warn(const std::string& source, const std::string& message) {
    log(LogLevel::WARN, source, message);
}

void Logger::error(const std::string& source, const std::string& message) {
    log(LogLevel::ERROR, source, message);
}

void Logger::fatal(const std::string& source, const std::string& message) {
    log(LogLevel::FATAL, source, message);
}

bool Logger::parseLevel(const std::string& name, LogLevel& level) {
    if (name == "trace") { level = LogLevel::TRACE; return true; }
    if (name == "debug") { level = LogLevel::DEBUG; return true; }
    if (name == "info")  { level = LogLevel::INFO;  return true; }
    if (name == "warn")  { level = LogLevel::WARN;  return true; }
    if (name == "error") { level = LogLevel::ERROR; return true; }
    if (name == "fatal") { level = LogLevel::FATAL; return true; }
    if (name == "off")   { level = LogLevel::OFF;   return true; }
    return false;
}

std::string Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::FATAL: return "fatal";
        case LogLevel::OFF:   return "off";
        default:              return "unknown";
    }
}

std::string Logger::levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default:              return "UNKN ";
    }
}

std::string Logger::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto nowTimeT = std::chrono::system_clock::to_time_t(now);
    auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm localTm{};
    localtime_r(&nowTimeT, &localTm);

    std::stringstream ss;
    ss << std::put_time(&localTm, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << nowMs.count();

    return ss.str();
}

} // namespace zc
