/**
 * @file logger.cpp
 * @brief Implementation of the process-wide logger
 */

#include "logger.hpp"
#include <ctime>
#include <iostream>
#include <system_error>

Logger &Logger::getInstance() {
    static Logger instance;
    return instance;
}

/**
 * @brief Configures the logger
 *
 * Creates the parent directory of the log file if needed and opens the file
 * in append mode. A failure to open the file leaves stderr logging in place.
 *
 * @param verbose If true, DEBUG messages are emitted
 * @param log_path Path of the log file, or empty to log to stderr only
 *
 * @return true if the logger is fully configured, false if the log file
 *         could not be opened
 */
bool Logger::init(bool verbose, const std::filesystem::path &log_path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_verbose = verbose;
    m_logFile.reset();

    if (log_path.empty()) {
        return true;
    }

    if (log_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }

    auto file = std::make_unique<std::ofstream>(log_path, std::ios::app);
    if (!file->is_open()) {
        std::cerr << "Cannot open log file " << log_path.string() << std::endl;
        return false;
    }
    m_logFile = std::move(file);
    return true;
}

void Logger::setConsoleEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console = enabled;
}

const char *Logger::levelName(Level level) {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        default:
            return "?";
    }
}

void Logger::log(Level level, const std::string &message) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (level == Level::Debug && !m_verbose) {
        return;
    }

    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char time_buf[64];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &local);

    std::string line = std::string("[") + time_buf + "] [" + levelName(level) +
                       "] " + message + "\n";

    if (m_logFile && m_logFile->is_open()) {
        *m_logFile << line;
        m_logFile->flush();
    }

    if (m_console) {
        std::cerr << line;
    }
}
