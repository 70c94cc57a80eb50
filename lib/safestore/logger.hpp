#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Process-wide leveled logger
 *
 * Writes "[timestamp] [LEVEL] message" lines to stderr and, when a log file
 * is configured, appends them to that file as well. DEBUG lines are dropped
 * unless verbose mode is enabled.
 */
class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    static Logger &getInstance();

    /**
     * @brief Configure verbosity and the optional log file
     * @param verbose Emit DEBUG lines when true
     * @param log_path File to append to, empty for stderr only
     * @return false if the log file could not be opened
     */
    bool init(bool verbose, const std::filesystem::path &log_path);

    /** @brief Silence stderr output (log file output is unaffected) */
    void setConsoleEnabled(bool enabled);

    void log(Level level, const std::string &message);

    static const char *levelName(Level level);

private:
    Logger() = default;

    bool m_verbose = false;
    bool m_console = true;
    std::unique_ptr<std::ofstream> m_logFile;
    std::mutex m_mutex;
};

#define LOG_DEBUG(msg) Logger::getInstance().log(Logger::Level::Debug, msg)
#define LOG_INFO(msg) Logger::getInstance().log(Logger::Level::Info, msg)
#define LOG_WARN(msg) Logger::getInstance().log(Logger::Level::Warn, msg)
#define LOG_ERROR(msg) Logger::getInstance().log(Logger::Level::Error, msg)

#endif // LOGGER_HPP
