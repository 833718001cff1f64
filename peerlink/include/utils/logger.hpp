#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>

namespace peerlink {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& getInstance();

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    /**
     * Append to filename as well as the console. Returns false when the file
     * cannot be opened; console output is unaffected.
     */
    bool setLogFile(const std::string& filename);
    void closeLogFile();

    void setMinLevel(LogLevel level);
    LogLevel minLevel();

    // Console lines go to stdout, ERROR to stderr. Disabled, only the file is written.
    void setConsoleEnabled(bool enabled);

    /**
     * Parse "debug", "info", "warning" or "error" (case-insensitive).
     * Returns false and leaves level untouched on anything else.
     */
    static bool parseLevel(const std::string& name, LogLevel& level);
    static std::string levelToString(LogLevel level);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex mutex_;
    std::ofstream log_file_;
    bool file_logging_enabled_ = false;
    bool console_enabled_ = true;
    LogLevel min_level_ = LogLevel::INFO;

    std::string getCurrentTime();
};

} // namespace peerlink

#endif // LOGGER_HPP
