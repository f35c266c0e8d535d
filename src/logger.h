#ifndef FACESIFT_LOGGER_H
#define FACESIFT_LOGGER_H

#include <string>
#include <fstream>
#include <mutex>
#include <optional>
#include <cstddef>

namespace facesift {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& getInstance();

    // Log to a file instead of stderr; falls back to stderr if it can't be opened
    void setLogFile(const std::string& path);
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const { return min_level_; }

    // Keep at most this many lines in the log file (0 = unlimited)
    void setMaxLines(size_t max_lines);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // "debug", "info", "warning"/"warn", "error" (case-insensitive)
    static std::optional<LogLevel> parseLevel(const std::string& name);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string getCurrentTimestamp();
    std::string levelToString(LogLevel level);
    void rotateLogIfNeeded();

    std::ofstream log_file_;
    std::mutex mutex_;
    LogLevel min_level_ = LogLevel::INFO;
    bool console_output_ = true;
    std::string log_file_path_;
    size_t max_log_lines_ = 5000;
    size_t log_counter_ = 0;
};

} // namespace facesift

#endif // FACESIFT_LOGGER_H
