#ifndef PROWL_LOGGER_HPP
#define PROWL_LOGGER_HPP

#include <string>
#include <fstream>
#include <functional>
#include <mutex>
#include <iostream>

namespace prowl {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    // Receives every formatted entry. Used to route client diagnostics
    // into the embedding application's own log.
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance();

    Logger() = default;
    explicit Logger(Sink sink);
    ~Logger() = default;

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    void setLogFile(const std::string& filename);

    static std::string levelToString(LogLevel level);

private:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex mutex_;
    Sink sink_;
    std::ofstream log_file_;
    bool file_logging_enabled_ = false;

    std::string getCurrentTime();
};

} // namespace prowl

#endif // PROWL_LOGGER_HPP
