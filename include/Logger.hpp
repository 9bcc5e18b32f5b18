#pragma once

#include <string>
#include <mutex>
#include <string_view>
#include "TransferTypes.hpp"

namespace filepush {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Fatal
};

class Logger {
public:
    static void logEvent(LogLevel level, std::string_view message);
    static void logError(ErrorCode code, std::string_view details);

    static void setLogLevel(LogLevel minLevel);
    static void setLogFile(std::string_view path);

    static void flush();

private:
    static std::mutex log_mutex_;
    static LogLevel min_log_level_;
    static std::string log_file_path_;

    static void writeLine(const std::string& line);
    static void writeToFile(std::string_view message);

    Logger() = delete;
    ~Logger() = delete;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

} // namespace filepush
