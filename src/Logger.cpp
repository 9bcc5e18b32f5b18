#include "Logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <fstream>

namespace filepush {

// Static member initialization
std::mutex Logger::log_mutex_;
LogLevel Logger::min_log_level_ = LogLevel::Info;
std::string Logger::log_file_path_;

namespace {
    std::string currentTimeString() {
        try {
            auto now = std::chrono::system_clock::now();
            auto time = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;

            std::stringstream ss;
            std::tm tm_buf;
            localtime_r(&time, &tm_buf);

            ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
               << '.' << std::setfill('0') << std::setw(3) << ms.count();
            return ss.str();
        }
        catch (const std::exception&) {
            return "TIME_ERROR";
        }
    }

    std::string levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:    return "[DEBUG]  ";
            case LogLevel::Info:     return "[INFO]   ";
            case LogLevel::Warning:  return "[WARNING]";
            case LogLevel::Error:    return "[ERROR]  ";
            case LogLevel::Fatal:    return "[FATAL]  ";
            default:                 return "[UNKNOWN]";
        }
    }

    std::string errorToString(ErrorCode code) {
        switch (code) {
            case ErrorCode::None:
                return "None";
            case ErrorCode::ConnectionBroken:
                return "ConnectionBroken";
            case ErrorCode::ProtocolDecodeFailure:
                return "ProtocolDecodeFailure";
            case ErrorCode::AckRejected:
                return "AckRejected";
            case ErrorCode::IntegrityMismatch:
                return "IntegrityMismatch";
            case ErrorCode::NameTooLong:
                return "NameTooLong";
            case ErrorCode::Timeout:
                return "Timeout";
            case ErrorCode::FileNotFound:
                return "FileNotFound";
            case ErrorCode::NotARegularFile:
                return "NotARegularFile";
            case ErrorCode::FileAccessError:
                return "FileAccessError";
            case ErrorCode::NetworkError:
                return "NetworkError";
            case ErrorCode::InvalidParameter:
                return "InvalidParameter";
            case ErrorCode::CryptoError:
                return "CryptoError";
            default:
                return "Unknown";
        }
    }
}

void Logger::logEvent(LogLevel level, std::string_view message) {
    try {
        std::lock_guard<std::mutex> lock(log_mutex_);
        if (level < min_log_level_) {
            return;
        }

        writeLine(levelToString(level) + " " + currentTimeString() + " " +
            std::string(message) + "\n");
    }
    catch (const std::exception& e) {
        // Fallback logging to stderr in case of errors
        std::cerr << "[LOGGING_ERROR] Failed to log message: " << e.what() << std::endl;
    }
}

// Errors are written regardless of the configured minimum level.
void Logger::logError(ErrorCode code, std::string_view details) {
    try {
        std::string fullMessage =
            levelToString(LogLevel::Error) + " " + currentTimeString() +
            " Code: " + errorToString(code) + " Details: " + std::string(details) + "\n";

        std::lock_guard<std::mutex> lock(log_mutex_);
        writeLine(fullMessage);
    }
    catch (const std::exception& e) {
        std::cerr << "[LOGGING_ERROR] Failed to log error: " << e.what() << std::endl;
    }
}

// Caller holds log_mutex_.
void Logger::writeLine(const std::string& line) {
    std::cerr << line << std::flush;

    if (!log_file_path_.empty()) {
        writeToFile(line);
    }
}

void Logger::writeToFile(std::string_view message) {
    try {
        std::ofstream file(log_file_path_, std::ios::app);
        if (file.is_open()) {
            file << message;
            file.flush();
        }
    }
    catch (const std::exception&) {
        std::cerr << "[FILE_ERROR] Failed to write to " << log_file_path_ << std::endl;
    }
}

void Logger::setLogLevel(LogLevel minLevel) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    min_log_level_ = minLevel;
}

void Logger::setLogFile(std::string_view path) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_file_path_ = path;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cerr.flush();
}

} // namespace filepush
