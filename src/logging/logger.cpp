#include "ybus/logging/logger.h"

#include <ctime>
#include <iostream>

namespace ybus {
namespace logging {

Logger* Logger::instance_ = nullptr;
std::mutex Logger::instance_mutex_;

Logger& global_logger = Logger::getInstance();

Logger& Logger::getInstance() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (instance_ == nullptr) {
        instance_ = new Logger();
    }
    return *instance_;
}

void Logger::configure(LogLevel level, LogOutput output, std::string const& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    current_level_ = level;
    output_type_ = output;

    if (output == LogOutput::FILE) {
        file_stream_.reset();
        if (!filename.empty()) {
            file_stream_ = std::make_unique<std::ofstream>(filename, std::ios::app);
        }
        if (!file_stream_ || !file_stream_->is_open()) {
            output_type_ = LogOutput::CONSOLE;
            std::cerr << "Warning: Cannot open log file '" << filename
                      << "', falling back to console output" << std::endl;
        }
    }
}

void Logger::writeMessage(LogLevel level, std::string const& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream formatted;
    formatted << getCurrentTime() << " [" << levelToString(level) << "]";

    if (!component_name_.empty()) {
        formatted << " [" << component_name_ << "]";
    }

    formatted << " " << message;

    switch (output_type_) {
        case LogOutput::CONSOLE:
            if (level >= LogLevel::ERROR) {
                std::cerr << formatted.str() << std::endl;
            } else {
                std::cout << formatted.str() << std::endl;
            }
            break;

        case LogOutput::FILE:
            if (file_stream_ && file_stream_->is_open()) {
                *file_stream_ << formatted.str() << std::endl;
            }
            break;

        case LogOutput::BUFFER:
            buffer_ << formatted.str() << "\n";
            break;

        case LogOutput::NONE:
            break;
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (output_type_ == LogOutput::FILE && file_stream_) {
        file_stream_->flush();
    } else if (output_type_ == LogOutput::CONSOLE) {
        std::cout.flush();
    }
}

std::string Logger::getBuffer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.str();
}

void Logger::clearBuffer() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.str("");
    buffer_.clear();
}

std::string Logger::getCurrentTime() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::optional<LogLevel> Logger::parseLevel(std::string const& name) noexcept {
    if (name == "TRACE") return LogLevel::TRACE;
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "INFO") return LogLevel::INFO;
    if (name == "WARN") return LogLevel::WARN;
    if (name == "ERROR") return LogLevel::ERROR;
    if (name == "OFF") return LogLevel::OFF;
    return std::nullopt;
}

std::optional<LogOutput> Logger::parseOutput(std::string const& name) noexcept {
    if (name == "CONSOLE") return LogOutput::CONSOLE;
    if (name == "FILE") return LogOutput::FILE;
    if (name == "BUFFER") return LogOutput::BUFFER;
    if (name == "NONE") return LogOutput::NONE;
    return std::nullopt;
}

std::string Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::OFF:
            return "OFF";
        default:
            return "UNKNOWN";
    }
}

}  // namespace logging
}  // namespace ybus
