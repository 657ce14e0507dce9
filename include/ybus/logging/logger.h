#pragma once

#include <chrono>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace ybus {
namespace logging {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE = 0,  // Chain walk decisions
    DEBUG = 1,  // Debug information
    INFO = 2,   // General information
    WARN = 3,   // Warning messages
    ERROR = 4,  // Error messages
    OFF = 5     // Disable logging
};

/**
 * @brief Log output destinations
 */
enum class LogOutput {
    CONSOLE,  // Standard output (std::cout)
    FILE,     // File output
    BUFFER,   // In-memory buffer
    NONE      // No output
};

/**
 * @brief Process-wide logger with configurable level and destination
 *
 * Disabled levels cost one comparison when used through the LOG_* macros, the
 * arguments are never formatted. Message writes are serialised by an internal mutex.
 */
class Logger {
  private:
    LogLevel current_level_;
    LogOutput output_type_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::ostringstream buffer_;
    mutable std::mutex mutex_;
    std::string component_name_;

    static Logger* instance_;
    static std::mutex instance_mutex_;

  public:
    /**
     * @brief Get the singleton logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Configure the logger
     */
    void configure(LogLevel level, LogOutput output, std::string const& filename = "");

    /**
     * @brief Set component name for context
     */
    void setComponent(std::string const& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        component_name_ = name;
    }

    LogLevel getLevel() const noexcept { return current_level_; }
    LogOutput getOutput() const noexcept { return output_type_; }

    constexpr bool isEnabled(LogLevel level) const noexcept {
        return level >= current_level_ && level != LogLevel::OFF &&
               output_type_ != LogOutput::NONE;
    }

    /**
     * @brief Log a message followed by space-separated arguments
     */
    template <typename... Args>
    inline void log(LogLevel level, std::string const& message, Args&&... args) {
        if (!isEnabled(level)) return;

        std::ostringstream oss;
        oss << message;

        if constexpr (sizeof...(args) > 0) {
            ((oss << " " << args), ...);
        }

        writeMessage(level, oss.str());
    }

    /**
     * @brief Flush any buffered output
     */
    void flush();

    /**
     * @brief Get current buffer contents (for BUFFER output)
     */
    std::string getBuffer() const;

    /**
     * @brief Clear buffer contents
     */
    void clearBuffer();

    /**
     * @brief Parse a level name (TRACE, DEBUG, INFO, WARN, ERROR, OFF)
     */
    static std::optional<LogLevel> parseLevel(std::string const& name) noexcept;

    /**
     * @brief Parse an output name (CONSOLE, FILE, BUFFER, NONE)
     */
    static std::optional<LogOutput> parseOutput(std::string const& name) noexcept;

    static std::string levelToString(LogLevel level) noexcept;

  private:
    Logger() noexcept : current_level_(LogLevel::INFO), output_type_(LogOutput::CONSOLE) {}

    void writeMessage(LogLevel level, std::string const& message);
    std::string getCurrentTime() const;
};

#define LOG_TRACE(logger, ...)                                         \
    do {                                                               \
        if (logger.isEnabled(::ybus::logging::LogLevel::TRACE))        \
            logger.log(::ybus::logging::LogLevel::TRACE, __VA_ARGS__); \
    } while (0)

#define LOG_DEBUG(logger, ...)                                         \
    do {                                                               \
        if (logger.isEnabled(::ybus::logging::LogLevel::DEBUG))        \
            logger.log(::ybus::logging::LogLevel::DEBUG, __VA_ARGS__); \
    } while (0)

#define LOG_INFO(logger, ...)                                         \
    do {                                                              \
        if (logger.isEnabled(::ybus::logging::LogLevel::INFO))        \
            logger.log(::ybus::logging::LogLevel::INFO, __VA_ARGS__); \
    } while (0)

#define LOG_WARN(logger, ...)                                         \
    do {                                                              \
        if (logger.isEnabled(::ybus::logging::LogLevel::WARN))        \
            logger.log(::ybus::logging::LogLevel::WARN, __VA_ARGS__); \
    } while (0)

#define LOG_ERROR(logger, ...)                                         \
    do {                                                               \
        if (logger.isEnabled(::ybus::logging::LogLevel::ERROR))        \
            logger.log(::ybus::logging::LogLevel::ERROR, __VA_ARGS__); \
    } while (0)

// Global logger instance for convenience
extern Logger& global_logger;

}  // namespace logging
}  // namespace ybus
