#pragma once

#include <cstdlib>
#include <string>

#include "ybus/logging/logger.h"

namespace ybus {
namespace logging {

/**
 * @brief Logging presets
 *
 * - Development: DEBUG to console
 * - Testing: INFO into the in-memory buffer
 * - Production: WARN appended to a file
 * - Benchmarking: nothing
 */
class LogConfig {
  public:
    static void forDevelopment() {
        Logger::getInstance().configure(LogLevel::DEBUG, LogOutput::CONSOLE);
    }

    static void forTesting() { Logger::getInstance().configure(LogLevel::INFO, LogOutput::BUFFER); }

    static void forProduction(std::string const& logfile = "ybus.log") {
        Logger::getInstance().configure(LogLevel::WARN, LogOutput::FILE, logfile);
    }

    static void forBenchmarking() {
        Logger::getInstance().configure(LogLevel::OFF, LogOutput::NONE);
    }

    /**
     * @brief Configure from YBUS_LOG_LEVEL, YBUS_LOG_OUTPUT and YBUS_LOG_FILE
     *
     * Unset or unrecognised values fall back to INFO on the console, file "ybus.log".
     */
    static void fromEnvironment() {
        char const* level_env = std::getenv("YBUS_LOG_LEVEL");
        char const* output_env = std::getenv("YBUS_LOG_OUTPUT");
        char const* file_env = std::getenv("YBUS_LOG_FILE");

        LogLevel level = LogLevel::INFO;
        if (level_env) {
            level = Logger::parseLevel(level_env).value_or(LogLevel::INFO);
        }

        LogOutput output = LogOutput::CONSOLE;
        if (output_env) {
            output = Logger::parseOutput(output_env).value_or(LogOutput::CONSOLE);
        }

        std::string filename = file_env ? file_env : "ybus.log";
        Logger::getInstance().configure(level, output, filename);
    }

    /**
     * @brief Per-insertion chain tracing on the console
     */
    static void enableTraceMode() {
        Logger::getInstance().configure(LogLevel::TRACE, LogOutput::CONSOLE);
    }
};

}  // namespace logging
}  // namespace ybus
