#pragma once
/**
 * @file logger.h
 * @brief Leveled logging with fmt format strings
 *
 * Static logger writing to the console, a timestamped file, or both.
 * Messages below the configured level are not formatted.
 */

#include "conics/core/types.h"
#include <fmt/core.h>
#include <fstream>
#include <string>
#include <string_view>

namespace conics {

enum class LogLevel : UInt8 { Debug, Info, Warn, Error, Off };
enum class LogOutput : UInt8 { Console, File, Both };

class Logger {
public:
    /**
     * @brief Configure output and level
     * @param output Console, File or Both
     * @param min_level Lowest level emitted
     * @param log_dir Directory for the log file (created if missing)
     */
    static void init(LogOutput output = LogOutput::Console,
                     LogLevel min_level = LogLevel::Info,
                     const std::string& log_dir = "logs");
    static void shutdown();

    static void set_level(LogLevel level) { s_min_level = level; }
    static void set_output(LogOutput output) { s_output = output; }
    static LogLevel get_level() { return s_min_level; }
    static LogOutput get_output() { return s_output; }

    template<typename... Args>
    static void debug(fmt::format_string<Args...> f, Args&&... args)
    {
        if (s_min_level <= LogLevel::Debug)
            log(LogLevel::Debug, fmt::format(f, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void info(fmt::format_string<Args...> f, Args&&... args)
    {
        if (s_min_level <= LogLevel::Info)
            log(LogLevel::Info, fmt::format(f, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void warn(fmt::format_string<Args...> f, Args&&... args)
    {
        if (s_min_level <= LogLevel::Warn)
            log(LogLevel::Warn, fmt::format(f, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void error(fmt::format_string<Args...> f, Args&&... args)
    {
        if (s_min_level <= LogLevel::Error)
            log(LogLevel::Error, fmt::format(f, std::forward<Args>(args)...));
    }

private:
    static void log(LogLevel level, std::string_view message);

    static LogLevel s_min_level;
    static LogOutput s_output;
    static std::ofstream s_file;
};

/// Parse "debug", "info", "warn", "error", "off" (case-sensitive); Info otherwise
LogLevel parse_log_level(std::string_view name);

/// Parse "console", "file", "both"; Console otherwise
LogOutput parse_log_output(std::string_view name);

} // namespace conics
