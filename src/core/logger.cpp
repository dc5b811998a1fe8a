/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "conics/core/logger.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace conics {

LogLevel Logger::s_min_level = LogLevel::Info;
LogOutput Logger::s_output = LogOutput::Console;
std::ofstream Logger::s_file;

namespace {

const char* level_tag(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   break;
    }
    return "?";
}

std::string timestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time), "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // anonymous namespace

void Logger::init(LogOutput output, LogLevel min_level, const std::string& log_dir)
{
    shutdown();
    s_output = output;
    s_min_level = min_level;

    if (output == LogOutput::File || output == LogOutput::Both) {
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::ostringstream filename;
        filename << log_dir << "/conics_"
                 << std::put_time(std::localtime(&time), "%Y%m%d_%H%M%S")
                 << ".log";

        s_file.open(filename.str(), std::ios::out | std::ios::trunc);
        if (!s_file.is_open()) {
            fmt::print(stderr, "[Logger] Failed to open log file: {}\n", filename.str());
        }
    }
}

void Logger::shutdown()
{
    if (s_file.is_open()) {
        s_file.close();
    }
}

void Logger::log(LogLevel level, std::string_view message)
{
    if (s_output == LogOutput::Console || s_output == LogOutput::Both) {
        std::FILE* stream = (level == LogLevel::Error) ? stderr : stdout;
        fmt::print(stream, "[{}] {}\n", level_tag(level), message);
    }

    if ((s_output == LogOutput::File || s_output == LogOutput::Both) && s_file.is_open()) {
        s_file << '[' << level_tag(level) << "] [" << timestamp() << "] "
               << message << '\n';
        s_file.flush();
    }
}

LogLevel parse_log_level(std::string_view name)
{
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off")   return LogLevel::Off;
    return LogLevel::Info;
}

LogOutput parse_log_output(std::string_view name)
{
    if (name == "file") return LogOutput::File;
    if (name == "both") return LogOutput::Both;
    return LogOutput::Console;
}

} // namespace conics
