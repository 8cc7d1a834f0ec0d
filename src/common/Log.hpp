#pragma once

#include <chrono>
#include <sstream>
#include <string>
#include <string_view>

namespace cds::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Split sends Debug/Info to stdout and Warn/Error to stderr. Stderr keeps
// stdout free for command output.
enum class Output {
    Split,
    Stderr,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;

void setOutput(Output output) noexcept;
Output getOutput() noexcept;

void log(Level level, const std::string& message);

// "[2024-03-01 09:30:00.123] [INFO] [thread 1234] message", local time.
std::string formatRecord(Level level,
                         std::string_view message,
                         std::chrono::system_clock::time_point when,
                         std::string_view threadTag);

const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

}  // namespace cds::log

#define CDS_LOG_IMPL(level, expr)                                                          \
    do {                                                                                   \
        if (::cds::log::shouldLog(level)) {                                                \
            std::ostringstream cds_log_stream__;                                           \
            cds_log_stream__ << expr;                                                      \
            ::cds::log::log(level, cds_log_stream__.str());                                \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) CDS_LOG_IMPL(::cds::log::Level::Debug, expr)
#define LOG_INFO(expr) CDS_LOG_IMPL(::cds::log::Level::Info, expr)
#define LOG_WARN(expr) CDS_LOG_IMPL(::cds::log::Level::Warn, expr)
#define LOG_ERR(expr) CDS_LOG_IMPL(::cds::log::Level::Error, expr)
