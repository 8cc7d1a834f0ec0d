#include "common/Log.hpp"

#include <array>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace cds::log {
namespace {

struct LevelName {
    Level level;
    const char* label;
};

constexpr std::array<LevelName, 4> kLevelNames{{
    {Level::Debug, "DEBUG"},
    {Level::Info, "INFO"},
    {Level::Warn, "WARN"},
    {Level::Error, "ERROR"},
}};

std::atomic<Level> g_level{Level::Info};
std::atomic<Output> g_output{Output::Split};
std::mutex g_writeMutex;

std::tm toLocalTm(std::time_t seconds) {
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &seconds);
#else
    localtime_r(&seconds, &tm);
#endif
    return tm;
}

std::ostream& sinkFor(Level level) {
    if (g_output.load(std::memory_order_relaxed) == Output::Stderr || level >= Level::Warn) {
        return std::cerr;
    }
    return std::cout;
}

std::string currentThreadTag() {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return oss.str();
}

}  // namespace

void setLevel(Level level) noexcept { g_level.store(level, std::memory_order_relaxed); }

Level getLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

bool shouldLog(Level level) noexcept { return level >= getLevel(); }

void setOutput(Output output) noexcept { g_output.store(output, std::memory_order_relaxed); }

Output getOutput() noexcept { return g_output.load(std::memory_order_relaxed); }

std::string formatRecord(Level level,
                         std::string_view message,
                         std::chrono::system_clock::time_point when,
                         std::string_view threadTag) {
    const auto seconds = std::chrono::system_clock::to_time_t(when);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;
    const auto tm = toLocalTm(seconds);

    char stamp[32];
    const auto written = std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);
    char fraction[8];
    std::snprintf(fraction, sizeof(fraction), ".%03d", static_cast<int>(millis < 0 ? millis + 1000 : millis));

    std::string record;
    record.reserve(written + message.size() + threadTag.size() + 32);
    record.append("[").append(stamp, written).append(fraction).append("] [");
    record.append(levelToString(level)).append("] [thread ");
    record.append(threadTag).append("] ");
    record.append(message);
    return record;
}

void log(Level level, const std::string& message) {
    const auto record = formatRecord(level, message, std::chrono::system_clock::now(), currentThreadTag());

    std::lock_guard<std::mutex> lock(g_writeMutex);
    sinkFor(level) << record << std::endl;
}

const char* levelToString(Level level) noexcept {
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.label;
        }
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char ch : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }

    if (lower == "warning") {
        return Level::Warn;
    }
    if (lower == "err") {
        return Level::Error;
    }
    for (const auto& entry : kLevelNames) {
        std::string label{entry.label};
        for (auto& ch : label) {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        if (label == lower) {
            return entry.level;
        }
    }

    throw std::invalid_argument("Unknown log level: " + std::string{text});
}

}  // namespace cds::log
