#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace cds::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::size_t parseThreads(const std::string& value, const std::string& label) {
    try {
        const auto parsed = std::stoul(value);
        if (parsed == 0U || parsed > 256U) {
            throw std::out_of_range("threads out of range");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::int32_t parseDays(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stol(value, &consumed);
        if (consumed != value.size() || parsed < 0 || parsed > 365L * 100L) {
            throw std::out_of_range("days out of range");
        }
        return static_cast<std::int32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::uint32_t parseDurationMs(const std::string& value, const std::string& label) {
    try {
        const auto parsed = std::stoul(value);
        if (parsed == 0U || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("duration out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

cds::log::Level parseLevel(const std::string& value) {
    try {
        return cds::log::levelFromString(toLower(trim(value)));
    } catch (const std::invalid_argument& ex) {
        throw std::runtime_error(ex.what());
    }
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

std::string envValue(const char* name) {
    if (const char* raw = std::getenv(name)) {
        return trim(raw);
    }
    return {};
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (auto env = envValue("CDS_DATA_DIR"); !env.empty()) {
        config.dataDir = env;
    }
    if (auto env = envValue("CDS_TICKER_MAP"); !env.empty()) {
        config.tickerMapPath = env;
    }
    if (auto env = envValue("CDS_DEFAULT_DATASET"); !env.empty()) {
        config.defaultDatasetId = env;
    }
    if (auto env = envValue("CDS_CRYPTO_KEYWORDS"); !env.empty()) {
        config.cryptoKeywords = parseCsvList(env);
    }
    if (auto env = envValue("LOG_LEVEL"); !env.empty()) {
        config.logLevel = parseLevel(env);
    }
    if (auto env = envValue("CDS_SYNC_THREADS"); !env.empty()) {
        config.syncThreads = parseThreads(env, "CDS_SYNC_THREADS");
    }
    if (auto env = envValue("CDS_FALLBACK_DAYS"); !env.empty()) {
        config.fallbackDays = parseDays(env, "CDS_FALLBACK_DAYS");
    }
    if (auto env = envValue("CDS_FETCH_TIMEOUT_MS"); !env.empty()) {
        config.fetchTimeoutMs = parseDurationMs(env, "CDS_FETCH_TIMEOUT_MS");
    }

    if (auto dirArg = valueFromArgs(argc, argv, "--data-dir"); !dirArg.empty()) {
        config.dataDir = trim(dirArg);
    }
    if (auto mapArg = valueFromArgs(argc, argv, "--ticker-map"); !mapArg.empty()) {
        config.tickerMapPath = trim(mapArg);
    }
    if (auto defaultArg = valueFromArgs(argc, argv, "--default-dataset"); !defaultArg.empty()) {
        config.defaultDatasetId = trim(defaultArg);
    }
    if (auto keywordsArg = valueFromArgs(argc, argv, "--crypto-keywords"); !keywordsArg.empty()) {
        config.cryptoKeywords = parseCsvList(keywordsArg);
    }
    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = parseLevel(levelArg);
    }
    if (auto threadsArg = valueFromArgs(argc, argv, "--threads"); !threadsArg.empty()) {
        config.syncThreads = parseThreads(threadsArg, "--threads");
    }
    if (auto daysArg = valueFromArgs(argc, argv, "--fallback-days"); !daysArg.empty()) {
        config.fallbackDays = parseDays(daysArg, "--fallback-days");
    }
    if (auto timeoutArg = valueFromArgs(argc, argv, "--fetch-timeout-ms"); !timeoutArg.empty()) {
        config.fetchTimeoutMs = parseDurationMs(timeoutArg, "--fetch-timeout-ms");
    }
    if (auto datasetsArg = valueFromArgs(argc, argv, "--datasets"); !datasetsArg.empty()) {
        config.datasets = parseCsvList(datasetsArg);
    }
    if (auto intervalArg = valueFromArgs(argc, argv, "--interval"); !intervalArg.empty()) {
        config.interval = trim(intervalArg);
    }

    const bool wantsSync = hasFlag(argc, argv, "--sync");
    const bool wantsPayload = hasFlag(argc, argv, "--payload");
    if (wantsSync && wantsPayload) {
        throw std::runtime_error("--sync and --payload are mutually exclusive");
    }
    if (wantsSync) {
        config.action = Action::Sync;
    }
    else if (wantsPayload) {
        config.action = Action::Payload;
    }

    if (config.dataDir.empty()) {
        throw std::runtime_error("Data directory must not be empty");
    }
    if (config.tickerMapPath.empty()) {
        config.tickerMapPath = (std::filesystem::path{config.dataDir} / "dataset_tickers.json").string();
    }

    const std::filesystem::path dataPath{config.dataDir};
    std::error_code ec;
    std::filesystem::create_directories(dataPath, ec);
    if (ec) {
        throw std::runtime_error("Could not create data directory (" + dataPath.string() + "): " +
                                 ec.message());
    }

    LOG_DEBUG("Data directory: " << dataPath.string());

    return config;
}

const char* actionToString(Action action) noexcept {
    switch (action) {
    case Action::Sync:
        return "sync";
    case Action::Payload:
        return "payload";
    case Action::List:
    default:
        break;
    }
    return "list";
}

}  // namespace cds::common
