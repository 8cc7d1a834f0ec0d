#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/Config.hpp"

namespace {

struct EnvGuard {
    explicit EnvGuard(std::vector<std::string> names)
        : names_(std::move(names)) {
        for (const auto& name : names_) {
            const char* current = std::getenv(name.c_str());
            saved_.push_back(current ? std::string{current} : std::string{});
            present_.push_back(current != nullptr);
        }
    }

    ~EnvGuard() {
        for (std::size_t i = 0; i < names_.size(); ++i) {
            if (present_[i]) {
                ::setenv(names_[i].c_str(), saved_[i].c_str(), 1);
            } else {
                ::unsetenv(names_[i].c_str());
            }
        }
    }

    void clearAll() {
        for (const auto& name : names_) {
            ::unsetenv(name.c_str());
        }
    }

    void set(const std::string& name, const std::string& value) { ::setenv(name.c_str(), value.c_str(), 1); }

    std::vector<std::string> names_;
    std::vector<std::string> saved_;
    std::vector<bool> present_;
};

::cds::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return ::cds::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

int main() {
    EnvGuard env({"CDS_DATA_DIR", "CDS_TICKER_MAP", "CDS_DEFAULT_DATASET", "CDS_CRYPTO_KEYWORDS", "LOG_LEVEL",
                  "CDS_SYNC_THREADS", "CDS_FALLBACK_DAYS", "CDS_FETCH_TIMEOUT_MS"});
    env.clearAll();

    const auto base = std::filesystem::temp_directory_path() / "cds_config_test";
    const auto envDir = base / "env";
    const auto flagDir = base / "flag";
    std::filesystem::remove_all(base);

    // Defaults.
    auto defaults = runConfig({"app", "--data-dir", envDir.string()});
    if (defaults.syncThreads != 4 || defaults.fallbackDays != 730 || defaults.fetchTimeoutMs != 30000) {
        std::cerr << "Unexpected numeric defaults: threads=" << defaults.syncThreads
                  << " fallback=" << defaults.fallbackDays << " timeout=" << defaults.fetchTimeoutMs << "\n";
        return 1;
    }
    if (defaults.defaultDatasetId != "ETHUSDT_2Y_OHLCV_Trans") {
        std::cerr << "Unexpected default dataset " << defaults.defaultDatasetId << "\n";
        return 1;
    }
    if (defaults.action != cds::common::Action::List || defaults.interval != "1d") {
        std::cerr << "Expected list action with 1d interval by default\n";
        return 1;
    }
    if (defaults.logLevel != cds::log::Level::Info) {
        std::cerr << "Expected info log level by default\n";
        return 1;
    }
    if (defaults.cryptoKeywords.size() != 7 || defaults.cryptoKeywords.front() != "USDT") {
        std::cerr << "Unexpected default crypto keywords\n";
        return 1;
    }
    if (defaults.tickerMapPath != (envDir / "dataset_tickers.json").string()) {
        std::cerr << "Ticker map should default inside the data dir, got " << defaults.tickerMapPath << "\n";
        return 1;
    }
    if (!std::filesystem::is_directory(envDir)) {
        std::cerr << "Expected data directory to be created\n";
        return 1;
    }
    std::filesystem::remove_all(base);

    // Environment overrides defaults.
    env.set("CDS_DATA_DIR", envDir.string());
    env.set("CDS_SYNC_THREADS", "2");
    env.set("CDS_FALLBACK_DAYS", "30");
    env.set("CDS_FETCH_TIMEOUT_MS", "1500");
    env.set("LOG_LEVEL", "WARNING");
    env.set("CDS_CRYPTO_KEYWORDS", "btc, sol ,");
    auto fromEnv = runConfig({"app"});
    if (fromEnv.dataDir != envDir.string() || fromEnv.syncThreads != 2 || fromEnv.fallbackDays != 30
        || fromEnv.fetchTimeoutMs != 1500) {
        std::cerr << "Environment values were not applied\n";
        return 1;
    }
    if (fromEnv.logLevel != cds::log::Level::Warn) {
        std::cerr << "Expected LOG_LEVEL=WARNING to map to Warn\n";
        return 1;
    }
    if (fromEnv.cryptoKeywords != std::vector<std::string>{"btc", "sol"}) {
        std::cerr << "Crypto keyword list was not parsed\n";
        return 1;
    }

    // Flags override the environment.
    auto fromFlags = runConfig({"app", "--data-dir=" + flagDir.string(), "--threads", "8", "--fallback-days=5",
                                "--log-level", "debug", "--sync", "--datasets", "A, B", "--interval", "1w"});
    if (fromFlags.dataDir != flagDir.string() || fromFlags.syncThreads != 8 || fromFlags.fallbackDays != 5) {
        std::cerr << "Flag values did not override the environment\n";
        return 1;
    }
    if (fromFlags.fetchTimeoutMs != 1500) {
        std::cerr << "Environment value should survive when no flag is given\n";
        return 1;
    }
    if (fromFlags.logLevel != cds::log::Level::Debug || fromFlags.action != cds::common::Action::Sync) {
        std::cerr << "Expected debug level and sync action from flags\n";
        return 1;
    }
    if (fromFlags.datasets != std::vector<std::string>{"A", "B"} || fromFlags.interval != "1w") {
        std::cerr << "Dataset list or interval flag not parsed\n";
        return 1;
    }

    // Invalid values are rejected.
    bool threw = false;
    try {
        runConfig({"app", "--threads", "zero"});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Expected invalid thread count to throw\n";
        return 1;
    }

    threw = false;
    try {
        runConfig({"app", "--log-level", "verbose"});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Expected unknown log level to throw\n";
        return 1;
    }

    threw = false;
    try {
        runConfig({"app", "--sync", "--payload"});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Expected --sync with --payload to throw\n";
        return 1;
    }

    // Log records.
    const auto record = cds::log::formatRecord(cds::log::Level::Warn, "disk almost full",
                                               std::chrono::system_clock::time_point{}, "42");
    if (record.size() < 2 || record.front() != '['
        || record.find("] [WARN] [thread 42] disk almost full") == std::string::npos) {
        std::cerr << "Unexpected log record: " << record << "\n";
        return 1;
    }
    if (cds::log::levelFromString("Err") != cds::log::Level::Error
        || cds::log::levelFromString("DEBUG") != cds::log::Level::Debug) {
        std::cerr << "Level names should parse case-insensitively\n";
        return 1;
    }
    cds::log::setOutput(cds::log::Output::Stderr);
    if (cds::log::getOutput() != cds::log::Output::Stderr) {
        std::cerr << "Log output mode was not stored\n";
        return 1;
    }
    cds::log::setOutput(cds::log::Output::Split);

    std::filesystem::remove_all(base);
    return 0;
}
