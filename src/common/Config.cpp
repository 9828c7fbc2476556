#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "domain/Errors.hpp"
#include "domain/Timeframe.hpp"

namespace tfsync::common {
namespace {

using domain::ConfigurationError;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
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

std::uint64_t parseUnsigned(const std::string& value, const std::string& label, std::uint64_t maxValue) {
    const auto text = trim(value);
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char ch) {
            return std::isdigit(ch) != 0;
        })) {
        throw ConfigurationError("invalid value for " + label + ": " + value);
    }
    try {
        const auto parsed = std::stoull(text);
        if (parsed > maxValue) {
            throw ConfigurationError("value out of range for " + label + ": " + value);
        }
        return parsed;
    } catch (const std::out_of_range&) {
        throw ConfigurationError("value out of range for " + label + ": " + value);
    }
}

std::size_t parsePositiveSize(const std::string& value, const std::string& label) {
    const auto parsed = parseUnsigned(value, label, std::numeric_limits<std::uint32_t>::max());
    if (parsed == 0U) {
        throw ConfigurationError(label + " must be >= 1");
    }
    return static_cast<std::size_t>(parsed);
}

std::uint32_t parseMillis(const std::string& value, const std::string& label) {
    return static_cast<std::uint32_t>(
        parseUnsigned(value, label, std::numeric_limits<std::uint32_t>::max()));
}

int parsePositiveInt(const std::string& value, const std::string& label) {
    const auto parsed = parseUnsigned(value, label, static_cast<std::uint64_t>(std::numeric_limits<int>::max()));
    if (parsed == 0U) {
        throw ConfigurationError(label + " must be >= 1");
    }
    return static_cast<int>(parsed);
}

double parseHours(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto text = trim(value);
        const double parsed = std::stod(text, &consumed);
        if (consumed != text.size() || !(parsed > 0.0)) {
            throw ConfigurationError(label + " must be a positive number: " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigurationError("invalid value for " + label + ": " + value);
    }
}

BootstrapMode parseBootstrapMode(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "fresh" || normalized == "fresh-start" || normalized == "fresh_start") {
        return BootstrapMode::FreshStart;
    }
    if (normalized == "incremental") {
        return BootstrapMode::Incremental;
    }
    throw ConfigurationError("invalid bootstrap mode: " + value);
}

tfsync::log::Level parseLogLevel(const std::string& value) {
    try {
        return tfsync::log::levelFromString(trim(value));
    } catch (const std::invalid_argument& ex) {
        throw ConfigurationError(ex.what());
    }
}

// "1h:1,1m:4" -> {{"1h","1"},{"1m","4"}}
std::vector<std::pair<std::string, std::string>> parseKeyedList(const std::string& value,
                                                                const std::string& label) {
    std::vector<std::pair<std::string, std::string>> pairs;
    for (const auto& item : parseCsvList(value)) {
        const auto colon = item.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == item.size()) {
            throw ConfigurationError("invalid entry for " + label + " (expected tf:value): " + item);
        }
        pairs.emplace_back(trim(item.substr(0, colon)), trim(item.substr(colon + 1)));
    }
    return pairs;
}

// Either a single count applied to every timeframe or a keyed list.
void applySizeSetting(const std::string& value,
                      const std::string& label,
                      std::size_t& global,
                      std::map<std::string, std::size_t>& overrides) {
    if (value.find(':') == std::string::npos) {
        global = parsePositiveSize(value, label);
        return;
    }
    for (const auto& [tf, count] : parseKeyedList(value, label)) {
        overrides[tf] = parsePositiveSize(count, label);
    }
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
    if (const char* value = std::getenv(name)) {
        return trim(value);
    }
    return {};
}

}  // namespace

const char* to_string(BootstrapMode mode) noexcept {
    return mode == BootstrapMode::FreshStart ? "fresh" : "incremental";
}

std::vector<domain::TimeframeSpec> Config::timeframeSpecs() const {
    if (timeframes.empty()) {
        throw ConfigurationError("at least one timeframe is required");
    }

    std::vector<domain::TimeframeSpec> specs;
    specs.reserve(timeframes.size());
    std::set<std::string> seen;
    for (const auto& tf : timeframes) {
        if (!seen.insert(tf).second) {
            throw ConfigurationError("duplicate timeframe: " + tf);
        }
        domain::TimeframeSpec spec{};
        spec.timeframe = tf;
        spec.intervalSeconds = domain::timeframe_seconds(tf);
        spec.windowCapacity = windowSize;
        spec.initialCandles = initialCandles;
        if (auto it = windowSizeOverrides.find(tf); it != windowSizeOverrides.end()) {
            spec.windowCapacity = it->second;
        }
        if (auto it = initialCandleOverrides.find(tf); it != initialCandleOverrides.end()) {
            spec.initialCandles = it->second;
        }
        specs.push_back(std::move(spec));
    }

    const auto checkKnown = [&seen](const auto& overrides, const char* label) {
        for (const auto& entry : overrides) {
            if (seen.count(entry.first) == 0U) {
                throw ConfigurationError(std::string{label} + " names unconfigured timeframe: " + entry.first);
            }
        }
    };
    checkKnown(rankOverrides, "--ranks");
    checkKnown(windowSizeOverrides, "--window-sizes");
    checkKnown(initialCandleOverrides, "--initial-candles");

    std::stable_sort(specs.begin(), specs.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.intervalSeconds > rhs.intervalSeconds;
    });
    for (std::size_t i = 0; i < specs.size(); ++i) {
        if (i > 0 && specs[i].intervalSeconds == specs[i - 1].intervalSeconds) {
            throw ConfigurationError("timeframes " + specs[i - 1].timeframe + " and " + specs[i].timeframe +
                                     " share the same interval");
        }
        specs[i].rank = static_cast<int>(i) + 1;
        if (auto it = rankOverrides.find(specs[i].timeframe); it != rankOverrides.end()) {
            specs[i].rank = it->second;
        }
    }

    const auto& fastest = specs.back();
    for (std::size_t i = 0; i + 1 < specs.size(); ++i) {
        if (specs[i].rank >= fastest.rank) {
            throw ConfigurationError("fastest timeframe " + fastest.timeframe +
                                     " must have the strictly lowest priority (rank " +
                                     std::to_string(fastest.rank) + " vs " + specs[i].timeframe + " rank " +
                                     std::to_string(specs[i].rank) + ")");
        }
    }

    return specs;
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (auto env = envValue("LOG_LEVEL"); !env.empty()) {
        config.logLevel = parseLogLevel(env);
    }
    if (auto env = envValue("SYMBOLS"); !env.empty()) {
        config.symbols = parseCsvList(env);
    }
    if (auto env = envValue("TIMEFRAMES"); !env.empty()) {
        config.timeframes = parseCsvList(env);
    }
    if (auto env = envValue("WINDOW_SIZE"); !env.empty()) {
        applySizeSetting(env, "WINDOW_SIZE", config.windowSize, config.windowSizeOverrides);
    }
    if (auto env = envValue("INITIAL_CANDLES"); !env.empty()) {
        applySizeSetting(env, "INITIAL_CANDLES", config.initialCandles, config.initialCandleOverrides);
    }
    if (auto env = envValue("BOOTSTRAP_MODE"); !env.empty()) {
        config.bootstrapMode = parseBootstrapMode(env);
    }
    if (auto env = envValue("MAX_GAP_HOURS"); !env.empty()) {
        config.maxGapHours = parseHours(env, "MAX_GAP_HOURS");
    }
    if (auto env = envValue("DUCKDB_PATH"); !env.empty()) {
        config.duckdbPath = env;
    }
    if (auto env = envValue("COALESCE_MS"); !env.empty()) {
        config.coalesceMs = parseMillis(env, "COALESCE_MS");
    }

    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = parseLogLevel(levelArg);
    }
    if (auto symbolsArg = valueFromArgs(argc, argv, "--symbols"); !symbolsArg.empty()) {
        config.symbols = parseCsvList(symbolsArg);
    }
    if (auto tfArg = valueFromArgs(argc, argv, "--timeframes"); !tfArg.empty()) {
        config.timeframes = parseCsvList(tfArg);
    }
    if (auto ranksArg = valueFromArgs(argc, argv, "--ranks"); !ranksArg.empty()) {
        for (const auto& [tf, rank] : parseKeyedList(ranksArg, "--ranks")) {
            config.rankOverrides[tf] = parsePositiveInt(rank, "--ranks");
        }
    }
    if (auto windowArg = valueFromArgs(argc, argv, "--window-size"); !windowArg.empty()) {
        applySizeSetting(windowArg, "--window-size", config.windowSize, config.windowSizeOverrides);
    }
    if (auto windowsArg = valueFromArgs(argc, argv, "--window-sizes"); !windowsArg.empty()) {
        for (const auto& [tf, count] : parseKeyedList(windowsArg, "--window-sizes")) {
            config.windowSizeOverrides[tf] = parsePositiveSize(count, "--window-sizes");
        }
    }
    if (auto initialArg = valueFromArgs(argc, argv, "--initial-candles"); !initialArg.empty()) {
        applySizeSetting(initialArg, "--initial-candles", config.initialCandles, config.initialCandleOverrides);
    }
    if (auto modeArg = valueFromArgs(argc, argv, "--bootstrap"); !modeArg.empty()) {
        config.bootstrapMode = parseBootstrapMode(modeArg);
    }
    if (hasFlag(argc, argv, "--fresh-start")) {
        config.bootstrapMode = BootstrapMode::FreshStart;
    }
    if (auto gapArg = valueFromArgs(argc, argv, "--max-gap-hours"); !gapArg.empty()) {
        config.maxGapHours = parseHours(gapArg, "--max-gap-hours");
    }
    if (auto duckArg = valueFromArgs(argc, argv, "--duckdb"); !duckArg.empty()) {
        config.duckdbPath = trim(duckArg);
    }
    if (auto hostArg = valueFromArgs(argc, argv, "--rest-host"); !hostArg.empty()) {
        config.restHost = trim(hostArg);
    }
    if (auto hostArg = valueFromArgs(argc, argv, "--ws-host"); !hostArg.empty()) {
        config.wsHost = trim(hostArg);
    }
    if (auto portArg = valueFromArgs(argc, argv, "--ws-port"); !portArg.empty()) {
        const auto port = parseUnsigned(portArg, "--ws-port", 65535U);
        if (port == 0U) {
            throw ConfigurationError("invalid --ws-port: " + portArg);
        }
        config.wsPort = std::to_string(port);
    }
    if (auto timeoutArg = valueFromArgs(argc, argv, "--request-timeout-sec"); !timeoutArg.empty()) {
        config.requestTimeoutSec = parsePositiveInt(timeoutArg, "--request-timeout-sec");
    }
    if (auto attemptsArg = valueFromArgs(argc, argv, "--rest-max-attempts"); !attemptsArg.empty()) {
        config.restMaxAttempts = parsePositiveInt(attemptsArg, "--rest-max-attempts");
    }
    if (auto backoffArg = valueFromArgs(argc, argv, "--rest-backoff-ms"); !backoffArg.empty()) {
        config.restBackoffMs = parseMillis(backoffArg, "--rest-backoff-ms");
    }
    if (auto capArg = valueFromArgs(argc, argv, "--rest-backoff-cap-ms"); !capArg.empty()) {
        config.restBackoffCapMs = parseMillis(capArg, "--rest-backoff-cap-ms");
    }
    if (auto delayArg = valueFromArgs(argc, argv, "--rest-page-delay-ms"); !delayArg.empty()) {
        config.restPageDelayMs = parseMillis(delayArg, "--rest-page-delay-ms");
    }
    if (auto workersArg = valueFromArgs(argc, argv, "--rest-workers"); !workersArg.empty()) {
        config.restWorkers = parsePositiveSize(workersArg, "--rest-workers");
    }
    if (auto reconnectArg = valueFromArgs(argc, argv, "--ws-max-reconnects"); !reconnectArg.empty()) {
        config.wsMaxReconnects = parsePositiveInt(reconnectArg, "--ws-max-reconnects");
    }
    if (auto backoffArg = valueFromArgs(argc, argv, "--ws-backoff-ms"); !backoffArg.empty()) {
        config.wsBackoffMs = parseMillis(backoffArg, "--ws-backoff-ms");
    }
    if (auto capArg = valueFromArgs(argc, argv, "--ws-backoff-cap-ms"); !capArg.empty()) {
        config.wsBackoffCapMs = parseMillis(capArg, "--ws-backoff-cap-ms");
    }
    if (auto coalesceArg = valueFromArgs(argc, argv, "--coalesce-ms"); !coalesceArg.empty()) {
        config.coalesceMs = parseMillis(coalesceArg, "--coalesce-ms");
    }
    if (hasFlag(argc, argv, "--fill-gaps")) {
        config.fillGaps = true;
    }

    std::vector<std::string> symbols;
    symbols.reserve(config.symbols.size());
    for (const auto& symbol : config.symbols) {
        auto upper = toUpper(symbol);
        if (std::find(symbols.begin(), symbols.end(), upper) == symbols.end()) {
            symbols.push_back(std::move(upper));
        }
    }
    config.symbols = std::move(symbols);
    if (config.symbols.empty()) {
        throw ConfigurationError("at least one symbol is required");
    }
    if (config.restBackoffCapMs < config.restBackoffMs) {
        throw ConfigurationError("--rest-backoff-cap-ms must be >= --rest-backoff-ms");
    }
    if (config.wsBackoffCapMs < config.wsBackoffMs) {
        throw ConfigurationError("--ws-backoff-cap-ms must be >= --ws-backoff-ms");
    }
    if (config.duckdbPath.empty()) {
        throw ConfigurationError("--duckdb path must not be empty");
    }

    // Surfaces unknown timeframes and bad rank layouts at startup.
    (void)config.timeframeSpecs();

    return config;
}

}  // namespace tfsync::common
