#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace igp::common {
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

std::uint16_t parsePort(const std::string& value) {
    try {
        const auto portValue = std::stoul(value);
        if (portValue == 0U || portValue > 65535U) {
            throw std::out_of_range("port out of range");
        }
        return static_cast<std::uint16_t>(portValue);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid port: " + value);
    }
}

std::size_t parseThreads(const std::string& value) {
    try {
        const auto parsed = std::stoul(value);
        if (parsed == 0U) {
            throw std::out_of_range("threads must be >= 1");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid threads value: " + value);
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

std::size_t parseSize(const std::string& value, const std::string& label) {
    try {
        const auto parsed = std::stoull(value);
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

bool parseBool(const std::string& value) {
    const auto normalized = toLower(value);
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean value: " + value);
}

std::string parseHost(const std::string& value, const std::string& label) {
    auto host = toLower(trim(value));
    if (host.empty() || host.find('/') != std::string::npos || host.find(':') != std::string::npos) {
        throw std::runtime_error("Invalid host for " + label + ": " + value);
    }
    return host;
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

// A bare switch (last argument, or followed by another flag) means true.
std::optional<bool> boolFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key) {
            if (i + 1 >= argc || std::string{argv[i + 1]}.rfind("--", 0) == 0) {
                return true;
            }
            return parseBool(argv[i + 1]);
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return parseBool(arg.substr(withEquals.size()));
        }
    }
    return std::nullopt;
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envPort = std::getenv("PORT")) {
        config.port = parsePort(envPort);
    }
    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = igp::log::levelFromString(toLower(envLogLevel));
    }
    if (const char* envHost = std::getenv("UPSTREAM_HOST")) {
        config.upstreamHost = parseHost(envHost, "UPSTREAM_HOST");
    }
    if (const char* envVerify = std::getenv("UPSTREAM_VERIFY_TLS")) {
        config.verifyTls = parseBool(envVerify);
    }

    if (auto portArg = valueFromArgs(argc, argv, "--port"); !portArg.empty()) {
        config.port = parsePort(portArg);
    }
    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = igp::log::levelFromString(toLower(levelArg));
    }
    if (auto threadsArg = valueFromArgs(argc, argv, "--threads"); !threadsArg.empty()) {
        config.threads = parseThreads(threadsArg);
    }
    if (auto hostArg = valueFromArgs(argc, argv, "--upstream.host"); !hostArg.empty()) {
        config.upstreamHost = parseHost(hostArg, "--upstream.host");
    }
    if (auto domainArg = valueFromArgs(argc, argv, "--proxy.allowed-domain"); !domainArg.empty()) {
        config.allowedDomain = parseHost(domainArg, "--proxy.allowed-domain");
    }
    if (auto timeoutArg = valueFromArgs(argc, argv, "--upstream.timeout-ms"); !timeoutArg.empty()) {
        config.upstreamTimeoutMs = parseDurationMs(timeoutArg, "--upstream.timeout-ms");
    }
    if (auto retryArg = valueFromArgs(argc, argv, "--upstream.retry-timeout-ms"); !retryArg.empty()) {
        config.upstreamRetryTimeoutMs = parseDurationMs(retryArg, "--upstream.retry-timeout-ms");
    }
    if (auto healthArg = valueFromArgs(argc, argv, "--upstream.health-timeout-ms"); !healthArg.empty()) {
        config.healthTimeoutMs = parseDurationMs(healthArg, "--upstream.health-timeout-ms");
    }
    if (auto proxyArg = valueFromArgs(argc, argv, "--proxy.timeout-ms"); !proxyArg.empty()) {
        config.proxyTimeoutMs = parseDurationMs(proxyArg, "--proxy.timeout-ms");
    }
    if (auto verifyArg = boolFromArgs(argc, argv, "--upstream.verify-tls")) {
        config.verifyTls = *verifyArg;
    }
    if (auto tickerArg = valueFromArgs(argc, argv, "--cache.ttl.ticker-ms"); !tickerArg.empty()) {
        config.tickerTtlMs = parseDurationMs(tickerArg, "--cache.ttl.ticker-ms");
    }
    if (auto historyArg = valueFromArgs(argc, argv, "--cache.ttl.history-ms"); !historyArg.empty()) {
        config.historyTtlMs = parseDurationMs(historyArg, "--cache.ttl.history-ms");
    }
    if (auto depthArg = valueFromArgs(argc, argv, "--cache.ttl.depth-ms"); !depthArg.empty()) {
        config.depthTtlMs = parseDurationMs(depthArg, "--cache.ttl.depth-ms");
    }
    if (auto maxEntriesArg = valueFromArgs(argc, argv, "--cache.max-entries"); !maxEntriesArg.empty()) {
        config.cacheMaxEntries = parseSize(maxEntriesArg, "--cache.max-entries");
    }
    if (auto singleFlightArg = boolFromArgs(argc, argv, "--cache.single-flight")) {
        config.singleFlight = *singleFlightArg;
    }
    if (auto corsEnableArg = boolFromArgs(argc, argv, "--http.cors.enable")) {
        config.httpCorsEnable = *corsEnableArg;
    }
    if (auto corsOriginArg = valueFromArgs(argc, argv, "--http.cors.origin"); !corsOriginArg.empty()) {
        config.httpCorsOrigin = trim(corsOriginArg);
    }

    if (config.httpCorsEnable && config.httpCorsOrigin.empty()) {
        config.httpCorsOrigin = "*";
    }
    if (config.upstreamRetryTimeoutMs < config.upstreamTimeoutMs) {
        throw std::runtime_error("--upstream.retry-timeout-ms must not be shorter than --upstream.timeout-ms");
    }

    return config;
}

}  // namespace igp::common
