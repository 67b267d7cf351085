#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/Config.hpp"

namespace {

struct EnvGuard {
    explicit EnvGuard(std::string name) : name(std::move(name)) {
        const char* current = std::getenv(this->name.c_str());
        if (current) {
            originalValue = current;
            hadOriginal = true;
        }
    }

    ~EnvGuard() {
        if (hadOriginal) {
            ::setenv(name.c_str(), originalValue.c_str(), 1);
        } else {
            ::unsetenv(name.c_str());
        }
    }

    void clear() { ::unsetenv(name.c_str()); }

    void set(const std::string& value) { ::setenv(name.c_str(), value.c_str(), 1); }

    std::string name;
    bool hadOriginal{false};
    std::string originalValue;
};

::igp::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return ::igp::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

bool throwsOn(const std::vector<std::string>& args) {
    try {
        runConfig(args);
    } catch (const std::exception&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    EnvGuard portGuard("PORT");
    EnvGuard hostGuard("UPSTREAM_HOST");
    EnvGuard verifyGuard("UPSTREAM_VERIFY_TLS");
    EnvGuard levelGuard("LOG_LEVEL");
    portGuard.clear();
    hostGuard.clear();
    verifyGuard.clear();
    levelGuard.clear();

    // Defaults when env and flags are absent.
    const auto defaults = runConfig({"app"});
    if (defaults.port != 3000 || defaults.upstreamHost != "indodax.com" || defaults.allowedDomain != "indodax.com") {
        std::cerr << "Expected default port 3000 and indodax.com upstream, got " << defaults.port << " "
                  << defaults.upstreamHost << "\n";
        return 1;
    }
    if (defaults.tickerTtlMs != 3000 || defaults.historyTtlMs != 5000 || defaults.depthTtlMs != 2000) {
        std::cerr << "Expected default TTLs of 3000/5000/2000 ms\n";
        return 1;
    }
    if (defaults.upstreamTimeoutMs != 8000 || defaults.upstreamRetryTimeoutMs != 10000
        || defaults.healthTimeoutMs != 5000 || defaults.proxyTimeoutMs != 10000) {
        std::cerr << "Expected default upstream timeouts of 8000/10000/5000/10000 ms\n";
        return 1;
    }
    if (defaults.verifyTls || defaults.singleFlight || defaults.cacheMaxEntries != 0 || !defaults.httpCorsEnable
        || defaults.httpCorsOrigin != "*") {
        std::cerr << "Expected permissive defaults for TLS, caching and CORS\n";
        return 1;
    }

    // Environment overrides defaults.
    portGuard.set("8080");
    hostGuard.set("Staging.Indodax.com");
    verifyGuard.set("true");
    const auto fromEnv = runConfig({"app"});
    if (fromEnv.port != 8080 || fromEnv.upstreamHost != "staging.indodax.com" || !fromEnv.verifyTls) {
        std::cerr << "Expected env PORT/UPSTREAM_HOST/UPSTREAM_VERIFY_TLS to apply\n";
        return 1;
    }

    // Flags override environment.
    const auto fromFlags = runConfig({"app", "--port", "9090", "--upstream.host=api.indodax.com",
                                      "--upstream.verify-tls", "off", "--cache.ttl.depth-ms=500",
                                      "--cache.max-entries", "128", "--cache.single-flight=yes", "--threads", "2"});
    if (fromFlags.port != 9090 || fromFlags.upstreamHost != "api.indodax.com" || fromFlags.verifyTls) {
        std::cerr << "Expected flags to override env values\n";
        return 1;
    }
    if (fromFlags.depthTtlMs != 500 || fromFlags.cacheMaxEntries != 128 || !fromFlags.singleFlight
        || fromFlags.threads != 2) {
        std::cerr << "Expected cache and worker flags to apply\n";
        return 1;
    }

    portGuard.clear();
    hostGuard.clear();
    verifyGuard.clear();

    // Bare boolean switches read as true, last or followed by another flag.
    const auto bareLast = runConfig({"app", "--cache.single-flight"});
    if (!bareLast.singleFlight) {
        std::cerr << "Expected a trailing bare --cache.single-flight to enable single-flight\n";
        return 1;
    }
    const auto bareChain = runConfig({"app", "--upstream.verify-tls", "--cache.single-flight"});
    if (!bareChain.verifyTls || !bareChain.singleFlight) {
        std::cerr << "Expected bare --upstream.verify-tls followed by another flag to enable both\n";
        return 1;
    }
    const auto bareCors = runConfig({"app", "--http.cors.enable=false", "--port", "3100"});
    if (bareCors.httpCorsEnable || bareCors.port != 3100) {
        std::cerr << "Expected --http.cors.enable=false to disable CORS\n";
        return 1;
    }

    if (!throwsOn({"app", "--port", "70000"}) || !throwsOn({"app", "--threads", "0"})) {
        std::cerr << "Expected out-of-range port and thread counts to be rejected\n";
        return 1;
    }
    if (!throwsOn({"app", "--upstream.host", "https://indodax.com"})) {
        std::cerr << "Expected a host with a scheme to be rejected\n";
        return 1;
    }
    if (!throwsOn({"app", "--upstream.timeout-ms", "12000"})) {
        std::cerr << "Expected a retry timeout shorter than the primary timeout to be rejected\n";
        return 1;
    }
    if (!throwsOn({"app", "--cache.single-flight", "maybe"}) || !throwsOn({"app", "--log-level", "verbose"})) {
        std::cerr << "Expected invalid boolean and log level values to be rejected\n";
        return 1;
    }

    return 0;
}
