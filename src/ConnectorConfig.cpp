// ConnectorConfig.cpp
#include "ConnectorConfig.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace {

std::optional<long> parseNumber(const std::string& text, long minValue, long maxValue) {
    // stol would skip leading whitespace.
    if (text.empty() || !(std::isdigit(static_cast<unsigned char>(text[0])) || text[0] == '-')) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        long value = std::stol(text, &used);
        if (used != text.size() || value < minValue || value > maxValue) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool isTruthy(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

// Shared by env and flag handling. Returns false on unknown key or bad value.
bool applyValue(ConnectorConfig& config, const std::string& key, const std::string& value) {
    if (key == "host") {
        if (value.empty()) return false;
        config.host = value;
        return true;
    }
    if (key == "expect") {
        config.expectedService = value;
        return true;
    }
    if (key == "base-port") {
        auto v = parseNumber(value, 1, 65535);
        if (!v) return false;
        config.basePort = static_cast<int>(*v);
        return true;
    }
    if (key == "ports") {
        auto v = parseNumber(value, 1, 1024);
        if (!v) return false;
        config.portCount = static_cast<int>(*v);
        return true;
    }
    if (key == "probe-timeout") {
        auto v = parseNumber(value, 1, 600000);
        if (!v) return false;
        config.probeTimeoutMs = *v;
        return true;
    }
    if (key == "request-timeout") {
        auto v = parseNumber(value, 0, 86400000);
        if (!v) return false;
        config.requestTimeoutMs = *v;
        return true;
    }
    if (key == "interval") {
        auto v = parseNumber(value, 10, 3600000);
        if (!v) return false;
        config.retryInterval = std::chrono::milliseconds(*v);
        return true;
    }
    return false;
}

} // anonymous namespace

ConnectorConfig ConnectorConfig::fromEnvironment() {
    ConnectorConfig config;

    const struct { const char* env; const char* key; } vars[] = {
        {"DYNAMO_HOST", "host"},
        {"DYNAMO_BASE_PORT", "base-port"},
        {"DYNAMO_PORT_COUNT", "ports"},
        {"DYNAMO_PROBE_TIMEOUT_MS", "probe-timeout"},
        {"DYNAMO_REQUEST_TIMEOUT_MS", "request-timeout"},
        {"DYNAMO_RETRY_INTERVAL_MS", "interval"},
        {"DYNAMO_EXPECT_SERVICE", "expect"},
    };
    for (const auto& v : vars) {
        const char* value = std::getenv(v.env);
        if (!value) continue;
        if (!applyValue(config, v.key, value)) {
            std::cerr << "[Config] Ignoring invalid " << v.env << "=" << value << std::endl;
        }
    }
    if (const char* verbose = std::getenv("DYNAMO_VERBOSE")) {
        config.verbose = isTruthy(verbose);
    }

    if (config.basePort + config.portCount - 1 > 65535) {
        std::cerr << "[Config] Port range exceeds 65535, using default range" << std::endl;
        config.basePort = 55100;
        config.portCount = 10;
    }
    return config;
}

bool ConnectorConfig::applyArgument(const std::string& arg) {
    if (arg == "--verbose") {
        verbose = true;
        return true;
    }
    if (arg.rfind("--", 0) != 0) return false;
    size_t eq = arg.find('=');
    if (eq == std::string::npos) return false;

    std::string key = arg.substr(2, eq - 2);
    std::string value = arg.substr(eq + 1);

    ConnectorConfig candidate = *this;
    if (!applyValue(candidate, key, value)) return false;
    if (candidate.basePort + candidate.portCount - 1 > 65535) return false;
    *this = candidate;
    return true;
}

std::optional<int> parsePort(const std::string& text) {
    auto v = parseNumber(text, 1, 65535);
    if (!v) return std::nullopt;
    return static_cast<int>(*v);
}

std::string ConnectorConfig::baseUrl(int port) const {
    return "http://" + host + ":" + std::to_string(port);
}
