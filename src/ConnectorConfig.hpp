// ConnectorConfig.hpp
#pragma once

#include <chrono>
#include <optional>
#include <string>

// Tunables for discovery and the service facade.
// Defaults match a stock Dynamo install; environment and CLI can override.
struct ConnectorConfig {
    std::string host{"localhost"};
    int basePort{55100};
    int portCount{10};
    long probeTimeoutMs{1000};
    long requestTimeoutMs{60000};
    std::chrono::milliseconds retryInterval{2000};
    std::string expectedService{"Dynamo"};
    bool verbose{false};

    // Defaults overlaid with DYNAMO_* environment variables.
    static ConnectorConfig fromEnvironment();

    // Apply one --key=value flag. Returns false if the flag is not a config flag
    // or its value is invalid (the field is left unchanged in that case).
    bool applyArgument(const std::string& arg);

    // http://host:port
    std::string baseUrl(int port) const;
};

// Whole-string TCP port in 1..65535.
std::optional<int> parsePort(const std::string& text);
