// PortDiscovery.hpp
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ConnectionState.hpp"

// Outcome of probing one candidate port.
struct ProbeResult {
    enum class Kind { Live, Unreachable, Rejected };

    Kind kind{Kind::Unreachable};
    int port{0};
    long status{0};   // HTTP status for Rejected

    static ProbeResult live(int port) { return {Kind::Live, port, 0}; }
    static ProbeResult unreachable(int port) { return {Kind::Unreachable, port, 0}; }
    static ProbeResult rejected(int port, long status) { return {Kind::Rejected, port, status}; }
};

// What a discovery round decided.
struct DiscoveryOutcome {
    ConnectionState state{ConnectionState::NotConnected};
    std::optional<int> port; // set only when state == Connected
};

using PortProbe = std::function<ProbeResult(int port)>;

// Hit /health on host:port. Never throws for network failures.
// A 2xx must mention expectedService (case-insensitive) to count as Live;
// an empty expectedService accepts any 2xx.
ProbeResult probePort(const std::string& host, int port, long timeoutMs,
                      const std::string& expectedService);

// [basePort, basePort + count)
std::vector<int> candidatePorts(int basePort, int count);

// Reduce one round's probe results to a state and at most one endpoint.
DiscoveryOutcome classifyProbeResults(const std::vector<ProbeResult>& results);

// Probe every port concurrently, wait for all, classify.
DiscoveryOutcome runDiscoveryRound(const std::vector<int>& ports, const PortProbe& probe,
                                   bool verbose = false);
