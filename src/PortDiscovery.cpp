// PortDiscovery.cpp
#include "PortDiscovery.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <thread>

#include "DynamoService.hpp"

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const char* kindName(ProbeResult::Kind kind) {
    switch (kind) {
        case ProbeResult::Kind::Live: return "live";
        case ProbeResult::Kind::Rejected: return "rejected";
        case ProbeResult::Kind::Unreachable: return "unreachable";
    }
    return "?";
}

} // anonymous namespace

ProbeResult probePort(const std::string& host, int port, long timeoutMs,
                      const std::string& expectedService) {
    Dynamo::Response response = Dynamo::Client::health(host, port, timeoutMs);

    if (response.ok()) {
        if (expectedService.empty()
            || toLower(response.body).find(toLower(expectedService)) != std::string::npos) {
            return ProbeResult::live(port);
        }
        // Something else is listening on this port.
        return ProbeResult::unreachable(port);
    }
    if (response.error == Dynamo::ErrorKind::Http && response.status == 503) {
        return ProbeResult::rejected(port, response.status);
    }
    return ProbeResult::unreachable(port);
}

std::vector<int> candidatePorts(int basePort, int count) {
    std::vector<int> ports;
    ports.reserve(count > 0 ? count : 0);
    for (int i = 0; i < count; ++i) ports.push_back(basePort + i);
    return ports;
}

DiscoveryOutcome classifyProbeResults(const std::vector<ProbeResult>& results) {
    std::vector<int> live;
    bool blocked = false;
    for (const auto& r : results) {
        if (r.kind == ProbeResult::Kind::Live) live.push_back(r.port);
        else if (r.kind == ProbeResult::Kind::Rejected && r.status == 503) blocked = true;
    }

    DiscoveryOutcome outcome;
    if (live.size() == 1) {
        outcome.state = ConnectionState::Connected;
        outcome.port = live.front();
    } else if (live.size() > 1) {
        // Ambiguous: never guess which instance the caller meant.
        outcome.state = ConnectionState::MultipleConnections;
    } else if (blocked) {
        outcome.state = ConnectionState::Blocked;
    } else {
        outcome.state = ConnectionState::NotConnected;
    }
    return outcome;
}

DiscoveryOutcome runDiscoveryRound(const std::vector<int>& ports, const PortProbe& probe,
                                   bool verbose) {
    std::vector<ProbeResult> results(ports.size());
    std::vector<std::thread> workers;
    workers.reserve(ports.size());

    for (size_t i = 0; i < ports.size(); ++i) {
        workers.emplace_back([&results, &probe, &ports, i]() {
            int port = ports[i];
            try {
                results[i] = probe(port);
            } catch (const std::exception& e) {
                std::cerr << "[Discovery] Probe of port " << port << " threw: " << e.what() << std::endl;
                results[i] = ProbeResult::unreachable(port);
            }
        });
    }
    for (auto& t : workers) t.join();

    if (verbose) {
        for (const auto& r : results) {
            std::cout << "[Discovery]   port " << r.port << " -> " << kindName(r.kind);
            if (r.kind == ProbeResult::Kind::Rejected) std::cout << " (" << r.status << ")";
            std::cout << std::endl;
        }
    }

    return classifyProbeResults(results);
}
