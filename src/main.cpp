// main.cpp
#include "DynamoConnector.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) {
    g_interrupted = true;
}

void printUsage() {
    std::cerr
        << "usage: dynconnect [options] <command> [args]\n"
        << "commands:\n"
        << "  status                      discover once and print the connection state\n"
        << "  watch                       print connection state changes until interrupted\n"
        << "  folder <path>               list a folder through Dynamo\n"
        << "  current                     info for the graph open in Dynamo\n"
        << "  info <graphId>              info for a specific graph\n"
        << "  run <graphId|current> [inputsJson]\n"
        << "  trust <path>                mark a graph location as trusted\n"
        << "  server-info                 Dynamo server information\n"
        << "  health <port>               liveness check on one port\n"
        << "options:\n"
        << "  --host=H --base-port=N --ports=N --probe-timeout=MS --request-timeout=MS\n"
        << "  --interval=MS --expect=NAME --verbose\n"
        << "environment: DYNAMO_HOST DYNAMO_BASE_PORT DYNAMO_PORT_COUNT DYNAMO_PROBE_TIMEOUT_MS\n"
        << "  DYNAMO_REQUEST_TIMEOUT_MS DYNAMO_RETRY_INTERVAL_MS DYNAMO_EXPECT_SERVICE DYNAMO_VERBOSE\n";
}

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitNotConnected = 2;
constexpr int kExitUsage = 64;

int printResponse(const Dynamo::Response& response) {
    if (response.ok()) {
        std::cout << response.body << std::endl;
        return kExitOk;
    }
    std::cerr << "[main] Request failed (" << Dynamo::errorKindName(response.error);
    if (response.status) std::cerr << " " << response.status;
    std::cerr << "): " << response.message << std::endl;
    return response.error == Dynamo::ErrorKind::NotConnected ? kExitNotConnected : kExitFailed;
}

int watch(DynamoConnector& connector) {
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    connector.subscribe([&connector](ConnectionState, ConnectionState current) {
        auto port = connector.endpointPort();
        std::cout << "[main] " << connectionStateName(current);
        if (current == ConnectionState::Connected && port) {
            std::cout << " " << connector.config().baseUrl(*port);
        }
        std::cout << std::endl;
    });
    connector.start();

    while (!g_interrupted) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::cout << "[main] Stopping" << std::endl;
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char** argv) {
    ConnectorConfig config = ConnectorConfig::fromEnvironment();
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return kExitOk;
        }
        if (arg.rfind("--", 0) == 0) {
            if (!config.applyArgument(arg)) {
                std::cerr << "[main] Invalid option: " << arg << std::endl;
                printUsage();
                return kExitUsage;
            }
            continue;
        }
        positional.push_back(arg);
    }

    if (positional.empty()) {
        printUsage();
        return kExitUsage;
    }

    const std::string command = positional[0];
    auto argAt = [&positional](size_t i) { return i < positional.size() ? positional[i] : std::string(); };

    DynamoConnector connector(config);

    if (command == "watch") {
        return watch(connector);
    }

    // Everything else needs the first discovery round to have settled.
    // Worst case every probe times out.
    auto roundTimeout = std::chrono::milliseconds(config.probeTimeoutMs * 2 + 1000);
    connector.start();
    if (!connector.waitForRound(0, roundTimeout)) {
        std::cerr << "[main] Discovery did not finish in time" << std::endl;
        return kExitNotConnected;
    }

    if (command == "status") {
        auto state = connector.state();
        std::cout << connectionStateName(state);
        if (auto port = connector.endpointPort()) std::cout << " " << config.baseUrl(*port);
        std::cout << std::endl;
        return state == ConnectionState::Connected ? kExitOk : kExitNotConnected;
    }

    if (command == "health") {
        if (positional.size() != 2) {
            printUsage();
            return kExitUsage;
        }
        auto port = parsePort(positional[1]);
        if (!port) {
            std::cerr << "[main] Invalid port: " << positional[1] << std::endl;
            return kExitUsage;
        }
        return printResponse(connector.health(*port).get());
    }

    if (connector.state() != ConnectionState::Connected) {
        std::cerr << "[main] Dynamo not available: " << connectionStateName(connector.state()) << std::endl;
        return kExitNotConnected;
    }

    if (command == "folder" && positional.size() == 2) {
        return printResponse(connector.folder(argAt(1)).get());
    }
    if (command == "current" && positional.size() == 1) {
        return printResponse(connector.current().get());
    }
    if (command == "info" && positional.size() == 2) {
        return printResponse(connector.info(Dynamo::GraphTarget::byId(argAt(1))).get());
    }
    if (command == "run" && (positional.size() == 2 || positional.size() == 3)) {
        auto target = argAt(1) == "current" ? Dynamo::GraphTarget::current()
                                            : Dynamo::GraphTarget::byId(argAt(1));
        return printResponse(connector.run(target, argAt(2)).get());
    }
    if (command == "trust" && positional.size() == 2) {
        return printResponse(connector.trust(argAt(1)).get());
    }
    if (command == "server-info" && positional.size() == 1) {
        return printResponse(connector.serverInfo().get());
    }

    printUsage();
    return kExitUsage;
}
