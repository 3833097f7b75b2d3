// DynamoConnector.cpp
#include "DynamoConnector.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "RequestQueue.hpp"

DynamoConnector::DynamoConnector(ConnectorConfig config)
    : DynamoConnector(config, PortProbe{}, Dynamo::Transport{}) {}

DynamoConnector::DynamoConnector(ConnectorConfig config, PortProbe probe, Dynamo::Transport transport)
    : m_config(std::move(config))
    , m_probe(std::move(probe))
    , m_transport(std::move(transport))
    , m_queue(std::make_unique<RequestQueue>(m_config.verbose)) {
    if (!m_probe) {
        const std::string host = m_config.host;
        const long timeoutMs = m_config.probeTimeoutMs;
        const std::string expected = m_config.expectedService;
        m_probe = [host, timeoutMs, expected](int port) {
            return probePort(host, port, timeoutMs, expected);
        };
    }
}

DynamoConnector::~DynamoConnector() {
    stop();
}

void DynamoConnector::start() {
    // Thread is created under the lock so stop() always sees it.
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_started || m_stopping) return;
    m_started = true;
    m_roundRequested = true; // Init round
    m_discoveryThread = std::thread(&DynamoConnector::discoveryLoop, this);
}

void DynamoConnector::stop() {
    // Queued calls may still feed back into discovery, so drain them first.
    m_queue->shutdown();
    std::thread discovery;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
        discovery = std::move(m_discoveryThread);
    }
    m_wakeup.notify_all();
    if (discovery.joinable()) {
        discovery.join();
    }
    // Nobody else delivers once the discovery thread is gone.
    deliverTransitions();
}

void DynamoConnector::reconnect() {
    start();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_roundRequested = true;
    }
    m_wakeup.notify_all();
}

ConnectionState DynamoConnector::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::optional<int> DynamoConnector::endpointPort() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_endpoint;
}

std::optional<Dynamo::GraphInfo> DynamoConnector::currentOpenGraph() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_currentOpenGraph;
}

int DynamoConnector::subscribe(StateListener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    int id = m_nextListenerId++;
    m_listeners.emplace(id, std::move(listener));
    return id;
}

void DynamoConnector::unsubscribe(int id) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_listeners.erase(id);
}

std::uint64_t DynamoConnector::roundsCompleted() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_roundsCompleted;
}

bool DynamoConnector::waitForRound(std::uint64_t completed, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_roundDone.wait_for(lock, timeout, [this, completed] { return m_roundsCompleted > completed; });
}

// ============================================================================
// Discovery
// ============================================================================

void DynamoConnector::discoveryLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopping) {
        if (m_roundRequested) {
            m_roundRequested = false;
            lock.unlock();
            deliverTransitions();
            runRound();
            lock.lock();
            continue;
        }

        if (isRetryState(m_state)) {
            bool woken = m_wakeup.wait_for(lock, m_config.retryInterval,
                                           [this] { return m_stopping || m_roundRequested; });
            if (!woken && isRetryState(m_state)) {
                m_roundRequested = true; // timer tick
            }
        } else {
            // Connected (or Init before the first round): no polling.
            m_wakeup.wait(lock, [this] { return m_stopping || m_roundRequested; });
        }
    }
}

void DynamoConnector::runRound() {
    std::optional<int> previousPort;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previousPort = m_endpoint;
        m_endpoint.reset();
    }

    if (m_config.verbose) {
        std::cout << "[Discovery] Probing " << m_config.host << " ports " << m_config.basePort
                  << "-" << (m_config.basePort + m_config.portCount - 1) << std::endl;
    }

    DiscoveryOutcome outcome = runDiscoveryRound(candidatePorts(m_config.basePort, m_config.portCount),
                                                 m_probe, m_config.verbose);
    applyOutcome(outcome, previousPort);
}

void DynamoConnector::applyOutcome(const DiscoveryOutcome& outcome, std::optional<int> previousPort) {
    ConnectionState previous;
    bool changed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = m_state;
        m_state = outcome.state;
        if (m_state == ConnectionState::Connected) {
            m_endpoint = outcome.port;
        } else {
            m_endpoint.reset();
            m_currentOpenGraph.reset();
        }
        changed = previous != m_state || previousPort != m_endpoint;
        if (changed) m_pendingTransitions.emplace_back(previous, m_state);
    }

    if (changed) {
        std::cout << "[DynamoConnector] Connection state: " << connectionStateName(previous)
                  << " -> " << connectionStateName(outcome.state);
        if (outcome.port) std::cout << " (port " << *outcome.port << ")";
        std::cout << std::endl;
    }
    deliverTransitions();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_roundsCompleted;
    }
    m_roundDone.notify_all();
}

void DynamoConnector::deliverTransitions() {
    // Only one thread drains at a time, so listeners see transitions in the
    // order they were recorded under m_mutex.
    std::lock_guard<std::mutex> delivering(m_deliveryMutex);
    std::vector<std::pair<ConnectionState, ConnectionState>> transitions;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        transitions.swap(m_pendingTransitions);
    }
    for (const auto& t : transitions) {
        notifyListeners(t.first, t.second);
    }
}

void DynamoConnector::notifyListeners(ConnectionState previous, ConnectionState current) {
    std::map<int, StateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        listeners = m_listeners;
    }
    for (auto& entry : listeners) {
        try {
            entry.second(previous, current);
        } catch (const std::exception& e) {
            std::cerr << "[DynamoConnector] State listener threw: " << e.what() << std::endl;
        }
    }
}

void DynamoConnector::markLostConnection(const char* operation) {
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = m_state;
        m_state = ConnectionState::LostConnection;
        m_endpoint.reset();
        m_currentOpenGraph.reset();
        m_roundRequested = true;
        // Delivered by the discovery thread ahead of the round it requests.
        if (previous != ConnectionState::LostConnection) {
            m_pendingTransitions.emplace_back(previous, ConnectionState::LostConnection);
        }
    }
    m_wakeup.notify_all();

    if (previous != ConnectionState::LostConnection) {
        std::cout << "[DynamoConnector] Connection state: " << connectionStateName(previous)
                  << " -> " << connectionStateName(ConnectionState::LostConnection)
                  << " (after " << operation << ")" << std::endl;
    }
}

// ============================================================================
// Service facade
// ============================================================================

Dynamo::Response DynamoConnector::callService(const char* operation, bool untrustedIsBenign,
                                              const ServiceCall& call) {
    std::optional<int> port;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == ConnectionState::Connected) port = m_endpoint;
    }
    if (!port) {
        return Dynamo::Response::notConnected(operation);
    }

    Dynamo::Client client(m_config.baseUrl(*port), m_transport, m_config.requestTimeoutMs);
    Dynamo::Response response = call(client);
    if (response.ok()) return response;

    if (untrustedIsBenign && Dynamo::isUntrustedGraph(response)) {
        if (m_config.verbose) {
            std::cout << "[DynamoConnector] " << operation << ": " << response.message << std::endl;
        }
        return response;
    }

    if (Dynamo::isConnectivityFailure(response)) {
        std::cerr << "[DynamoConnector] " << operation << " failed ("
                  << Dynamo::errorKindName(response.error);
        if (response.status) std::cerr << " " << response.status;
        std::cerr << "): " << response.message << "; re-discovering" << std::endl;
        markLostConnection(operation);
    } else if (m_config.verbose) {
        std::cout << "[DynamoConnector] " << operation << " returned " << response.status
                  << ": " << response.message << std::endl;
    }
    return response;
}

std::future<Dynamo::Response> DynamoConnector::folder(const std::string& path) {
    start();
    return m_queue->enqueue("folder", [this, path]() {
        return callService("folder", false, [&path](const Dynamo::Client& c) { return c.folder(path); });
    });
}

std::future<Dynamo::Response> DynamoConnector::current() {
    start();
    return m_queue->enqueue("current", [this]() {
        Dynamo::Response response = callService("current", true, [](const Dynamo::Client& c) {
            return c.info(Dynamo::GraphTarget::current());
        });
        if (response.ok()) {
            auto graph = Dynamo::parseGraphInfo(response.body);
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_state == ConnectionState::Connected) m_currentOpenGraph = graph;
        }
        return response;
    });
}

std::future<Dynamo::Response> DynamoConnector::info(const Dynamo::GraphTarget& target) {
    start();
    return m_queue->enqueue("info", [this, target]() {
        return callService("info", true, [&target](const Dynamo::Client& c) { return c.info(target); });
    });
}

std::future<Dynamo::Response> DynamoConnector::run(const Dynamo::GraphTarget& target,
                                                   const Dynamo::RunInputs& inputs) {
    start();
    return m_queue->enqueue("run", [this, target, inputs]() {
        return callService("run", false, [&target, &inputs](const Dynamo::Client& c) {
            return c.run(target, inputs);
        });
    });
}

std::future<Dynamo::Response> DynamoConnector::trust(const std::string& path) {
    start();
    return m_queue->enqueue("trust", [this, path]() {
        return callService("trust", false, [&path](const Dynamo::Client& c) { return c.trust(path); });
    });
}

std::future<Dynamo::Response> DynamoConnector::serverInfo() {
    start();
    return m_queue->enqueue("serverInfo", [this]() {
        return callService("serverInfo", false, [](const Dynamo::Client& c) { return c.serverInfo(); });
    });
}

std::future<Dynamo::Response> DynamoConnector::health(int port) {
    start();
    // Explicit port, so no endpoint needed and no feedback into the state.
    return m_queue->enqueue("health", [this, port]() {
        return Dynamo::Client::health(m_config.host, port, m_config.probeTimeoutMs, m_transport);
    });
}
