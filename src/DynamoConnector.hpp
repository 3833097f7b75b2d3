// DynamoConnector.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "ConnectionState.hpp"
#include "ConnectorConfig.hpp"
#include "DynamoService.hpp"
#include "PortDiscovery.hpp"

class RequestQueue;

// Finds the local Dynamo service on its port range, tracks connection health
// and funnels every service call through one ordered queue. A call that hits a
// connectivity failure demotes the state to LostConnection and triggers an
// immediate re-discovery round.
//
// Listeners run on the discovery thread (stop() flushes any left over), never
// under the connector's lock, and see transitions in the order they happened.
class DynamoConnector {
public:
    using StateListener = std::function<void(ConnectionState previous, ConnectionState current)>;

    explicit DynamoConnector(ConnectorConfig config = ConnectorConfig::fromEnvironment());
    // Injection points for tests: probe replaces the HTTP health check,
    // transport replaces libcurl for service calls.
    DynamoConnector(ConnectorConfig config, PortProbe probe, Dynamo::Transport transport = {});
    ~DynamoConnector();

    DynamoConnector(const DynamoConnector&) = delete;
    DynamoConnector& operator=(const DynamoConnector&) = delete;

    // Kick off the first discovery round and the background timer. Idempotent;
    // service calls and reconnect() call it implicitly.
    void start();

    // Drain queued calls, then stop discovery.
    void stop();

    // Force a discovery round now, whatever the state or timer phase.
    void reconnect();

    ConnectionState state() const;
    std::optional<int> endpointPort() const;
    std::optional<Dynamo::GraphInfo> currentOpenGraph() const;
    const ConnectorConfig& config() const { return m_config; }

    int subscribe(StateListener listener);
    void unsubscribe(int id);

    std::uint64_t roundsCompleted() const;
    // Wait until more than `completed` rounds have finished.
    bool waitForRound(std::uint64_t completed, std::chrono::milliseconds timeout) const;

    // Queued service operations, executed one at a time in submission order.
    std::future<Dynamo::Response> folder(const std::string& path);
    std::future<Dynamo::Response> current();
    std::future<Dynamo::Response> info(const Dynamo::GraphTarget& target);
    std::future<Dynamo::Response> run(const Dynamo::GraphTarget& target, const Dynamo::RunInputs& inputs);
    std::future<Dynamo::Response> trust(const std::string& path);
    std::future<Dynamo::Response> serverInfo();
    std::future<Dynamo::Response> health(int port);

private:
    using ServiceCall = std::function<Dynamo::Response(const Dynamo::Client&)>;

    // Runs on the queue worker. Applies error feedback to the state.
    Dynamo::Response callService(const char* operation, bool untrustedIsBenign, const ServiceCall& call);
    void markLostConnection(const char* operation);

    void discoveryLoop();
    void runRound();
    void applyOutcome(const DiscoveryOutcome& outcome, std::optional<int> previousPort);
    void deliverTransitions();
    void notifyListeners(ConnectionState previous, ConnectionState current);

    ConnectorConfig m_config;
    PortProbe m_probe;
    Dynamo::Transport m_transport;

    mutable std::mutex m_mutex;
    std::condition_variable m_wakeup;
    mutable std::condition_variable m_roundDone;
    ConnectionState m_state{ConnectionState::Init};
    std::optional<int> m_endpoint;
    std::optional<Dynamo::GraphInfo> m_currentOpenGraph;
    bool m_started{false};
    bool m_stopping{false};
    bool m_roundRequested{false};
    std::uint64_t m_roundsCompleted{0};
    std::vector<std::pair<ConnectionState, ConnectionState>> m_pendingTransitions;

    std::mutex m_deliveryMutex;
    std::mutex m_listenerMutex;
    std::map<int, StateListener> m_listeners;
    int m_nextListenerId{1};

    std::thread m_discoveryThread;
    std::unique_ptr<RequestQueue> m_queue;
};
