// DynamoService.hpp
// HTTP client for the local Dynamo service: request envelope, error
// classification and the typed operations bound to one base URL.

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace Dynamo {

enum class ErrorKind {
    None,
    NotConnected,   // no endpoint discovered, request never sent
    Transport,      // refused, reset, DNS, any other libcurl failure
    Timeout,        // transport timeout
    Http            // service answered with a non-2xx status
};

const char* errorKindName(ErrorKind kind);

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::string body;
    long timeoutMs{0};   // 0 = no limit
};

// Outcome of one request. Expected failures are values, not exceptions.
struct Response {
    ErrorKind error{ErrorKind::None};
    long status{0};
    std::string body;
    std::string message;

    bool ok() const { return error == ErrorKind::None; }

    static Response notConnected(const std::string& operation);
};

using Transport = std::function<Response(const HttpRequest&)>;

// Default transport: libcurl easy handle per request.
Response curlTransport(const HttpRequest& request);

// Refused/timeout/transport errors and any 5xx.
bool isConnectivityFailure(const Response& response);

// The one 5xx the service uses for a business outcome.
bool isUntrustedGraph(const Response& response);

// Graph to operate on: whatever is open in Dynamo, or a specific graph id.
struct GraphTarget {
    enum class Type { Current, GraphId };

    Type type{Type::Current};
    std::string id;

    static GraphTarget current() { return {}; }
    static GraphTarget byId(std::string graphId) { return {Type::GraphId, std::move(graphId)}; }

    std::string toJson() const;
};

// JSON object text forwarded as-is.
using RunInputs = std::string;

struct GraphInfo {
    std::string id;
    std::string name;
    std::string json;
};

// Lift id/name out of an info body. nullopt if the body has neither.
std::optional<GraphInfo> parseGraphInfo(const std::string& json);

class Client {
public:
    explicit Client(std::string baseUrl, Transport transport = {}, long timeoutMs = 60000);

    Response folder(const std::string& path) const;
    Response info(const GraphTarget& target) const;
    Response run(const GraphTarget& target, const RunInputs& inputs) const;
    Response trust(const std::string& path) const;
    Response serverInfo() const;

    // Liveness check on an explicit port; not bound to baseUrl.
    static Response health(const std::string& host, int port, long timeoutMs,
                           const Transport& transport = {});

    const std::string& baseUrl() const { return m_baseUrl; }

private:
    Response send(const std::string& method, const std::string& path, const std::string& body = {}) const;

    std::string m_baseUrl;
    Transport m_transport;
    long m_timeoutMs;
};

// Helpers shared with discovery and tests.
std::string jsonEscape(const std::string& value);
std::string extractJsonString(const std::string& json, const std::string& key);
std::string urlEncode(const std::string& value);

} // namespace Dynamo
