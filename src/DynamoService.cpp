// DynamoService.cpp
#include "DynamoService.hpp"

#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>

#include <curl/curl.h>

namespace Dynamo {

namespace {

const char* const kUntrustedGraphMessage = "Graph is not trusted.";

// Service routes
const char* const kHealthPath = "/health";
const char* const kFolderPath = "/folder";
const char* const kInfoPath = "/graph/info";
const char* const kRunPath = "/graph/run";
const char* const kTrustPath = "/trust";
const char* const kServerInfoPath = "/server-info";

std::once_flag g_curlInit;

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Service errors come back either as {"message": "..."} or as plain text.
std::string errorMessageFromBody(const std::string& body) {
    std::string message = extractJsonString(body, "message");
    if (!message.empty()) return message;
    return trim(body);
}

} // anonymous namespace

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::NotConnected: return "not-connected";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Http: return "http";
    }
    return "unknown";
}

Response Response::notConnected(const std::string& operation) {
    Response r;
    r.error = ErrorKind::NotConnected;
    r.message = "Dynamo is not connected (" + operation + ")";
    return r;
}

Response curlTransport(const HttpRequest& request) {
    std::call_once(g_curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    Response response;
    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = ErrorKind::Transport;
        response.message = "Failed to initialize CURL";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "dynconnect/1.0");
    // Required for timeouts when curl runs on worker threads.
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (request.timeoutMs > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeoutMs);
    }

    struct curl_slist* headers = nullptr;
    if (request.method == "POST") {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        headers = curl_slist_append(headers, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    CURLcode rc = curl_easy_perform(curl);
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    if (headers) curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        response.error = (rc == CURLE_OPERATION_TIMEDOUT) ? ErrorKind::Timeout : ErrorKind::Transport;
        response.message = std::string("CURL error: ") + curl_easy_strerror(rc);
        return response;
    }

    response.status = httpCode;
    if (httpCode < 200 || httpCode >= 300) {
        response.error = ErrorKind::Http;
        response.message = errorMessageFromBody(response.body);
    }
    return response;
}

bool isConnectivityFailure(const Response& response) {
    switch (response.error) {
        case ErrorKind::Transport:
        case ErrorKind::Timeout:
            return true;
        case ErrorKind::Http:
            return response.status >= 500;
        default:
            return false;
    }
}

bool isUntrustedGraph(const Response& response) {
    return response.error == ErrorKind::Http
        && response.status == 500
        && response.message == kUntrustedGraphMessage;
}

std::string GraphTarget::toJson() const {
    if (type == Type::Current) {
        return R"({"type":"CurrentGraphTarget"})";
    }
    return R"({"type":"GraphIdTarget","id":")" + jsonEscape(id) + "\"}";
}

std::optional<GraphInfo> parseGraphInfo(const std::string& json) {
    GraphInfo info;
    info.id = extractJsonString(json, "id");
    info.name = extractJsonString(json, "name");
    if (info.id.empty() && info.name.empty()) return std::nullopt;
    info.json = json;
    return info;
}

Client::Client(std::string baseUrl, Transport transport, long timeoutMs)
    : m_baseUrl(std::move(baseUrl))
    , m_transport(transport ? std::move(transport) : Transport(curlTransport))
    , m_timeoutMs(timeoutMs) {
    if (!m_baseUrl.empty() && m_baseUrl.back() == '/') m_baseUrl.pop_back();
}

Response Client::send(const std::string& method, const std::string& path, const std::string& body) const {
    HttpRequest request;
    request.method = method;
    request.url = m_baseUrl + path;
    request.body = body;
    request.timeoutMs = m_timeoutMs;
    return m_transport(request);
}

Response Client::folder(const std::string& path) const {
    return send("GET", std::string(kFolderPath) + "?path=" + urlEncode(path));
}

Response Client::info(const GraphTarget& target) const {
    return send("POST", kInfoPath, target.toJson());
}

Response Client::run(const GraphTarget& target, const RunInputs& inputs) const {
    std::string body = "{\"target\":" + target.toJson()
                     + ",\"inputs\":" + (inputs.empty() ? std::string("{}") : inputs) + "}";
    return send("POST", kRunPath, body);
}

Response Client::trust(const std::string& path) const {
    return send("POST", kTrustPath, "{\"path\":\"" + jsonEscape(path) + "\"}");
}

Response Client::serverInfo() const {
    return send("GET", kServerInfoPath);
}

Response Client::health(const std::string& host, int port, long timeoutMs, const Transport& transport) {
    HttpRequest request;
    request.url = "http://" + host + ":" + std::to_string(port) + kHealthPath;
    request.timeoutMs = timeoutMs;
    return transport ? transport(request) : curlTransport(request);
}

std::string jsonEscape(const std::string& value) {
    std::ostringstream out;
    for (char c : value) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec << std::setfill(' ');
                } else {
                    out << c;
                }
        }
    }
    return out.str();
}

// Small permissive lookup of a top-level-ish string field; payloads are opaque
// to us so there is no full JSON parser here.
std::string extractJsonString(const std::string& json, const std::string& key) {
    std::string searchKey = "\"" + key + "\"";
    size_t keyPos = json.find(searchKey);
    if (keyPos == std::string::npos) return "";

    size_t colonPos = json.find_first_not_of(" \t\r\n", keyPos + searchKey.size());
    if (colonPos == std::string::npos || json[colonPos] != ':') return "";

    size_t quoteStart = json.find_first_not_of(" \t\r\n", colonPos + 1);
    if (quoteStart == std::string::npos || json[quoteStart] != '"') return "";

    std::string value;
    for (size_t i = quoteStart + 1; i < json.size(); ++i) {
        char c = json[i];
        if (c == '"') return value;
        if (c == '\\' && i + 1 < json.size()) {
            char next = json[++i];
            switch (next) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case 'r': value += '\r'; break;
                default: value += next; break;
            }
            continue;
        }
        value += c;
    }
    return "";
}

std::string urlEncode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << int(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

} // namespace Dynamo
