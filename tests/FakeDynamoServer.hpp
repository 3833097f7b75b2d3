// FakeDynamoServer.hpp
// Minimal loopback HTTP server standing in for Dynamo in tests.
// One request per connection, answered by a handler callback.
#pragma once

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

class FakeDynamoServer {
public:
    struct Request {
        std::string method;
        std::string target;   // path + query
        std::string body;
    };

    struct Reply {
        int status{200};
        std::string body;
    };

    using Handler = std::function<Reply(const Request&)>;

    explicit FakeDynamoServer(Handler handler) : m_handler(std::move(handler)) {}
    ~FakeDynamoServer() { stop(); }

    // Bind 127.0.0.1:port (0 = let the OS choose).
    bool start(int port = 0) {
        m_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (m_fd < 0) return false;

        int opt = 1;
        setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(static_cast<uint16_t>(port));
        if (bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(m_fd);
            m_fd = -1;
            return false;
        }

        socklen_t addrLen = sizeof(addr);
        if (getsockname(m_fd, reinterpret_cast<sockaddr*>(&addr), &addrLen) < 0 || listen(m_fd, 16) < 0) {
            close(m_fd);
            m_fd = -1;
            return false;
        }
        m_port = ntohs(addr.sin_port);

        m_running = true;
        m_thread = std::make_unique<std::thread>(&FakeDynamoServer::serveLoop, this);
        return true;
    }

    void stop() {
        if (!m_running) return;
        m_running = false;
        if (m_thread && m_thread->joinable()) m_thread->join();
        m_thread.reset();
        if (m_fd >= 0) {
            close(m_fd);
            m_fd = -1;
        }
    }

    int port() const { return m_port; }

    std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

private:
    void serveLoop() {
        while (m_running) {
            fd_set readfds;
            FD_ZERO(&readfds);
            FD_SET(m_fd, &readfds);

            struct timeval timeout{};
            timeout.tv_sec = 0;
            timeout.tv_usec = 50 * 1000;

            int activity = select(m_fd + 1, &readfds, nullptr, nullptr, &timeout);
            if (activity < 0) break;
            if (activity == 0) continue;

            int clientFd = accept(m_fd, nullptr, nullptr);
            if (clientFd < 0) continue;
            handleClient(clientFd);
            close(clientFd);
        }
    }

    void handleClient(int clientFd) {
        std::string data;
        char buffer[4096];
        size_t headerEnd = std::string::npos;
        size_t contentLength = 0;

        while (true) {
            ssize_t n = recv(clientFd, buffer, sizeof(buffer), 0);
            if (n <= 0) return;
            data.append(buffer, static_cast<size_t>(n));

            if (headerEnd == std::string::npos) {
                headerEnd = data.find("\r\n\r\n");
                if (headerEnd == std::string::npos) continue;
                contentLength = parseContentLength(data.substr(0, headerEnd));
            }
            if (data.size() >= headerEnd + 4 + contentLength) break;
        }

        Request request;
        size_t lineEnd = data.find("\r\n");
        std::string requestLine = data.substr(0, lineEnd);
        size_t sp1 = requestLine.find(' ');
        size_t sp2 = requestLine.find(' ', sp1 + 1);
        if (sp1 == std::string::npos || sp2 == std::string::npos) return;
        request.method = requestLine.substr(0, sp1);
        request.target = requestLine.substr(sp1 + 1, sp2 - sp1 - 1);
        request.body = data.substr(headerEnd + 4, contentLength);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_requests.push_back(request);
        }

        Reply reply = m_handler(request);
        std::string response = "HTTP/1.1 " + std::to_string(reply.status) + " " + reasonPhrase(reply.status) + "\r\n"
            + "Content-Type: application/json\r\n"
            + "Content-Length: " + std::to_string(reply.body.size()) + "\r\n"
            + "Connection: close\r\n\r\n"
            + reply.body;
        send(clientFd, response.data(), response.size(), MSG_NOSIGNAL);
    }

    static size_t parseContentLength(const std::string& headers) {
        const char* key = "content-length:";
        std::string lower = headers;
        for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        size_t pos = lower.find(key);
        if (pos == std::string::npos) return 0;
        return static_cast<size_t>(std::strtoul(headers.c_str() + pos + std::strlen(key), nullptr, 10));
    }

    static const char* reasonPhrase(int status) {
        switch (status) {
            case 200: return "OK";
            case 404: return "Not Found";
            case 500: return "Internal Server Error";
            case 503: return "Service Unavailable";
            default: return "Status";
        }
    }

    Handler m_handler;
    int m_fd{-1};
    int m_port{0};
    std::atomic<bool> m_running{false};
    std::unique_ptr<std::thread> m_thread;
    mutable std::mutex m_mutex;
    std::vector<Request> m_requests;
};
