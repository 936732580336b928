#pragma once

#include "core/ThreadPool.hpp"
#include "handlers/IRequestHandler.hpp"
#include "http/HttpParser.hpp"
#include "http/HttpRouter.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>

namespace reading_service {
namespace server {

struct ServerConfig {
    uint16_t port = 7071;
    std::string bindAddress = "0.0.0.0";
    std::string route = "/api/readings";
    size_t threadPoolSize = 0;
    // Time allowed for a complete request to arrive once the client starts sending.
    std::chrono::seconds connectionTimeout{60};
    // Time an idle connection is kept open between requests.
    std::chrono::seconds keepAliveTimeout{5};
    std::chrono::seconds shutdownTimeout{10};
    size_t maxConnections = 1000;
    std::string serverVersion = "1.0";
};

class ServerException : public std::runtime_error {
public:
    ServerException(const std::string& message, int errorCode);
    int GetErrorCode() const { return m_errorCode; }
private:
    int m_errorCode;
};

/**
 * HTTP/1.1 host built on poll(2).
 *
 * One event thread accepts connections and watches idle ones. A connection is
 * handed to the worker pool only when it has bytes to read; after answering,
 * a keep-alive connection goes back to the event thread. Idle or slow clients
 * therefore never hold a worker.
 */
class HttpServer {
public:
    HttpServer(const ServerConfig& config, std::shared_ptr<handlers::IRequestHandler> handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void Start();
    void Stop();
    bool IsRunning() const { return m_running.load(std::memory_order_acquire); }

    // The bound port; differs from the configured one when that was 0.
    uint16_t GetPort() const { return m_port; }

    http::HttpRouter& GetRouter() { return m_router; }

    int GetActiveConnections() const { return m_activeConnections.load(); }
    size_t GetIdleConnections() const;

private:
    struct Connection {
        int socket;
        http::HttpParser parser;
        std::chrono::steady_clock::time_point deadline;
    };
    using ConnectionPtr = std::shared_ptr<Connection>;

    void InitializeRoutes();
    void InitializeListenSocket();
    void InitializeWakeupPipe();
    void InitializeThreadPool();

    void EventLoop();
    void AcceptConnection();
    void DispatchReadable(int socket);
    void ExpireIdleConnections();
    void Wakeup();

    void HandleConnection(const ConnectionPtr& connection);
    http::HttpResponse ProcessRequest(http::HttpRequest& request);
    bool SendResponse(int socket, const http::HttpResponse& response);
    void RejectConnection(int socket);

    // Returns a keep-alive connection to the event thread.
    void Park(const ConnectionPtr& connection, std::chrono::seconds timeout);
    void CloseConnection(int socket);
    void CloseIdleConnections();
    void WaitForConnections(std::chrono::seconds timeout);

    ServerConfig m_config;
    uint16_t m_port;

    std::shared_ptr<handlers::IRequestHandler> m_handler;
    http::HttpRouter m_router;
    bool m_routesInitialized;

    int m_listenSocket;
    int m_wakeupPipe[2];
    std::thread m_eventThread;
    std::unique_ptr<core::ThreadPool> m_threadPool;

    std::unordered_map<int, ConnectionPtr> m_idle;
    mutable std::mutex m_idleMutex;
    std::atomic<int> m_activeConnections{0};

    std::atomic<bool> m_running{false};

    static constexpr int POLL_INTERVAL_MS = 200;
    static constexpr size_t RECEIVE_BUFFER_SIZE = 8192;
};

} // namespace server
} // namespace reading_service
