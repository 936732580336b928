#include "server/HttpServer.hpp"
#include "utils/ErrorHandler.hpp"
#include "utils/Logger.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <vector>

namespace reading_service {
namespace server {

namespace {
#ifdef MSG_NOSIGNAL
    constexpr int SEND_FLAGS = MSG_NOSIGNAL;
#else
    constexpr int SEND_FLAGS = 0;
#endif

    constexpr int INVALID_SOCKET = -1;

    timeval ToTimeval(std::chrono::seconds timeout) {
        timeval tv{};
        tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout.count());
        return tv;
    }

    bool SetNonBlocking(int fd) {
        int flags = fcntl(fd, F_GETFL, 0);
        return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
    }
}

ServerException::ServerException(const std::string& message, int errorCode)
    : std::runtime_error(utils::ErrorHandler::FormatError(message, errorCode))
    , m_errorCode(errorCode) {
}

HttpServer::HttpServer(const ServerConfig& config, std::shared_ptr<handlers::IRequestHandler> handler)
    : m_config(config)
    , m_port(config.port)
    , m_handler(std::move(handler))
    , m_routesInitialized(false)
    , m_listenSocket(INVALID_SOCKET)
    , m_wakeupPipe{INVALID_SOCKET, INVALID_SOCKET} {
}

HttpServer::~HttpServer() {
    Stop();

    if (m_listenSocket != INVALID_SOCKET) {
        close(m_listenSocket);
    }
    for (int fd : m_wakeupPipe) {
        if (fd != INVALID_SOCKET) {
            close(fd);
        }
    }
}

void HttpServer::Start() {
    if (m_running.load(std::memory_order_acquire)) {
        return;
    }

    utils::Logger::Info("Starting HTTP server...");

    InitializeRoutes();
    InitializeListenSocket();
    InitializeWakeupPipe();
    InitializeThreadPool();

    m_running.store(true, std::memory_order_release);
    m_eventThread = std::thread(&HttpServer::EventLoop, this);

    utils::Logger::Info("HTTP server started on port " + std::to_string(m_port) +
                        ", readings endpoint " + m_config.route);
}

void HttpServer::Stop() {
    if (!m_running.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    utils::Logger::Info("Stopping HTTP server...");

    Wakeup();
    if (m_eventThread.joinable()) {
        m_eventThread.join();
    }

    if (m_listenSocket != INVALID_SOCKET) {
        close(m_listenSocket);
        m_listenSocket = INVALID_SOCKET;
    }

    // Connections currently on a worker finish their response and close themselves.
    CloseIdleConnections();
    WaitForConnections(m_config.shutdownTimeout);

    if (m_threadPool) {
        m_threadPool->Stop();
    }

    utils::Logger::Info("HTTP server stopped");
}

size_t HttpServer::GetIdleConnections() const {
    std::lock_guard<std::mutex> lock(m_idleMutex);
    return m_idle.size();
}

void HttpServer::InitializeRoutes() {
    if (m_routesInitialized) {
        return;
    }

    m_router.AddRoute(m_config.route, [this](http::HttpRequest& req) {
        return m_handler->Handle(req);
    });

    m_routesInitialized = true;
}

void HttpServer::InitializeListenSocket() {
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock == INVALID_SOCKET) {
        throw ServerException("Failed to create listen socket", errno);
    }

    int optval = 1;
    if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) != 0) {
        utils::Logger::Warning(utils::ErrorHandler::FormatLastError("setsockopt(SO_REUSEADDR) failed"));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(m_config.port);
    if (inet_pton(AF_INET, m_config.bindAddress.c_str(), &addr.sin_addr) != 1) {
        close(sock);
        throw ServerException("Invalid bind address " + m_config.bindAddress, EINVAL);
    }

    if (bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        int error = errno;
        close(sock);
        throw ServerException("Failed to bind socket to port " + std::to_string(m_config.port), error);
    }

    if (listen(sock, SOMAXCONN) != 0) {
        int error = errno;
        close(sock);
        throw ServerException("Failed to listen on socket", error);
    }

    sockaddr_in boundAddr{};
    socklen_t addrLen = sizeof(boundAddr);
    if (getsockname(sock, reinterpret_cast<sockaddr*>(&boundAddr), &addrLen) == 0) {
        m_port = ntohs(boundAddr.sin_port);
    }

    m_listenSocket = sock;
}

void HttpServer::InitializeWakeupPipe() {
    if (m_wakeupPipe[0] != INVALID_SOCKET) {
        return;
    }

    if (pipe(m_wakeupPipe) != 0) {
        throw ServerException("Failed to create wakeup pipe", errno);
    }

    if (!SetNonBlocking(m_wakeupPipe[0]) || !SetNonBlocking(m_wakeupPipe[1])) {
        throw ServerException("Failed to make wakeup pipe non-blocking", errno);
    }
}

void HttpServer::InitializeThreadPool() {
    m_threadPool = std::make_unique<core::ThreadPool>();

    size_t threadCount = m_config.threadPoolSize;
    if (threadCount == 0) {
        threadCount = core::ThreadPool::GetOptimalThreadCount();
    }
    m_threadPool->Start(threadCount);
}

void HttpServer::EventLoop() {
    std::vector<pollfd> fds;

    while (m_running.load(std::memory_order_acquire)) {
        fds.clear();
        fds.push_back({m_listenSocket, POLLIN, 0});
        fds.push_back({m_wakeupPipe[0], POLLIN, 0});
        {
            std::lock_guard<std::mutex> lock(m_idleMutex);
            for (const auto& entry : m_idle) {
                fds.push_back({entry.first, POLLIN, 0});
            }
        }

        int ready = poll(fds.data(), fds.size(), POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            utils::Logger::Error(utils::ErrorHandler::FormatLastError("poll failed"));
            break;
        }

        if (fds[1].revents & POLLIN) {
            char drain[64];
            while (read(m_wakeupPipe[0], drain, sizeof(drain)) > 0) {
            }
        }

        if (fds[0].revents & POLLIN) {
            AcceptConnection();
        }

        for (size_t i = 2; i < fds.size(); ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                DispatchReadable(fds[i].fd);
            }
        }

        ExpireIdleConnections();
    }
}

void HttpServer::AcceptConnection() {
    sockaddr_in peer{};
    socklen_t peerLen = sizeof(peer);
    int client = accept(m_listenSocket, reinterpret_cast<sockaddr*>(&peer), &peerLen);
    if (client == INVALID_SOCKET) {
        if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK && errno != ECONNABORTED) {
            utils::Logger::Warning(utils::ErrorHandler::FormatLastError("accept failed"));
        }
        return;
    }

    char ip[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));
    utils::Logger::Debug("Accepted connection from " + std::string(ip) + ":" +
                         std::to_string(ntohs(peer.sin_port)));

    if (m_activeConnections.load() >= static_cast<int>(m_config.maxConnections)) {
        utils::Logger::Warning("Connection limit reached, rejecting connection");
        RejectConnection(client);
        return;
    }

    timeval sendTimeout = ToTimeval(m_config.connectionTimeout);
    if (setsockopt(client, SOL_SOCKET, SO_SNDTIMEO, &sendTimeout, sizeof(sendTimeout)) != 0) {
        utils::Logger::Debug(utils::ErrorHandler::FormatLastError("setsockopt(SO_SNDTIMEO) failed"));
    }

    auto connection = std::make_shared<Connection>();
    connection->socket = client;
    connection->deadline = std::chrono::steady_clock::now() + m_config.connectionTimeout;

    m_activeConnections.fetch_add(1);
    std::lock_guard<std::mutex> lock(m_idleMutex);
    m_idle.emplace(client, std::move(connection));
}

void HttpServer::DispatchReadable(int socket) {
    ConnectionPtr connection;
    {
        std::lock_guard<std::mutex> lock(m_idleMutex);
        auto it = m_idle.find(socket);
        if (it == m_idle.end()) {
            return;
        }
        connection = std::move(it->second);
        m_idle.erase(it);
    }

    if (!m_threadPool->Submit([this, connection]() { HandleConnection(connection); })) {
        CloseConnection(connection->socket);
    }
}

void HttpServer::ExpireIdleConnections() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<ConnectionPtr> expired;
    {
        std::lock_guard<std::mutex> lock(m_idleMutex);
        for (auto it = m_idle.begin(); it != m_idle.end();) {
            if (it->second->deadline <= now) {
                expired.push_back(std::move(it->second));
                it = m_idle.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& connection : expired) {
        if (connection->parser.HasPartialRequest()) {
            utils::Logger::Debug("Request timed out on socket " + std::to_string(connection->socket));
            auto response = http::HttpResponse::Text(http::HttpStatus::RequestTimeout, "Request timeout");
            response.SetKeepAlive(false);
            SendResponse(connection->socket, response);
        } else {
            utils::Logger::Debug("Closing idle connection on socket " + std::to_string(connection->socket));
        }
        CloseConnection(connection->socket);
    }
}

void HttpServer::Wakeup() {
    if (m_wakeupPipe[1] == INVALID_SOCKET) {
        return;
    }

    const char token = 1;
    if (write(m_wakeupPipe[1], &token, 1) < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
        utils::Logger::Debug(utils::ErrorHandler::FormatLastError("wakeup write failed"));
    }
}

void HttpServer::HandleConnection(const ConnectionPtr& connection) {
    const int socket = connection->socket;
    http::HttpParser& parser = connection->parser;
    char buffer[RECEIVE_BUFFER_SIZE];

    try {
        http::ParseResult result = http::ParseResult::NeedMoreData;

        while (true) {
            while (result == http::ParseResult::NeedMoreData) {
                ssize_t received = recv(socket, buffer, sizeof(buffer), MSG_DONTWAIT);
                if (received > 0) {
                    result = parser.Feed(buffer, static_cast<size_t>(received));
                    continue;
                }
                if (received == 0) {
                    CloseConnection(socket);
                    return;
                }
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    Park(connection, parser.HasPartialRequest() ? m_config.connectionTimeout
                                                                : m_config.keepAliveTimeout);
                    return;
                }
                utils::Logger::Debug(utils::ErrorHandler::FormatLastError("recv failed"));
                CloseConnection(socket);
                return;
            }

            bool keepAlive = false;
            http::HttpResponse response;
            switch (result) {
                case http::ParseResult::Complete:
                    keepAlive = parser.GetRequest().IsKeepAlive();
                    response = ProcessRequest(parser.GetRequest());
                    break;

                case http::ParseResult::MalformedRequest:
                    response = http::HttpResponse::BadRequest("Malformed request");
                    break;

                case http::ParseResult::RequestTooLarge:
                    response = http::HttpResponse::BadRequest("Request too large");
                    break;

                case http::ParseResult::NeedMoreData:
                    break;
            }

            keepAlive = keepAlive && m_running.load(std::memory_order_acquire);
            response.SetKeepAlive(keepAlive);

            if (!SendResponse(socket, response) || !keepAlive) {
                CloseConnection(socket);
                return;
            }

            std::string pending = parser.TakeRemainder();
            parser.Reset();
            result = pending.empty() ? http::ParseResult::NeedMoreData : parser.Feed(pending);
        }
    } catch (const std::exception& e) {
        utils::Logger::Error("Connection handler failed: " + std::string(e.what()));
        CloseConnection(socket);
    }
}

http::HttpResponse HttpServer::ProcessRequest(http::HttpRequest& request) {
    auto start = std::chrono::steady_clock::now();
    http::HttpResponse response = m_router.Route(request);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    utils::Logger::Debug(request.GetMethodName() + " " + request.GetPath() + " -> " +
                         std::to_string(response.GetStatusCode()) + " (" +
                         std::to_string(elapsed.count()) + " ms)");
    return response;
}

bool HttpServer::SendResponse(int socket, const http::HttpResponse& response) {
    const std::string data = response.Serialize();
    size_t offset = 0;

    while (offset < data.size()) {
        ssize_t sent = send(socket, data.data() + offset, data.size() - offset, SEND_FLAGS);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            utils::Logger::Debug(utils::ErrorHandler::FormatLastError("send failed"));
            return false;
        }
        offset += static_cast<size_t>(sent);
    }

    return true;
}

void HttpServer::RejectConnection(int socket) {
    auto response = http::HttpResponse::Text(http::HttpStatus::ServiceUnavailable, "Server busy");
    response.SetKeepAlive(false);
    SendResponse(socket, response);
    close(socket);
}

void HttpServer::Park(const ConnectionPtr& connection, std::chrono::seconds timeout) {
    connection->deadline = std::chrono::steady_clock::now() + timeout;

    bool parked = false;
    {
        std::lock_guard<std::mutex> lock(m_idleMutex);
        if (m_running.load(std::memory_order_acquire)) {
            m_idle.emplace(connection->socket, connection);
            parked = true;
        }
    }

    if (parked) {
        Wakeup();
    } else {
        CloseConnection(connection->socket);
    }
}

void HttpServer::CloseConnection(int socket) {
    close(socket);
    m_activeConnections.fetch_sub(1);
}

void HttpServer::CloseIdleConnections() {
    std::unordered_map<int, ConnectionPtr> idle;
    {
        std::lock_guard<std::mutex> lock(m_idleMutex);
        idle.swap(m_idle);
    }

    for (const auto& entry : idle) {
        CloseConnection(entry.first);
    }
}

void HttpServer::WaitForConnections(std::chrono::seconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (m_activeConnections.load() > 0) {
        if (std::chrono::steady_clock::now() > deadline) {
            utils::Logger::Warning("Timeout waiting for " + std::to_string(m_activeConnections.load()) +
                                   " connections to close");
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

} // namespace server
} // namespace reading_service
