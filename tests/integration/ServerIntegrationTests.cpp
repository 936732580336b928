#include "handlers/ReadingHandler.hpp"
#include "server/HttpServer.hpp"
#include "storage/InMemoryDocumentStore.hpp"
#include "utils/Logger.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <cctype>
#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

using namespace reading_service;

struct HttpTestResponse {
    int statusCode = 0;
    std::string statusText;
    std::string body;
    std::unordered_map<std::string, std::string> headers;
};

class TestClient {
public:
    TestClient(const std::string& host, uint16_t port)
        : m_host(host), m_port(port), m_socket(-1) {
    }

    ~TestClient() {
        Disconnect();
    }

    bool Connect() {
        m_socket = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        if (m_socket < 0) {
            return false;
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(m_port);
        inet_pton(AF_INET, m_host.c_str(), &addr.sin_addr);

        if (connect(m_socket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(m_socket);
            m_socket = -1;
            return false;
        }

        timeval timeout{};
        timeout.tv_sec = 5;
        setsockopt(m_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        return true;
    }

    void Disconnect() {
        if (m_socket >= 0) {
            close(m_socket);
            m_socket = -1;
        }
    }

    // One request per connection ("Connection: close"), response read until EOF.
    HttpTestResponse SendRequest(const std::string& method, const std::string& path,
                                 const std::string& body = "") {
        std::string raw = SendRaw(BuildRequest(method, path, body, false));
        HttpTestResponse response;
        ParseResponse(raw, response);
        return response;
    }

    // Writes bytes as-is and reads until the server closes the connection.
    std::string SendRaw(const std::string& request) {
        EnsureConnected();
        SendAll(request);

        std::string raw;
        char buffer[4096];
        ssize_t received;
        while ((received = recv(m_socket, buffer, sizeof(buffer), 0)) > 0) {
            raw.append(buffer, static_cast<size_t>(received));
        }

        Disconnect();
        return raw;
    }

    // Sends on the open connection and reads exactly one response, leaving the connection open.
    HttpTestResponse SendKeepAlive(const std::string& method, const std::string& path,
                                   const std::string& body = "") {
        EnsureConnected();
        SendAll(BuildRequest(method, path, body, true));

        std::string raw;
        char buffer[4096];
        while (true) {
            auto headerEnd = raw.find("\r\n\r\n");
            if (headerEnd != std::string::npos) {
                HttpTestResponse response;
                ParseResponse(raw, response);
                size_t expected = std::stoul(response.headers["content-length"]);
                if (raw.size() >= headerEnd + 4 + expected) {
                    response.body = raw.substr(headerEnd + 4, expected);
                    return response;
                }
            }

            ssize_t received = recv(m_socket, buffer, sizeof(buffer), 0);
            if (received <= 0) {
                throw std::runtime_error("Connection closed before full response");
            }
            raw.append(buffer, static_cast<size_t>(received));
        }
    }

    // Writes bytes without waiting for an answer.
    void SendOnly(const std::string& data) {
        EnsureConnected();
        SendAll(data);
    }

    // Reads until the server closes the connection (or the 5 s receive timeout hits).
    std::string ReadUntilClosed() {
        std::string raw;
        char buffer[4096];
        ssize_t received;
        while ((received = recv(m_socket, buffer, sizeof(buffer), 0)) > 0) {
            raw.append(buffer, static_cast<size_t>(received));
        }
        m_lastReadClosed = (received == 0);
        return raw;
    }

    bool LastReadClosed() const { return m_lastReadClosed; }

private:
    void EnsureConnected() {
        if (m_socket < 0 && !Connect()) {
            throw std::runtime_error("Failed to connect");
        }
    }

    void SendAll(const std::string& data) {
        size_t offset = 0;
        while (offset < data.size()) {
            ssize_t sent = send(m_socket, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
            if (sent <= 0) {
                throw std::runtime_error("Failed to send request");
            }
            offset += static_cast<size_t>(sent);
        }
    }

    std::string BuildRequest(const std::string& method, const std::string& path,
                             const std::string& body, bool keepAlive) const {
        std::ostringstream request;
        request << method << " " << path << " HTTP/1.1\r\n";
        request << "Host: " << m_host << ":" << m_port << "\r\n";

        if (!body.empty()) {
            request << "Content-Type: application/json\r\n";
            request << "Content-Length: " << body.size() << "\r\n";
        }

        request << "Connection: " << (keepAlive ? "keep-alive" : "close") << "\r\n";
        request << "\r\n";
        request << body;
        return request.str();
    }

    static void ParseResponse(const std::string& raw, HttpTestResponse& response) {
        auto lineEnd = raw.find("\r\n");
        if (lineEnd == std::string::npos) {
            return;
        }

        std::string statusLine = raw.substr(0, lineEnd);
        auto firstSpace = statusLine.find(' ');
        auto secondSpace = statusLine.find(' ', firstSpace + 1);

        if (firstSpace != std::string::npos && secondSpace != std::string::npos) {
            response.statusCode = std::stoi(statusLine.substr(firstSpace + 1, secondSpace - firstSpace - 1));
            response.statusText = statusLine.substr(secondSpace + 1);
        }

        auto bodyStart = raw.find("\r\n\r\n");
        size_t pos = lineEnd + 2;
        while (bodyStart != std::string::npos && pos < bodyStart) {
            auto end = raw.find("\r\n", pos);
            std::string line = raw.substr(pos, end - pos);
            auto colon = line.find(':');
            if (colon != std::string::npos) {
                std::string name = line.substr(0, colon);
                for (auto& c : name) {
                    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                }
                std::string value = line.substr(colon + 1);
                if (!value.empty() && value[0] == ' ') {
                    value.erase(0, 1);
                }
                response.headers[name] = value;
            }
            pos = end + 2;
        }

        if (bodyStart != std::string::npos) {
            response.body = raw.substr(bodyStart + 4);
        }
    }

    std::string m_host;
    uint16_t m_port;
    int m_socket;
    bool m_lastReadClosed = false;
};

class ServerIntegrationTest : public ::testing::Test {
protected:
    static std::unique_ptr<server::HttpServer> s_server;
    static std::shared_ptr<storage::InMemoryDocumentStore> s_store;
    static uint16_t s_port;

    static void SetUpTestSuite() {
        utils::Logger::SetLevel(utils::LogLevel::Error);

        config::StoreConfig storeConfig{"https://localhost:8081/", "test-key", "rfid", "readings"};
        s_store = std::make_shared<storage::InMemoryDocumentStore>();
        s_store->CreateDatabase(storeConfig.databaseName);
        s_store->CreateContainer({storeConfig.databaseName, storeConfig.containerName});

        server::ServerConfig config;
        config.port = 0;
        config.bindAddress = "127.0.0.1";
        config.threadPoolSize = 4;
        config.connectionTimeout = std::chrono::seconds(5);
        config.serverVersion = "1.0-test";

        s_server = std::make_unique<server::HttpServer>(
            config, std::make_shared<handlers::ReadingHandler>(storeConfig, s_store));
        s_server->Start();
        s_port = s_server->GetPort();

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    static void TearDownTestSuite() {
        if (s_server) {
            s_server->Stop();
            s_server.reset();
        }
        s_store.reset();
        utils::Logger::SetLevel(utils::LogLevel::Info);
    }

    void SetUp() override {
        s_store->Clear();
    }

    TestClient CreateClient() {
        return TestClient("127.0.0.1", s_port);
    }
};

std::unique_ptr<server::HttpServer> ServerIntegrationTest::s_server;
std::shared_ptr<storage::InMemoryDocumentStore> ServerIntegrationTest::s_store;
uint16_t ServerIntegrationTest::s_port = 0;

TEST_F(ServerIntegrationTest, ServerReportsBoundPort) {
    EXPECT_TRUE(s_server->IsRunning());
    EXPECT_NE(s_port, 0);
}

TEST_F(ServerIntegrationTest, PostReadingReturns200) {
    auto client = CreateClient();
    auto response = client.SendRequest("POST", "/api/readings",
                                       R"({"uid":"04:A3:2B","timestamp":"2024-01-02 10:00:00"})");

    EXPECT_EQ(response.statusCode, 200);
    EXPECT_EQ(response.body, handlers::ReadingHandler::MSG_STORED);
    EXPECT_EQ(s_store->Size({"rfid", "readings"}), 1u);
}

TEST_F(ServerIntegrationTest, GetReturnsLatestReading) {
    for (const char* ts : {"2024-01-01 00:00:00", "2024-01-02 00:00:00", "2023-12-31 00:00:00"}) {
        auto client = CreateClient();
        nlohmann::json body = {{"uid", "tag"}, {"timestamp", ts}};
        ASSERT_EQ(client.SendRequest("POST", "/api/readings", body.dump()).statusCode, 200);
    }

    auto client = CreateClient();
    auto response = client.SendRequest("GET", "/api/readings");

    ASSERT_EQ(response.statusCode, 200);
    EXPECT_EQ(response.headers["content-type"], "application/json");
    auto json = nlohmann::json::parse(response.body);
    EXPECT_EQ(json["timestamp"], "2024-01-02 00:00:00");
}

TEST_F(ServerIntegrationTest, GetWithoutReadingsReturns404) {
    auto client = CreateClient();
    auto response = client.SendRequest("GET", "/api/readings");

    EXPECT_EQ(response.statusCode, 404);
    EXPECT_EQ(response.body, handlers::ReadingHandler::MSG_NO_READINGS);
}

TEST_F(ServerIntegrationTest, PutReturns405) {
    auto client = CreateClient();
    auto response = client.SendRequest("PUT", "/api/readings", "{}");

    EXPECT_EQ(response.statusCode, 405);
    EXPECT_NE(response.body.find("POST"), std::string::npos);
    EXPECT_NE(response.body.find("GET"), std::string::npos);
    EXPECT_EQ(response.headers["allow"], "GET, POST");
}

TEST_F(ServerIntegrationTest, MalformedJsonReturns400) {
    auto client = CreateClient();
    auto response = client.SendRequest("POST", "/api/readings", "not valid json");

    EXPECT_EQ(response.statusCode, 400);
}

TEST_F(ServerIntegrationTest, UnknownEndpointReturns404) {
    auto client = CreateClient();
    auto response = client.SendRequest("GET", "/unknown/endpoint");

    EXPECT_EQ(response.statusCode, 404);
}

TEST_F(ServerIntegrationTest, MalformedRequestLineReturns400) {
    auto client = CreateClient();
    std::string raw = client.SendRaw("THIS IS NOT HTTP\r\n\r\n");

    EXPECT_EQ(raw.rfind("HTTP/1.1 400", 0), 0u);
}

TEST_F(ServerIntegrationTest, KeepAliveServesSeveralRequests) {
    auto client = CreateClient();

    auto post = client.SendKeepAlive("POST", "/api/readings",
                                     R"({"uid":"A1","timestamp":"2024-03-01 08:00:00"})");
    EXPECT_EQ(post.statusCode, 200);

    auto get = client.SendKeepAlive("GET", "/api/readings");
    ASSERT_EQ(get.statusCode, 200);
    EXPECT_EQ(nlohmann::json::parse(get.body)["uid"], "A1");
}

TEST_F(ServerIntegrationTest, MultipleRequests) {
    for (int i = 0; i < 5; ++i) {
        auto client = CreateClient();
        auto response = client.SendRequest("POST", "/api/readings", R"({"sensor":"door"})");
        EXPECT_EQ(response.statusCode, 200);
    }
    EXPECT_EQ(s_store->Size({"rfid", "readings"}), 5u);
}

TEST_F(ServerIntegrationTest, ConcurrentClients) {
    const int clientCount = 8;
    std::vector<std::thread> threads;
    std::atomic<int> succeeded{0};

    for (int i = 0; i < clientCount; ++i) {
        threads.emplace_back([&succeeded, i]() {
            TestClient client("127.0.0.1", s_port);
            nlohmann::json body = {{"uid", "tag-" + std::to_string(i)}, {"timestamp", "2024-05-01 12:00:00"}};
            if (client.SendRequest("POST", "/api/readings", body.dump()).statusCode == 200) {
                succeeded.fetch_add(1);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), clientCount);
    EXPECT_EQ(s_store->Size({"rfid", "readings"}), static_cast<size_t>(clientCount));
}

TEST_F(ServerIntegrationTest, IdleConnectionsDoNotHoldWorkers) {
    // More silent clients than worker threads.
    std::vector<std::unique_ptr<TestClient>> idleClients;
    for (int i = 0; i < 6; ++i) {
        auto idle = std::make_unique<TestClient>("127.0.0.1", s_port);
        ASSERT_TRUE(idle->Connect());
        idleClients.push_back(std::move(idle));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto start = std::chrono::steady_clock::now();
    auto client = CreateClient();
    auto response = client.SendRequest("GET", "/api/readings");
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EXPECT_EQ(response.statusCode, 404);
    EXPECT_LT(elapsed.count(), 1000);
    EXPECT_GE(s_server->GetIdleConnections(), 6u);
}

TEST_F(ServerIntegrationTest, KeepAliveConnectionDoesNotHoldWorkers) {
    std::vector<std::unique_ptr<TestClient>> keepAliveClients;
    for (int i = 0; i < 6; ++i) {
        auto keepAlive = std::make_unique<TestClient>("127.0.0.1", s_port);
        ASSERT_EQ(keepAlive->SendKeepAlive("GET", "/api/readings").statusCode, 404);
        keepAliveClients.push_back(std::move(keepAlive));
    }

    auto start = std::chrono::steady_clock::now();
    auto client = CreateClient();
    auto response = client.SendRequest("POST", "/api/readings", R"({"uid":"A1","timestamp":"2024-06-01 00:00:00"})");
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EXPECT_EQ(response.statusCode, 200);
    EXPECT_LT(elapsed.count(), 1000);
}

class ServerTimeoutTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::SetLevel(utils::LogLevel::Error);

        config::StoreConfig storeConfig{"https://localhost:8081/", "test-key", "rfid", "readings"};
        m_store = std::make_shared<storage::InMemoryDocumentStore>();
        m_store->CreateDatabase(storeConfig.databaseName);
        m_store->CreateContainer({storeConfig.databaseName, storeConfig.containerName});

        server::ServerConfig config;
        config.port = 0;
        config.bindAddress = "127.0.0.1";
        config.threadPoolSize = 1;
        config.connectionTimeout = std::chrono::seconds(1);
        config.keepAliveTimeout = std::chrono::seconds(1);
        config.shutdownTimeout = std::chrono::seconds(2);

        m_server = std::make_unique<server::HttpServer>(
            config, std::make_shared<handlers::ReadingHandler>(storeConfig, m_store));
        m_server->Start();
    }

    void TearDown() override {
        m_server->Stop();
        utils::Logger::SetLevel(utils::LogLevel::Info);
    }

    std::shared_ptr<storage::InMemoryDocumentStore> m_store;
    std::unique_ptr<server::HttpServer> m_server;
};

TEST_F(ServerTimeoutTest, IdleKeepAliveConnectionIsClosed) {
    TestClient client("127.0.0.1", m_server->GetPort());
    ASSERT_EQ(client.SendKeepAlive("GET", "/api/readings").statusCode, 404);

    std::string rest = client.ReadUntilClosed();
    EXPECT_TRUE(rest.empty());
    EXPECT_TRUE(client.LastReadClosed());
}

TEST_F(ServerTimeoutTest, IncompleteRequestGets408) {
    TestClient client("127.0.0.1", m_server->GetPort());
    client.SendOnly("GET /api/readings HTTP/1.1\r\nHost: localhost\r\n");

    std::string raw = client.ReadUntilClosed();
    EXPECT_EQ(raw.rfind("HTTP/1.1 408", 0), 0u);
    EXPECT_TRUE(client.LastReadClosed());
}

TEST_F(ServerTimeoutTest, SingleWorkerServesClientsBehindSilentOne) {
    TestClient silent("127.0.0.1", m_server->GetPort());
    ASSERT_TRUE(silent.Connect());

    TestClient client("127.0.0.1", m_server->GetPort());
    EXPECT_EQ(client.SendRequest("GET", "/api/readings").statusCode, 404);
}
