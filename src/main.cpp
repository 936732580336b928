#include "config/StoreConfig.hpp"
#include "handlers/ReadingHandler.hpp"
#include "server/HttpServer.hpp"
#include "storage/BeastRestTransport.hpp"
#include "storage/CosmosDocumentStore.hpp"
#include "utils/Logger.hpp"

#include <signal.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

namespace {
    volatile std::sig_atomic_t g_stopRequested = 0;

    void SignalHandler(int /*signal*/) {
        g_stopRequested = 1;
    }

    void InstallSignalHandlers() {
        struct sigaction action{};
        action.sa_handler = SignalHandler;
        sigemptyset(&action.sa_mask);
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);

        std::signal(SIGPIPE, SIG_IGN);
    }

    void PrintUsage(const char* program) {
        std::cout << "Usage: " << program << " [options]\n"
                  << "Options:\n"
                  << "  -p, --port <port>        HTTP port (default: 7071)\n"
                  << "  -b, --bind <address>     Bind address (default: 0.0.0.0)\n"
                  << "  -r, --route <path>       Readings endpoint (default: /api/readings)\n"
                  << "  -t, --threads <n>        Worker threads (default: CPU * 2)\n"
                  << "  -k, --keep-alive <sec>   Idle keep-alive timeout (default: 5)\n"
                  << "  -l, --log-level <level>  debug, info, warning or error\n"
                  << "  -v, --verbose            Same as --log-level debug\n"
                  << "  -h, --help               Show this help\n"
                  << "\n"
                  << "Environment (required):\n"
                  << "  " << reading_service::config::ENV_STORE_ENDPOINT << "    document store endpoint URL\n"
                  << "  " << reading_service::config::ENV_STORE_KEY << "         document store access key\n"
                  << "  " << reading_service::config::ENV_STORE_DATABASE << "    database name\n"
                  << "  " << reading_service::config::ENV_STORE_CONTAINER << "   container name\n"
                  << std::endl;
    }

    std::string RequireValue(int argc, char* argv[], int& i) {
        if (i + 1 >= argc) {
            throw std::invalid_argument(std::string("Missing value for ") + argv[i]);
        }
        return argv[++i];
    }

    reading_service::server::ServerConfig ParseArgs(int argc, char* argv[]) {
        using reading_service::utils::Logger;
        reading_service::server::ServerConfig config;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-p" || arg == "--port") {
                int port = std::stoi(RequireValue(argc, argv, i));
                if (port < 0 || port > 65535) {
                    throw std::invalid_argument("Port out of range: " + std::to_string(port));
                }
                config.port = static_cast<uint16_t>(port);
            } else if (arg == "-b" || arg == "--bind") {
                config.bindAddress = RequireValue(argc, argv, i);
            } else if (arg == "-r" || arg == "--route") {
                config.route = RequireValue(argc, argv, i);
            } else if (arg == "-t" || arg == "--threads") {
                config.threadPoolSize = static_cast<size_t>(std::stoul(RequireValue(argc, argv, i)));
            } else if (arg == "-k" || arg == "--keep-alive") {
                int seconds = std::stoi(RequireValue(argc, argv, i));
                if (seconds < 1) {
                    throw std::invalid_argument("Keep-alive timeout must be at least 1 second");
                }
                config.keepAliveTimeout = std::chrono::seconds(seconds);
            } else if (arg == "-l" || arg == "--log-level") {
                std::string name = RequireValue(argc, argv, i);
                auto level = Logger::ParseLevel(name);
                if (!level) {
                    throw std::invalid_argument("Unknown log level: " + name);
                }
                Logger::SetLevel(*level);
            } else if (arg == "-v" || arg == "--verbose") {
                Logger::SetLevel(reading_service::utils::LogLevel::Debug);
            } else if (arg == "-h" || arg == "--help") {
                PrintUsage(argv[0]);
                std::exit(0);
            } else {
                throw std::invalid_argument("Unknown option: " + arg);
            }
        }

        return config;
    }
}

int main(int argc, char* argv[]) {
    using namespace reading_service;

    try {
        server::ServerConfig serverConfig = ParseArgs(argc, argv);

        config::StoreConfig storeConfig = config::LoadStoreConfigFromEnvironment();
        auto missing = storeConfig.MissingFields();
        if (!missing.empty()) {
            for (const auto& name : missing) {
                utils::Logger::Error("Missing required environment variable " + name);
            }
            return 1;
        }

        // The database and container are provisioned outside the service.
        auto endpoint = storage::ServiceEndpoint::Parse(storeConfig.endpoint);
        auto transport = std::make_shared<storage::BeastRestTransport>(endpoint);
        auto store = std::make_shared<storage::CosmosDocumentStore>(transport, storeConfig.key);
        utils::Logger::Info("Document store " + endpoint.host + ":" + std::to_string(endpoint.port) +
                            " container dbs/" + storeConfig.databaseName + "/colls/" + storeConfig.containerName);

        auto handler = std::make_shared<handlers::ReadingHandler>(storeConfig, store);

        InstallSignalHandlers();

        server::HttpServer server(serverConfig, handler);
        server.Start();

        std::cout << "\n"
                  << "========================================\n"
                  << "  Reading Service v" << serverConfig.serverVersion << "\n"
                  << "========================================\n"
                  << "  HTTP:  http://localhost:" << server.GetPort() << "\n"
                  << "\n"
                  << "  Endpoints:\n"
                  << "    POST " << serverConfig.route << "  - Store a reading\n"
                  << "    GET  " << serverConfig.route << "  - Latest reading\n"
                  << "\n"
                  << "  Press Ctrl+C to stop the server\n"
                  << "========================================\n"
                  << std::endl;

        while (g_stopRequested == 0 && server.IsRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        utils::Logger::Info("Shutdown signal received");
        server.Stop();

    } catch (const std::exception& e) {
        utils::Logger::Error("Fatal error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
