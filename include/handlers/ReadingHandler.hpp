#pragma once

#include "config/StoreConfig.hpp"
#include "handlers/HandlerError.hpp"
#include "handlers/IRequestHandler.hpp"
#include "storage/IDocumentStore.hpp"
#include <memory>

namespace reading_service {
namespace handlers {

/**
 * Single endpoint for device readings.
 *
 * POST stores the JSON body as a new document (assigning its "id"), GET returns
 * the document with the greatest "timestamp", every other method is rejected.
 * The handler keeps no per-request state, so one instance may serve
 * concurrent requests as long as the store is thread-safe.
 */
class ReadingHandler : public IRequestHandler {
public:
    ReadingHandler(config::StoreConfig config, std::shared_ptr<storage::IDocumentStore> store);

    // Outer boundary: never throws, maps every failure to a status code.
    http::HttpResponse Handle(http::HttpRequest& request) override;

    HandlerResult Process(http::HttpRequest& request);
    HandlerResult HandlePost(const http::HttpRequest& request);
    HandlerResult HandleGet();

    static http::HttpResponse ToResponse(const HandlerError& error);

    static constexpr size_t MAX_JSON_SIZE = 1024 * 1024;
    static constexpr const char* ALLOWED_METHODS = "GET, POST";

    static constexpr const char* MSG_STORED = "Reading stored successfully.";
    static constexpr const char* MSG_INVALID_BODY = "Invalid body: send a valid JSON object.";
    static constexpr const char* MSG_NO_READINGS = "No readings available.";
    static constexpr const char* MSG_METHOD_NOT_SUPPORTED =
        "HTTP method not supported. Use POST to store a reading or GET to fetch the latest reading.";
    static constexpr const char* MSG_STORE_CONFIG_ERROR = "Document store configuration error.";
    static constexpr const char* MSG_INTERNAL_ERROR = "Internal server error.";

private:
    core::Result<storage::ContainerAddress, HandlerError> ResolveContainer() const;
    static HandlerError FromStoreError(const storage::StoreError& error);
    static void LogError(const HandlerError& error);

    config::StoreConfig m_config;
    std::shared_ptr<storage::IDocumentStore> m_store;
};

} // namespace handlers
} // namespace reading_service
