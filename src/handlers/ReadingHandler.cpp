#include "handlers/ReadingHandler.hpp"
#include "models/Reading.hpp"
#include "utils/Logger.hpp"
#include <nlohmann/json.hpp>

namespace reading_service {
namespace handlers {

namespace {
    using AddressResult = core::Result<storage::ContainerAddress, HandlerError>;

    std::string JoinNames(const std::vector<std::string>& names) {
        std::string joined;
        for (const auto& name : names) {
            if (!joined.empty()) {
                joined += ", ";
            }
            joined += name;
        }
        return joined;
    }
}

ReadingHandler::ReadingHandler(config::StoreConfig config, std::shared_ptr<storage::IDocumentStore> store)
    : m_config(std::move(config))
    , m_store(std::move(store)) {
}

http::HttpResponse ReadingHandler::Handle(http::HttpRequest& request) {
    utils::Logger::Info("Reading handler invoked: " + request.GetMethodName() + " " + request.GetPath());

    try {
        HandlerResult result = Process(request);
        if (result.IsOk()) {
            return std::move(result.Value());
        }
        LogError(result.Error());
        return ToResponse(result.Error());
    } catch (const std::exception& e) {
        HandlerError error{ErrorKind::InternalError, MSG_INTERNAL_ERROR,
                           std::string("unexpected exception: ") + e.what()};
        LogError(error);
        return ToResponse(error);
    }
}

HandlerResult ReadingHandler::Process(http::HttpRequest& request) {
    switch (request.GetMethod()) {
        case http::HttpMethod::POST:
            return HandlePost(request);
        case http::HttpMethod::GET:
            return HandleGet();
        default:
            return HandlerResult::Err({ErrorKind::MethodNotSupported, MSG_METHOD_NOT_SUPPORTED,
                                       "unsupported HTTP method: " + request.GetMethodName()});
    }
}

HandlerResult ReadingHandler::HandlePost(const http::HttpRequest& request) {
    const std::string& body = request.GetBody();

    if (body.size() > MAX_JSON_SIZE) {
        return HandlerResult::Err({ErrorKind::BadRequest, "Request body too large.",
                                   "body of " + std::to_string(body.size()) + " bytes exceeds limit"});
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return HandlerResult::Err({ErrorKind::BadRequest, MSG_INVALID_BODY,
                                   std::string("JSON parse error: ") + e.what()});
    }

    utils::Logger::Debug("Received reading: " + document.dump());

    // Well-formed JSON that cannot be turned into a document (not an object,
    // non-string uid/timestamp) is a processing failure, not a bad request.
    auto id = models::Reading::AssignId(document);
    if (id.IsError()) {
        return HandlerResult::Err({ErrorKind::InternalError, MSG_INTERNAL_ERROR,
                                   "cannot assign reading id: " + id.Error()});
    }
    utils::Logger::Info("Assigned id: " + id.Value());

    auto address = ResolveContainer();
    if (address.IsError()) {
        return HandlerResult::Err(std::move(address.Error()));
    }

    auto created = m_store->CreateItem(address.Value(), document);
    if (created.IsError()) {
        return HandlerResult::Err(FromStoreError(created.Error()));
    }

    utils::Logger::Info("Reading stored in " + address.Value().ToString() + ": " + id.Value());
    return HandlerResult::Ok(http::HttpResponse::Ok(MSG_STORED));
}

HandlerResult ReadingHandler::HandleGet() {
    auto address = ResolveContainer();
    if (address.IsError()) {
        return HandlerResult::Err(std::move(address.Error()));
    }

    auto query = storage::DocumentQuery::Latest(models::Reading::TIMESTAMP_FIELD);
    utils::Logger::Debug("Querying " + address.Value().ToString() + ": " + query.ToSql());

    auto items = m_store->QueryItems(address.Value(), query);
    if (items.IsError()) {
        return HandlerResult::Err(FromStoreError(items.Error()));
    }

    if (items.Value().empty()) {
        return HandlerResult::Err({ErrorKind::NotFound, MSG_NO_READINGS,
                                   "no readings in " + address.Value().ToString()});
    }

    const nlohmann::json& latest = items.Value().front();
    auto idIt = latest.find(models::Reading::ID_FIELD);
    utils::Logger::Info("Latest reading: " + (idIt != latest.end() ? idIt->dump() : std::string("<no id>")));
    return HandlerResult::Ok(http::HttpResponse::Json(latest));
}

http::HttpResponse ReadingHandler::ToResponse(const HandlerError& error) {
    if (error.kind == ErrorKind::MethodNotSupported) {
        return http::HttpResponse::MethodNotAllowed(error.message, ALLOWED_METHODS);
    }
    return http::HttpResponse::Text(error.GetStatus(), error.message);
}

AddressResult ReadingHandler::ResolveContainer() const {
    auto missing = m_config.MissingFields();
    if (!missing.empty()) {
        return AddressResult::Err({ErrorKind::InternalError, MSG_INTERNAL_ERROR,
                                   "missing store configuration: " + JoinNames(missing)});
    }

    if (!m_store) {
        return AddressResult::Err({ErrorKind::InternalError, MSG_INTERNAL_ERROR,
                                   "no document store client configured"});
    }

    utils::Logger::Debug("Using document store " + m_config.endpoint + " (" +
                         m_config.databaseName + "/" + m_config.containerName + ")");
    return AddressResult::Ok({m_config.databaseName, m_config.containerName});
}

HandlerError ReadingHandler::FromStoreError(const storage::StoreError& error) {
    if (error.kind == storage::StoreErrorKind::ResourceNotFound) {
        return {ErrorKind::StoreConfigurationError, MSG_STORE_CONFIG_ERROR,
                error.ToString() + ". Check the database and container names"};
    }
    return {ErrorKind::InternalError, MSG_INTERNAL_ERROR, "document store failure: " + error.ToString()};
}

void ReadingHandler::LogError(const HandlerError& error) {
    std::string line = ErrorKindToString(error.kind) + ": " + error.detail;
    switch (error.kind) {
        case ErrorKind::NotFound:
            utils::Logger::Info(line);
            break;
        case ErrorKind::MethodNotSupported:
            utils::Logger::Warning(line);
            break;
        default:
            utils::Logger::Error(line);
            break;
    }
}

} // namespace handlers
} // namespace reading_service
