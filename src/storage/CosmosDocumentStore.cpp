#include "storage/CosmosDocumentStore.hpp"
#include "utils/Logger.hpp"

#include <chrono>
#include <exception>

namespace reading_service {
namespace storage {

namespace {
    std::string ResourcePath(const ContainerAddress& address) {
        return "/" + address.ToString();
    }

    std::string ErrorMessage(const RestResponse& response) {
        auto body = nlohmann::json::parse(response.body, nullptr, false);
        if (body.is_object()) {
            auto it = body.find("message");
            if (it != body.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
        return response.body.empty() ? "no response body" : response.body;
    }
}

CosmosDocumentStore::CosmosDocumentStore(std::shared_ptr<IRestTransport> transport, const std::string& masterKey)
    : m_transport(std::move(transport))
    , m_auth(masterKey) {
}

StoreResult<nlohmann::json> CosmosDocumentStore::CreateItem(const ContainerAddress& address,
                                                            const nlohmann::json& document) {
    using ItemResult = StoreResult<nlohmann::json>;

    if (!document.is_object()) {
        return ItemResult::Err({StoreErrorKind::InvalidDocument, "document must be a JSON object"});
    }

    try {
        auto keyPath = GetPartitionKeyPath(address);
        if (keyPath.IsError()) {
            return ItemResult::Err(keyPath.Error());
        }

        RestRequest request;
        request.method = "POST";
        request.path = ResourcePath(address) + "/docs";
        request.headers["Content-Type"] = "application/json";
        request.headers["x-ms-documentdb-partitionkey"] = PartitionKeyValue(document, keyPath.Value());
        request.body = document.dump();

        RestResponse response = Send(std::move(request), "docs", address.ToString());
        if (response.status != 200 && response.status != 201) {
            return ItemResult::Err(ErrorFromResponse(response, StoreErrorKind::InvalidDocument));
        }

        auto stored = nlohmann::json::parse(response.body, nullptr, false);
        return ItemResult::Ok(stored.is_object() ? stored : document);
    } catch (const std::exception& e) {
        return ItemResult::Err({StoreErrorKind::Unavailable, std::string("request failed: ") + e.what()});
    }
}

StoreResult<std::vector<nlohmann::json>> CosmosDocumentStore::QueryItems(const ContainerAddress& address,
                                                                         const DocumentQuery& query) {
    using QueryResult = StoreResult<std::vector<nlohmann::json>>;

    try {
        if (!query.enableCrossPartition) {
            auto documents = QueryPages(address, query, "");
            if (documents.IsError()) {
                return documents;
            }
            return QueryResult::Ok(query.Apply(std::move(documents.Value())));
        }

        auto ranges = GetPartitionKeyRanges(address);
        if (ranges.IsError()) {
            return QueryResult::Err(ranges.Error());
        }

        std::vector<nlohmann::json> merged;
        for (const auto& rangeId : ranges.Value()) {
            auto documents = QueryPages(address, query, rangeId);
            if (documents.IsError()) {
                return documents;
            }
            for (auto& document : documents.Value()) {
                merged.push_back(std::move(document));
            }
        }

        return QueryResult::Ok(query.Apply(std::move(merged)));
    } catch (const std::exception& e) {
        return QueryResult::Err({StoreErrorKind::Unavailable, std::string("request failed: ") + e.what()});
    }
}

std::string CosmosDocumentStore::PartitionKeyValue(const nlohmann::json& document, const std::string& keyPath) {
    const nlohmann::json* current = &document;
    size_t start = keyPath.empty() || keyPath[0] != '/' ? 0 : 1;

    while (start <= keyPath.size()) {
        size_t end = keyPath.find('/', start);
        std::string segment = keyPath.substr(start, end == std::string::npos ? std::string::npos : end - start);

        if (!current->is_object()) {
            return "[{}]";
        }
        auto it = current->find(segment);
        if (it == current->end()) {
            return "[{}]";
        }
        current = &*it;

        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }

    if (current->is_object() || current->is_array()) {
        return "[{}]";
    }
    return nlohmann::json::array({*current}).dump();
}

StoreError CosmosDocumentStore::ErrorFromResponse(const RestResponse& response, StoreErrorKind badRequestKind) {
    const std::string detail = "HTTP " + std::to_string(response.status) + ": " + ErrorMessage(response);

    switch (response.status) {
        case 404:
            return {StoreErrorKind::ResourceNotFound, detail};
        case 409:
            return {StoreErrorKind::Conflict, detail};
        case 400:
        case 413:
            return {badRequestKind, detail};
        default:
            return {StoreErrorKind::Unavailable, detail};
    }
}

RestResponse CosmosDocumentStore::Send(RestRequest request, const std::string& resourceType,
                                       const std::string& resourceLink) {
    const std::string date = MasterKeyAuth::FormatHttpDate(std::chrono::system_clock::now());

    request.headers["Accept"] = "application/json";
    request.headers["x-ms-date"] = date;
    request.headers["x-ms-version"] = API_VERSION;
    request.headers["Authorization"] = m_auth.BuildToken(request.method, resourceType, resourceLink, date);

    utils::Logger::Debug("Store request " + request.method + " " + request.path);
    RestResponse response = m_transport->Send(request);
    utils::Logger::Debug("Store response " + std::to_string(response.status) + " for " + request.path);
    return response;
}

StoreResult<std::string> CosmosDocumentStore::GetPartitionKeyPath(const ContainerAddress& address) {
    using PathResult = StoreResult<std::string>;
    const std::string link = address.ToString();

    {
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        auto it = m_partitionKeyPaths.find(link);
        if (it != m_partitionKeyPaths.end()) {
            return PathResult::Ok(it->second);
        }
    }

    RestRequest request;
    request.method = "GET";
    request.path = ResourcePath(address);

    RestResponse response = Send(std::move(request), "colls", link);
    if (response.status != 200) {
        return PathResult::Err(ErrorFromResponse(response, StoreErrorKind::InvalidQuery));
    }

    auto collection = nlohmann::json::parse(response.body, nullptr, false);
    if (!collection.is_object()) {
        return PathResult::Err({StoreErrorKind::Unavailable, "unreadable container description for " + link});
    }

    // Containers created without an explicit key are partitioned by id.
    std::string path = "/id";
    auto key = collection.find("partitionKey");
    if (key != collection.end() && key->is_object()) {
        auto paths = key->find("paths");
        if (paths != key->end() && paths->is_array() && !paths->empty() && paths->front().is_string()) {
            path = paths->front().get<std::string>();
        }
    }

    std::lock_guard<std::mutex> lock(m_cacheMutex);
    m_partitionKeyPaths[link] = path;
    return PathResult::Ok(path);
}

StoreResult<std::vector<std::string>> CosmosDocumentStore::GetPartitionKeyRanges(const ContainerAddress& address) {
    using RangeResult = StoreResult<std::vector<std::string>>;

    RestRequest request;
    request.method = "GET";
    request.path = ResourcePath(address) + "/pkranges";

    RestResponse response = Send(std::move(request), "pkranges", address.ToString());
    if (response.status != 200) {
        return RangeResult::Err(ErrorFromResponse(response, StoreErrorKind::InvalidQuery));
    }

    auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (!body.is_object() || !body.contains("PartitionKeyRanges") || !body["PartitionKeyRanges"].is_array()) {
        return RangeResult::Err({StoreErrorKind::Unavailable,
                                 "unreadable partition key ranges for " + address.ToString()});
    }

    std::vector<std::string> ids;
    for (const auto& range : body["PartitionKeyRanges"]) {
        if (range.is_object() && range.contains("id") && range["id"].is_string()) {
            ids.push_back(range["id"].get<std::string>());
        }
    }
    return RangeResult::Ok(std::move(ids));
}

StoreResult<std::vector<nlohmann::json>> CosmosDocumentStore::QueryPages(const ContainerAddress& address,
                                                                         const DocumentQuery& query,
                                                                         const std::string& rangeId) {
    using QueryResult = StoreResult<std::vector<nlohmann::json>>;

    const std::string body = nlohmann::json{{"query", query.ToSql()},
                                            {"parameters", nlohmann::json::array()}}.dump();
    std::vector<nlohmann::json> documents;
    std::string continuation;

    do {
        RestRequest request;
        request.method = "POST";
        request.path = ResourcePath(address) + "/docs";
        request.headers["Content-Type"] = "application/query+json";
        request.headers["x-ms-documentdb-isquery"] = "True";
        request.headers["x-ms-documentdb-query-enablecrosspartition"] =
            query.enableCrossPartition ? "True" : "False";
        if (!rangeId.empty()) {
            request.headers["x-ms-documentdb-partitionkeyrangeid"] = rangeId;
        }
        if (!continuation.empty()) {
            request.headers["x-ms-continuation"] = continuation;
        }
        request.body = body;

        RestResponse response = Send(std::move(request), "docs", address.ToString());
        if (response.status != 200) {
            return QueryResult::Err(ErrorFromResponse(response, StoreErrorKind::InvalidQuery));
        }

        auto page = nlohmann::json::parse(response.body, nullptr, false);
        if (!page.is_object() || !page.contains("Documents") || !page["Documents"].is_array()) {
            return QueryResult::Err({StoreErrorKind::Unavailable,
                                     "unreadable query response from " + address.ToString()});
        }
        for (auto& document : page["Documents"]) {
            documents.push_back(std::move(document));
        }

        continuation = response.GetHeader("x-ms-continuation");
    } while (!continuation.empty());

    return QueryResult::Ok(std::move(documents));
}

} // namespace storage
} // namespace reading_service
