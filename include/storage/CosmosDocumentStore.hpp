#pragma once

#include "storage/IDocumentStore.hpp"
#include "storage/MasterKeyAuth.hpp"
#include "storage/RestTransport.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace reading_service {
namespace storage {

/**
 * Document store backed by the Cosmos DB SQL REST API.
 *
 * The database and container must already exist; a missing one is reported as
 * ResourceNotFound. Creates are routed by the container's partition key, which
 * is read once per container and cached. Cross partition queries run against
 * every partition key range and the pages are merged here, since the gateway
 * does not evaluate ORDER BY or TOP across ranges.
 */
class CosmosDocumentStore : public IDocumentStore {
public:
    // Throws std::invalid_argument if the master key is not valid base64.
    CosmosDocumentStore(std::shared_ptr<IRestTransport> transport, const std::string& masterKey);

    StoreResult<nlohmann::json> CreateItem(const ContainerAddress& address,
                                           const nlohmann::json& document) override;

    StoreResult<std::vector<nlohmann::json>> QueryItems(const ContainerAddress& address,
                                                        const DocumentQuery& query) override;

    static constexpr const char* API_VERSION = "2018-12-31";

    // Partition key header value for a document, "[{}]" when the key path is absent.
    static std::string PartitionKeyValue(const nlohmann::json& document, const std::string& keyPath);

    // Maps a failed response to the store error taxonomy.
    static StoreError ErrorFromResponse(const RestResponse& response, StoreErrorKind badRequestKind);

private:
    RestResponse Send(RestRequest request, const std::string& resourceType, const std::string& resourceLink);

    StoreResult<std::string> GetPartitionKeyPath(const ContainerAddress& address);
    StoreResult<std::vector<std::string>> GetPartitionKeyRanges(const ContainerAddress& address);
    StoreResult<std::vector<nlohmann::json>> QueryPages(const ContainerAddress& address,
                                                        const DocumentQuery& query,
                                                        const std::string& rangeId);

    std::shared_ptr<IRestTransport> m_transport;
    MasterKeyAuth m_auth;

    std::mutex m_cacheMutex;
    std::unordered_map<std::string, std::string> m_partitionKeyPaths;
};

} // namespace storage
} // namespace reading_service
