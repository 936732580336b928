#pragma once

#include "storage/IDocumentStore.hpp"
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace reading_service {
namespace storage {

// Process-local document store with the same contract as the managed one:
// containers must be provisioned before use, ids are unique per container and
// queries order documents the way the document database does.
class InMemoryDocumentStore : public IDocumentStore {
public:
    InMemoryDocumentStore() = default;

    // Provisioning. Both are idempotent; CreateContainer fails if the database is missing.
    bool CreateDatabase(const std::string& database);
    bool CreateContainer(const ContainerAddress& address);
    bool ContainerExists(const ContainerAddress& address) const;

    StoreResult<nlohmann::json> CreateItem(const ContainerAddress& address,
                                           const nlohmann::json& document) override;

    StoreResult<std::vector<nlohmann::json>> QueryItems(const ContainerAddress& address,
                                                        const DocumentQuery& query) override;

    size_t Size(const ContainerAddress& address) const;
    void Clear();

    static constexpr size_t MAX_DOCUMENT_SIZE = 2 * 1024 * 1024;
    static constexpr size_t MAX_ID_LENGTH = 255;

private:
    struct Container {
        std::vector<nlohmann::json> documents;
        std::unordered_set<std::string> ids;
    };

    using Database = std::unordered_map<std::string, Container>;

    static StoreError NotFound(const ContainerAddress& address);

    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, Database> m_databases;
};

} // namespace storage
} // namespace reading_service
