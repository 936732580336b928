#include "storage/InMemoryDocumentStore.hpp"
#include <mutex>

namespace reading_service {
namespace storage {

bool InMemoryDocumentStore::CreateDatabase(const std::string& database) {
    if (database.empty()) {
        return false;
    }

    std::unique_lock lock(m_mutex);
    m_databases.try_emplace(database);
    return true;
}

bool InMemoryDocumentStore::CreateContainer(const ContainerAddress& address) {
    if (address.container.empty()) {
        return false;
    }

    std::unique_lock lock(m_mutex);
    auto db = m_databases.find(address.database);
    if (db == m_databases.end()) {
        return false;
    }

    db->second.try_emplace(address.container);
    return true;
}

bool InMemoryDocumentStore::ContainerExists(const ContainerAddress& address) const {
    std::shared_lock lock(m_mutex);
    auto db = m_databases.find(address.database);
    return db != m_databases.end() && db->second.count(address.container) > 0;
}

StoreResult<nlohmann::json> InMemoryDocumentStore::CreateItem(const ContainerAddress& address,
                                                              const nlohmann::json& document) {
    using ItemResult = StoreResult<nlohmann::json>;

    if (!document.is_object()) {
        return ItemResult::Err({StoreErrorKind::InvalidDocument, "document must be a JSON object"});
    }

    auto idIt = document.find("id");
    if (idIt == document.end() || !idIt->is_string()) {
        return ItemResult::Err({StoreErrorKind::InvalidDocument, "document requires a string \"id\""});
    }

    const std::string id = idIt->get<std::string>();
    if (id.empty() || id.size() > MAX_ID_LENGTH) {
        return ItemResult::Err({StoreErrorKind::InvalidDocument,
                                "\"id\" must be 1-" + std::to_string(MAX_ID_LENGTH) + " characters"});
    }

    if (document.dump().size() > MAX_DOCUMENT_SIZE) {
        return ItemResult::Err({StoreErrorKind::InvalidDocument, "document exceeds maximum size"});
    }

    std::unique_lock lock(m_mutex);

    auto db = m_databases.find(address.database);
    if (db == m_databases.end()) {
        return ItemResult::Err(NotFound(address));
    }
    auto container = db->second.find(address.container);
    if (container == db->second.end()) {
        return ItemResult::Err(NotFound(address));
    }

    if (!container->second.ids.insert(id).second) {
        return ItemResult::Err({StoreErrorKind::Conflict,
                                "document with id '" + id + "' already exists in " + address.ToString()});
    }

    container->second.documents.push_back(document);
    return ItemResult::Ok(document);
}

StoreResult<std::vector<nlohmann::json>> InMemoryDocumentStore::QueryItems(const ContainerAddress& address,
                                                                           const DocumentQuery& query) {
    using QueryResult = StoreResult<std::vector<nlohmann::json>>;

    std::vector<nlohmann::json> matches;
    {
        std::shared_lock lock(m_mutex);

        auto db = m_databases.find(address.database);
        if (db == m_databases.end()) {
            return QueryResult::Err(NotFound(address));
        }
        auto container = db->second.find(address.container);
        if (container == db->second.end()) {
            return QueryResult::Err(NotFound(address));
        }

        // Every document is its own partition (partitioned by id).
        if (!query.enableCrossPartition && container->second.documents.size() > 1) {
            return QueryResult::Err({StoreErrorKind::InvalidQuery,
                                     "cross partition query is required but disabled"});
        }

        matches = container->second.documents;
    }

    return QueryResult::Ok(query.Apply(std::move(matches)));
}

size_t InMemoryDocumentStore::Size(const ContainerAddress& address) const {
    std::shared_lock lock(m_mutex);
    auto db = m_databases.find(address.database);
    if (db == m_databases.end()) {
        return 0;
    }
    auto container = db->second.find(address.container);
    return container == db->second.end() ? 0 : container->second.documents.size();
}

void InMemoryDocumentStore::Clear() {
    std::unique_lock lock(m_mutex);
    for (auto& [name, database] : m_databases) {
        for (auto& [containerName, container] : database) {
            container.documents.clear();
            container.ids.clear();
        }
    }
}

StoreError InMemoryDocumentStore::NotFound(const ContainerAddress& address) {
    return {StoreErrorKind::ResourceNotFound, "resource " + address.ToString() + " does not exist"};
}

} // namespace storage
} // namespace reading_service
