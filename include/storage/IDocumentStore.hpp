#pragma once

#include "core/Result.hpp"
#include "storage/DocumentQuery.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace reading_service {
namespace storage {

enum class StoreErrorKind {
    ResourceNotFound,   // database or container does not exist
    Conflict,           // a document with the same id already exists
    InvalidDocument,
    InvalidQuery,
    Unavailable
};

inline std::string StoreErrorKindToString(StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::ResourceNotFound: return "ResourceNotFound";
        case StoreErrorKind::Conflict: return "Conflict";
        case StoreErrorKind::InvalidDocument: return "InvalidDocument";
        case StoreErrorKind::InvalidQuery: return "InvalidQuery";
        case StoreErrorKind::Unavailable: return "Unavailable";
        default: return "Unknown";
    }
}

struct StoreError {
    StoreErrorKind kind;
    std::string message;

    std::string ToString() const { return StoreErrorKindToString(kind) + ": " + message; }
};

struct ContainerAddress {
    std::string database;
    std::string container;

    std::string ToString() const { return "dbs/" + database + "/colls/" + container; }
};

template <typename T>
using StoreResult = core::Result<T, StoreError>;

// Client side of a document database. Documents are JSON objects keyed by a string "id".
class IDocumentStore {
public:
    virtual ~IDocumentStore() = default;

    // Returns the stored document.
    virtual StoreResult<nlohmann::json> CreateItem(const ContainerAddress& address,
                                                   const nlohmann::json& document) = 0;

    virtual StoreResult<std::vector<nlohmann::json>> QueryItems(const ContainerAddress& address,
                                                                const DocumentQuery& query) = 0;
};

} // namespace storage
} // namespace reading_service
