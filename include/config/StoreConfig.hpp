#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace reading_service {
namespace config {

// Connection settings for the document store. Built once at startup.
struct StoreConfig {
    std::string endpoint;
    std::string key;
    std::string databaseName;
    std::string containerName;

    // Names of the environment variables whose values are missing.
    std::vector<std::string> MissingFields() const;
    bool IsComplete() const { return MissingFields().empty(); }
};

constexpr const char* ENV_STORE_ENDPOINT = "COSMOS_ENDPOINT";
constexpr const char* ENV_STORE_KEY = "COSMOS_KEY";
constexpr const char* ENV_STORE_DATABASE = "COSMOS_DATABASE";
constexpr const char* ENV_STORE_CONTAINER = "COSMOS_CONTAINER";

using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

StoreConfig LoadStoreConfig(const EnvironmentLookup& lookup);
StoreConfig LoadStoreConfigFromEnvironment();

} // namespace config
} // namespace reading_service
