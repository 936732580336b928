#include "config/StoreConfig.hpp"

#include <cstdlib>

namespace reading_service {
namespace config {

std::vector<std::string> StoreConfig::MissingFields() const {
    std::vector<std::string> missing;
    if (endpoint.empty()) missing.emplace_back(ENV_STORE_ENDPOINT);
    if (key.empty()) missing.emplace_back(ENV_STORE_KEY);
    if (databaseName.empty()) missing.emplace_back(ENV_STORE_DATABASE);
    if (containerName.empty()) missing.emplace_back(ENV_STORE_CONTAINER);
    return missing;
}

StoreConfig LoadStoreConfig(const EnvironmentLookup& lookup) {
    StoreConfig config;
    config.endpoint = lookup(ENV_STORE_ENDPOINT).value_or("");
    config.key = lookup(ENV_STORE_KEY).value_or("");
    config.databaseName = lookup(ENV_STORE_DATABASE).value_or("");
    config.containerName = lookup(ENV_STORE_CONTAINER).value_or("");
    return config;
}

StoreConfig LoadStoreConfigFromEnvironment() {
    return LoadStoreConfig([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

} // namespace config
} // namespace reading_service
