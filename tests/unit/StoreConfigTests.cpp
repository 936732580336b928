#include "config/StoreConfig.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <map>
#include <string>

using namespace reading_service::config;

namespace {
    EnvironmentLookup FromMap(std::map<std::string, std::string> values) {
        return [values](const std::string& name) -> std::optional<std::string> {
            auto it = values.find(name);
            if (it == values.end()) {
                return std::nullopt;
            }
            return it->second;
        };
    }
}

TEST(StoreConfigTest, LoadsAllFields) {
    auto config = LoadStoreConfig(FromMap({
        {"COSMOS_ENDPOINT", "https://example.documents.azure.com:443/"},
        {"COSMOS_KEY", "secret"},
        {"COSMOS_DATABASE", "rfid"},
        {"COSMOS_CONTAINER", "readings"}
    }));

    EXPECT_EQ(config.endpoint, "https://example.documents.azure.com:443/");
    EXPECT_EQ(config.key, "secret");
    EXPECT_EQ(config.databaseName, "rfid");
    EXPECT_EQ(config.containerName, "readings");
    EXPECT_TRUE(config.IsComplete());
    EXPECT_TRUE(config.MissingFields().empty());
}

TEST(StoreConfigTest, ReportsMissingVariables) {
    auto config = LoadStoreConfig(FromMap({
        {"COSMOS_ENDPOINT", "https://localhost:8081/"},
        {"COSMOS_DATABASE", "rfid"}
    }));

    EXPECT_FALSE(config.IsComplete());
    auto missing = config.MissingFields();
    ASSERT_EQ(missing.size(), 2u);
    EXPECT_EQ(missing[0], "COSMOS_KEY");
    EXPECT_EQ(missing[1], "COSMOS_CONTAINER");
}

TEST(StoreConfigTest, EmptyValueCountsAsMissing) {
    auto config = LoadStoreConfig(FromMap({
        {"COSMOS_ENDPOINT", ""},
        {"COSMOS_KEY", "secret"},
        {"COSMOS_DATABASE", "rfid"},
        {"COSMOS_CONTAINER", "readings"}
    }));

    ASSERT_EQ(config.MissingFields().size(), 1u);
    EXPECT_EQ(config.MissingFields()[0], "COSMOS_ENDPOINT");
}

TEST(StoreConfigTest, EmptyEnvironment) {
    auto config = LoadStoreConfig(FromMap({}));
    EXPECT_EQ(config.MissingFields().size(), 4u);
}

TEST(StoreConfigTest, ReadsProcessEnvironment) {
    setenv("COSMOS_ENDPOINT", "https://localhost:8081/", 1);
    setenv("COSMOS_KEY", "key", 1);
    setenv("COSMOS_DATABASE", "db", 1);
    unsetenv("COSMOS_CONTAINER");

    auto config = LoadStoreConfigFromEnvironment();
    EXPECT_EQ(config.endpoint, "https://localhost:8081/");
    EXPECT_EQ(config.databaseName, "db");
    ASSERT_EQ(config.MissingFields().size(), 1u);
    EXPECT_EQ(config.MissingFields()[0], "COSMOS_CONTAINER");

    unsetenv("COSMOS_ENDPOINT");
    unsetenv("COSMOS_KEY");
    unsetenv("COSMOS_DATABASE");
}
