#include "utils/UuidGenerator.hpp"

#include <gtest/gtest.h>
#include <set>
#include <string>

using reading_service::utils::UuidGenerator;

TEST(UuidGeneratorTest, GeneratesCanonicalVersion4) {
    std::string uuid = UuidGenerator::Generate();

    ASSERT_EQ(uuid.size(), UuidGenerator::UUID_LENGTH);
    EXPECT_EQ(uuid[8], '-');
    EXPECT_EQ(uuid[13], '-');
    EXPECT_EQ(uuid[18], '-');
    EXPECT_EQ(uuid[23], '-');
    EXPECT_EQ(uuid[14], '4');

    const std::string variants = "89ab";
    EXPECT_NE(variants.find(uuid[19]), std::string::npos);
    EXPECT_TRUE(UuidGenerator::IsValid(uuid));
}

TEST(UuidGeneratorTest, LowercaseHex) {
    std::string uuid = UuidGenerator::Generate();
    for (char c : uuid) {
        if (c == '-') continue;
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << uuid;
    }
}

TEST(UuidGeneratorTest, UniqueValues) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(UuidGenerator::Generate());
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(UuidGeneratorTest, IsValidRejectsMalformedValues) {
    EXPECT_FALSE(UuidGenerator::IsValid(""));
    EXPECT_FALSE(UuidGenerator::IsValid("not-a-uuid"));
    EXPECT_FALSE(UuidGenerator::IsValid("123e4567e89b12d3a456426614174000"));
    EXPECT_FALSE(UuidGenerator::IsValid("123e4567-e89b-12d3-a456-42661417400g"));
    EXPECT_FALSE(UuidGenerator::IsValid("123e4567-e89b-12d3-a456_426614174000"));
    EXPECT_TRUE(UuidGenerator::IsValid("123e4567-e89b-12d3-a456-426614174000"));
}
