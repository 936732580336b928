#pragma once

#include <string>

namespace reading_service {
namespace utils {

// Random (version 4) UUIDs in canonical form: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx,
// lowercase hex, y in {8, 9, a, b}.
class UuidGenerator {
public:
    static std::string Generate();

    static bool IsValid(const std::string& value);

    static constexpr size_t UUID_LENGTH = 36;
};

} // namespace utils
} // namespace reading_service
