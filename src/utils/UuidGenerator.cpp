#include "utils/UuidGenerator.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <random>

namespace reading_service {
namespace utils {

namespace {
    std::mt19937_64& Engine() {
        thread_local std::mt19937_64 engine = []() {
            std::random_device rd;
            std::seed_seq seed{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
            return std::mt19937_64(seed);
        }();
        return engine;
    }

    bool IsDashPosition(size_t i) {
        return i == 8 || i == 13 || i == 18 || i == 23;
    }
}

std::string UuidGenerator::Generate() {
    static constexpr char HEX[] = "0123456789abcdef";

    std::array<uint8_t, 16> bytes{};
    auto& engine = Engine();
    uint64_t high = engine();
    uint64_t low = engine();
    for (size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(high >> (i * 8));
        bytes[i + 8] = static_cast<uint8_t>(low >> (i * 8));
    }

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string result;
    result.reserve(UUID_LENGTH);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            result += '-';
        }
        result += HEX[bytes[i] >> 4];
        result += HEX[bytes[i] & 0x0F];
    }

    return result;
}

bool UuidGenerator::IsValid(const std::string& value) {
    if (value.size() != UUID_LENGTH) {
        return false;
    }

    for (size_t i = 0; i < value.size(); ++i) {
        if (IsDashPosition(i)) {
            if (value[i] != '-') {
                return false;
            }
        } else if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }

    return true;
}

} // namespace utils
} // namespace reading_service
