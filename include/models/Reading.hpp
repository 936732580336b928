#pragma once

#include "core/Result.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace reading_service {
namespace models {

// A sensor reading is an open JSON object; these helpers own the rules for its
// well-known fields. Every other field is passed through untouched.
class Reading {
public:
    static constexpr const char* ID_FIELD = "id";
    static constexpr const char* UID_FIELD = "uid";
    static constexpr const char* TIMESTAMP_FIELD = "timestamp";

    // Number of UUID characters appended to a uid/timestamp id.
    static constexpr size_t ID_SUFFIX_LENGTH = 8;

    // '/', '\', '#', '?' become '_'.
    static std::string SanitizeUid(const std::string& uid);

    // ' ' and '.' become '_', ':' becomes '-'.
    static std::string SanitizeTimestamp(const std::string& timestamp);

    static std::string ComposeId(const std::string& uid, const std::string& timestamp,
                                 const std::string& suffix);

    /**
     * Ensures the document carries an "id":
     *  - uid and timestamp present: "{uid}-{timestamp}-{8 hex}" from the sanitized values;
     *  - otherwise an existing id is kept as is;
     *  - otherwise a fresh UUID is assigned.
     * Returns the id (as text) or an error when uid/timestamp are not strings.
     */
    static core::Result<std::string, std::string> AssignId(nlohmann::json& document);
};

} // namespace models
} // namespace reading_service
