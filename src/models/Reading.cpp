#include "models/Reading.hpp"
#include "utils/UuidGenerator.hpp"

namespace reading_service {
namespace models {

namespace {
    std::string ReplaceAll(std::string value, char from, char to) {
        for (auto& c : value) {
            if (c == from) {
                c = to;
            }
        }
        return value;
    }
}

std::string Reading::SanitizeUid(const std::string& uid) {
    std::string clean = ReplaceAll(uid, '/', '_');
    clean = ReplaceAll(std::move(clean), '\\', '_');
    clean = ReplaceAll(std::move(clean), '#', '_');
    return ReplaceAll(std::move(clean), '?', '_');
}

std::string Reading::SanitizeTimestamp(const std::string& timestamp) {
    std::string clean = ReplaceAll(timestamp, ' ', '_');
    clean = ReplaceAll(std::move(clean), ':', '-');
    return ReplaceAll(std::move(clean), '.', '_');
}

std::string Reading::ComposeId(const std::string& uid, const std::string& timestamp,
                               const std::string& suffix) {
    return SanitizeUid(uid) + "-" + SanitizeTimestamp(timestamp) + "-" + suffix;
}

core::Result<std::string, std::string> Reading::AssignId(nlohmann::json& document) {
    using IdResult = core::Result<std::string, std::string>;

    if (!document.is_object()) {
        return IdResult::Err("reading must be a JSON object");
    }

    if (document.contains(UID_FIELD) && document.contains(TIMESTAMP_FIELD)) {
        const auto& uid = document[UID_FIELD];
        const auto& timestamp = document[TIMESTAMP_FIELD];
        if (!uid.is_string() || !timestamp.is_string()) {
            return IdResult::Err("\"uid\" and \"timestamp\" must be strings");
        }

        std::string suffix = utils::UuidGenerator::Generate().substr(0, ID_SUFFIX_LENGTH);
        std::string id = ComposeId(uid.get<std::string>(), timestamp.get<std::string>(), suffix);
        document[ID_FIELD] = id;
        return IdResult::Ok(std::move(id));
    }

    if (document.contains(ID_FIELD)) {
        const auto& existing = document[ID_FIELD];
        return IdResult::Ok(existing.is_string() ? existing.get<std::string>() : existing.dump());
    }

    std::string id = utils::UuidGenerator::Generate();
    document[ID_FIELD] = id;
    return IdResult::Ok(std::move(id));
}

} // namespace models
} // namespace reading_service
