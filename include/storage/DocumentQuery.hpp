#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace reading_service {
namespace storage {

// SELECT [TOP n] * FROM c [ORDER BY c.<field> ASC|DESC]
struct DocumentQuery {
    size_t top = 0;  // 0 means no limit
    std::string orderBy;
    bool descending = false;
    bool enableCrossPartition = false;

    std::string ToSql() const;

    // Evaluates the query over documents gathered from one or more partitions:
    // drops documents without an orderable field, sorts stably, applies TOP.
    std::vector<nlohmann::json> Apply(std::vector<nlohmann::json> documents) const;

    // Newest documents first by a sortable field, scanning every partition.
    static DocumentQuery Latest(const std::string& field, size_t count = 1);

    // Orders two values of an ORDER BY field: null < boolean < number < string.
    static int CompareValues(const nlohmann::json& lhs, const nlohmann::json& rhs);
};

} // namespace storage
} // namespace reading_service
