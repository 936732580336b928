#include "storage/DocumentQuery.hpp"
#include <algorithm>

namespace reading_service {
namespace storage {

namespace {
    int TypeRank(const nlohmann::json& value) {
        if (value.is_null()) return 0;
        if (value.is_boolean()) return 1;
        if (value.is_number()) return 2;
        if (value.is_string()) return 3;
        return 4;
    }

    bool IsOrderable(const nlohmann::json& document, const std::string& field) {
        if (field.empty()) {
            return true;
        }
        if (!document.is_object()) {
            return false;
        }
        auto it = document.find(field);
        return it != document.end() && TypeRank(*it) < 4;
    }
}

std::string DocumentQuery::ToSql() const {
    std::string sql = "SELECT ";
    if (top > 0) {
        sql += "TOP " + std::to_string(top) + " ";
    }
    sql += "* FROM c";
    if (!orderBy.empty()) {
        sql += " ORDER BY c." + orderBy + (descending ? " DESC" : " ASC");
    }
    return sql;
}

std::vector<nlohmann::json> DocumentQuery::Apply(std::vector<nlohmann::json> documents) const {
    const std::string& field = orderBy;

    documents.erase(std::remove_if(documents.begin(), documents.end(),
        [&field](const nlohmann::json& document) { return !IsOrderable(document, field); }),
        documents.end());

    if (!field.empty()) {
        const bool desc = descending;
        std::stable_sort(documents.begin(), documents.end(),
            [&field, desc](const nlohmann::json& lhs, const nlohmann::json& rhs) {
                int cmp = CompareValues(lhs.at(field), rhs.at(field));
                return desc ? cmp > 0 : cmp < 0;
            });
    }

    if (top > 0 && documents.size() > top) {
        documents.resize(top);
    }

    return documents;
}

DocumentQuery DocumentQuery::Latest(const std::string& field, size_t count) {
    DocumentQuery query;
    query.top = count;
    query.orderBy = field;
    query.descending = true;
    query.enableCrossPartition = true;
    return query;
}

int DocumentQuery::CompareValues(const nlohmann::json& lhs, const nlohmann::json& rhs) {
    int lhsRank = TypeRank(lhs);
    int rhsRank = TypeRank(rhs);
    if (lhsRank != rhsRank) {
        return lhsRank < rhsRank ? -1 : 1;
    }

    if (lhs.is_boolean()) {
        bool a = lhs.get<bool>();
        bool b = rhs.get<bool>();
        return a == b ? 0 : (a ? 1 : -1);
    }

    if (lhs.is_number()) {
        double a = lhs.get<double>();
        double b = rhs.get<double>();
        return a == b ? 0 : (a < b ? -1 : 1);
    }

    if (lhs.is_string()) {
        int cmp = lhs.get_ref<const std::string&>().compare(rhs.get_ref<const std::string&>());
        return cmp == 0 ? 0 : (cmp < 0 ? -1 : 1);
    }

    return 0;
}

} // namespace storage
} // namespace reading_service
