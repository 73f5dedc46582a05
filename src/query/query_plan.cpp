#include "query/query_plan.h"
#include "utils/date_time.h"

#include <algorithm>
#include <sstream>

namespace rolodex {
namespace query {

const char* filterOpToString(FilterOp op) {
    switch (op) {
        case FilterOp::EQUALS: return "exact";
        case FilterOp::CONTAINS: return "icontains";
        case FilterOp::GTE: return "gte";
        case FilterOp::LTE: return "lte";
        case FilterOp::GT: return "gt";
        case FilterOp::LT: return "lt";
        case FilterOp::RANGE: return "range";
    }
    return "exact";
}

std::optional<FilterOp> filterOpFromSuffix(std::string_view suffix) {
    if (suffix.empty() || suffix == "exact") return FilterOp::EQUALS;
    if (suffix == "icontains" || suffix == "contains") return FilterOp::CONTAINS;
    if (suffix == "gte") return FilterOp::GTE;
    if (suffix == "lte") return FilterOp::LTE;
    if (suffix == "gt") return FilterOp::GT;
    if (suffix == "lt") return FilterOp::LT;
    if (suffix == "range") return FilterOp::RANGE;
    return std::nullopt;
}

bool isOperatorAllowed(FilterOp op, FieldType type) {
    if (type == FieldType::STRING) {
        return op == FilterOp::EQUALS || op == FilterOp::CONTAINS;
    }
    // INT and DATE are ordered scalars
    return op != FilterOp::CONTAINS;
}

// ============================================================================
// Pagination
// ============================================================================

Pagination Pagination::byPage(int64_t page, int64_t page_size) {
    Pagination p;
    p.mode = Mode::PAGE;
    p.page = page;
    p.page_size = page_size;
    p.offset = (page - 1) * page_size;
    p.limit = page_size;
    return p;
}

Pagination Pagination::byOffset(int64_t offset, int64_t limit) {
    Pagination p;
    p.mode = Mode::OFFSET;
    p.offset = offset;
    p.limit = limit;
    p.page_size = limit;
    p.page = limit > 0 ? offset / limit + 1 : 1;
    return p;
}

int64_t Pagination::startIndex() const {
    return offset;
}

int64_t Pagination::maxRows() const {
    return limit;
}

int64_t Pagination::pageCount(int64_t total_count) const {
    if (total_count <= 0 || page_size <= 0) return 1;
    return (total_count + page_size - 1) / page_size;
}

// ============================================================================
// QueryPlan
// ============================================================================

QueryPlan::QueryPlan(EntityKind entity,
                     std::vector<FilterClause> filters,
                     OrderSpec order,
                     std::optional<SearchSpec> search,
                     std::optional<SearchSpec> name_match,
                     Pagination pagination)
    : entity_(entity)
    , filters_(std::move(filters))
    , order_(std::move(order))
    , search_(std::move(search))
    , name_match_(std::move(name_match))
    , pagination_(pagination) {}

QueryPlan QueryPlan::withPage(int64_t page) const {
    QueryPlan copy(*this);
    copy.pagination_ = Pagination::byPage(std::max<int64_t>(1, page), pagination_.page_size);
    return copy;
}

nlohmann::json fieldValueToJson(const FieldValue& value, FieldType type) {
    if (std::holds_alternative<std::monostate>(value)) {
        return nullptr;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    int64_t v = std::get<int64_t>(value);
    if (type == FieldType::DATE) {
        return utils::DateTime::formatIso(v);
    }
    return v;
}

std::string fieldValueToString(const FieldValue& value, FieldType type) {
    auto j = fieldValueToJson(value, type);
    if (j.is_null()) return "null";
    if (j.is_string()) return j.get<std::string>();
    return j.dump();
}

nlohmann::json QueryPlan::toJson() const {
    nlohmann::json j;
    j["entity"] = schema::entityToString(entity_);

    auto filters = nlohmann::json::array();
    for (const auto& f : filters_) {
        nlohmann::json fj = {
            {"field", f.field},
            {"op", filterOpToString(f.op)},
            {"value", fieldValueToJson(f.value, f.type)}
        };
        if (f.op == FilterOp::RANGE) {
            fj["upper"] = fieldValueToJson(f.upper, f.type);
        }
        filters.push_back(std::move(fj));
    }
    j["filters"] = std::move(filters);

    auto order = nlohmann::json::array();
    for (const auto& t : order_) {
        order.push_back((t.direction == SortDirection::DESC ? "-" : "") + t.field);
    }
    j["ordering"] = std::move(order);

    if (search_) {
        j["search"] = {{"term", search_->term}, {"fields", search_->fields}};
    }
    if (name_match_) {
        j["name"] = {{"term", name_match_->term}, {"fields", name_match_->fields}};
    }

    if (pagination_.mode == Pagination::Mode::PAGE) {
        j["pagination"] = {{"page", pagination_.page}, {"page_size", pagination_.page_size}};
    } else {
        j["pagination"] = {{"offset", pagination_.offset}, {"limit", pagination_.limit}};
    }
    return j;
}

std::string QueryPlan::describe() const {
    std::ostringstream oss;
    oss << schema::entityToString(entity_) << " filters=" << filters_.size();
    if (!order_.empty()) {
        oss << " order=";
        for (size_t i = 0; i < order_.size(); ++i) {
            if (i) oss << ',';
            if (order_[i].direction == SortDirection::DESC) oss << '-';
            oss << order_[i].field;
        }
    }
    if (search_) oss << " search='" << search_->term << "'";
    if (name_match_) oss << " name='" << name_match_->term << "'";
    oss << " offset=" << pagination_.startIndex() << " limit=" << pagination_.maxRows();
    return oss.str();
}

} // namespace query
} // namespace rolodex
