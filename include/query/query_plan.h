#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

#include "schema/schema_registry.h"

namespace rolodex {
namespace query {

using schema::EntityKind;
using schema::FieldType;
using schema::FieldValue;

enum class FilterOp { EQUALS, CONTAINS, GTE, LTE, GT, LT, RANGE };

/// Parameter suffix for the operator ("exact", "icontains", "gte", ...)
const char* filterOpToString(FilterOp op);
/// "" and "exact" map to EQUALS; nullopt for an unknown suffix
std::optional<FilterOp> filterOpFromSuffix(std::string_view suffix);
bool isOperatorAllowed(FilterOp op, FieldType type);

struct FilterClause {
    std::string field;                  // FieldPath, e.g. "relationship.points"
    FieldType type = FieldType::STRING;
    FilterOp op = FilterOp::EQUALS;
    FieldValue value;                   // RANGE: inclusive lower bound
    FieldValue upper;                   // RANGE only: inclusive upper bound

    bool operator==(const FilterClause& other) const = default;
};

enum class SortDirection { ASC, DESC };

struct OrderTerm {
    std::string field;
    FieldType type = FieldType::STRING;
    SortDirection direction = SortDirection::ASC;

    bool operator==(const OrderTerm& other) const = default;
};

/// Later terms break ties of earlier ones.
using OrderSpec = std::vector<OrderTerm>;

/// Case-insensitive substring match of term in ANY of fields.
struct SearchSpec {
    std::string term;
    std::vector<std::string> fields;

    bool empty() const { return term.empty(); }
    bool operator==(const SearchSpec& other) const = default;
};

struct Pagination {
    enum class Mode { PAGE, OFFSET };

    Mode mode = Mode::PAGE;
    int64_t page = 1;
    int64_t page_size = 50;
    int64_t offset = 0;
    int64_t limit = 50;

    static Pagination byPage(int64_t page, int64_t page_size);
    static Pagination byOffset(int64_t offset, int64_t limit);

    /// Index of the first row on this page
    int64_t startIndex() const;
    /// Maximum number of rows on this page
    int64_t maxRows() const;
    /// Number of pages for total_count rows (at least 1)
    int64_t pageCount(int64_t total_count) const;

    bool operator==(const Pagination& other) const = default;
};

/**
 * Validated, immutable description of one query.
 *
 * Created by QueryPlanBuilder. withPage() derives a new plan for pagination
 * variants; the original is never modified.
 */
class QueryPlan {
public:
    QueryPlan(EntityKind entity,
              std::vector<FilterClause> filters,
              OrderSpec order,
              std::optional<SearchSpec> search,
              std::optional<SearchSpec> name_match,
              Pagination pagination);

    EntityKind entity() const { return entity_; }
    const std::vector<FilterClause>& filters() const { return filters_; }
    const OrderSpec& order() const { return order_; }
    const std::optional<SearchSpec>& search() const { return search_; }
    const std::optional<SearchSpec>& nameMatch() const { return name_match_; }
    const Pagination& pagination() const { return pagination_; }

    QueryPlan withPage(int64_t page) const;

    nlohmann::json toJson() const;
    std::string describe() const;

    bool operator==(const QueryPlan& other) const = default;

private:
    EntityKind entity_;
    std::vector<FilterClause> filters_;
    OrderSpec order_;
    std::optional<SearchSpec> search_;
    std::optional<SearchSpec> name_match_;
    Pagination pagination_;
};

using QueryPlanPtr = std::shared_ptr<const QueryPlan>;

/// Renders a value for JSON output; DATE values become ISO-8601 strings.
nlohmann::json fieldValueToJson(const FieldValue& value, FieldType type);
std::string fieldValueToString(const FieldValue& value, FieldType type);

} // namespace query
} // namespace rolodex
