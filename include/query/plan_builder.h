#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "query/plan_status.h"
#include "query/query_plan.h"
#include "schema/schema_registry.h"

namespace rolodex {
namespace query {

/// Raw request parameters. Ordered so that fail-fast errors are deterministic.
using RawParams = std::map<std::string, std::string>;

/**
 * Compiles raw request parameters into a validated QueryPlan.
 *
 * Example (entity = appuser):
 *   first_name__icontains=John
 *   relationship__points__gte=1000
 *   ordering=-relationship.points,last_name
 *   search=Berlin
 *   page=2&page_size=50
 *
 * compiles to
 *   QueryPlan {
 *     filters: [first_name icontains "John", relationship.points gte 1000],
 *     order:   [relationship.points DESC, last_name ASC],
 *     search:  {"Berlin" in first_name, last_name, customer_id, ...},
 *     pagination: page 2, page_size 50
 *   }
 *
 * The first invalid parameter aborts the build; no partial plan is returned.
 */
class QueryPlanBuilder {
public:
    struct Config {
        int64_t max_page_size = 1000;
        int64_t default_page_size = 50;
    };

    // Reserved parameter names; every other key is treated as a filter
    static constexpr const char* ORDERING = "ordering";
    static constexpr const char* SEARCH = "search";
    static constexpr const char* NAME = "name";
    static constexpr const char* PAGE = "page";
    static constexpr const char* PAGE_SIZE = "page_size";
    static constexpr const char* OFFSET = "offset";
    static constexpr const char* LIMIT = "limit";
    static constexpr const char* CANCEL = "_cancel";

    explicit QueryPlanBuilder(const schema::SchemaRegistry& registry);
    QueryPlanBuilder(const schema::SchemaRegistry& registry, Config config);

    std::pair<PlanStatus, QueryPlanPtr> build(EntityKind entity, const RawParams& params) const;

    static bool isReserved(std::string_view key);

    /// "relationship__points__gte" -> ("relationship.points", "gte").
    /// The suffix is empty when the last segment is not an operator name.
    static std::pair<std::string, std::string> splitFilterKey(std::string_view key);

    /// "relationship__points" and "relationship.points" both -> "relationship.points"
    static std::string normalizePath(std::string_view raw);

    const Config& config() const { return config_; }
    const schema::SchemaRegistry& registry() const { return registry_; }

private:
    PlanStatus parseFilter(EntityKind entity, const std::string& key, const std::string& value,
                           std::vector<FilterClause>& out) const;
    PlanStatus parseOrdering(EntityKind entity, const std::vector<std::string>& terms,
                             OrderSpec& out) const;
    PlanStatus parsePagination(const RawParams& params, Pagination& out) const;

    static PlanStatus coerce(const std::string& field, FieldType type, std::string_view raw,
                             FieldValue& out);

    const schema::SchemaRegistry& registry_;
    Config config_;
};

} // namespace query
} // namespace rolodex
