#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "query/query_plan.h"
#include "storage/row_store.h"

namespace rolodex {
namespace query {

/**
 * Applies a QueryPlan to joined rows the way a relational store would:
 *
 *   WHERE   all filter clauses AND search (any field) AND name (any name field)
 *   ORDER BY plan terms, then id ASC
 *   LIMIT / OFFSET from the plan's pagination
 *
 * NULL never satisfies a filter or a search. In ordering NULL sorts after every
 * value ascending and before every value descending. String comparison is
 * bytewise; contains and search are ASCII case-insensitive.
 */
class PlanEvaluator {
public:
    explicit PlanEvaluator(const QueryPlan& plan);

    bool matches(const Row& row) const;

    /// Strict weak ordering by the plan's OrderSpec with id as final tie-breaker
    bool less(const Row& a, const Row& b) const;

    /// Orders the matched rows and returns the requested page
    std::vector<Row> selectPage(std::vector<Row> matched) const;

    static bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

    /// Three-way comparison; NULL compares greater than any value
    static int compareValues(const FieldValue& a, const FieldValue& b);

private:
    bool matchesClause(const FilterClause& clause, const Row& row) const;
    static bool matchesAny(const SearchSpec& spec, const std::string& lowered, const Row& row);

    const QueryPlan& plan_;
    std::string search_lower_;
    std::string name_lower_;
};

} // namespace query
} // namespace rolodex
