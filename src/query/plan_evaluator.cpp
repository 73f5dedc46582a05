#include "query/plan_evaluator.h"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace rolodex {
namespace query {

namespace {

std::string toLowerAscii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isNull(const FieldValue& v) {
    return std::holds_alternative<std::monostate>(v);
}

} // namespace

PlanEvaluator::PlanEvaluator(const QueryPlan& plan)
    : plan_(plan) {
    if (plan_.search() && !plan_.search()->empty()) {
        search_lower_ = toLowerAscii(plan_.search()->term);
    }
    if (plan_.nameMatch() && !plan_.nameMatch()->empty()) {
        name_lower_ = toLowerAscii(plan_.nameMatch()->term);
    }
}

bool PlanEvaluator::containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    if (needle.size() > haystack.size()) return false;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
    return it != haystack.end();
}

int PlanEvaluator::compareValues(const FieldValue& a, const FieldValue& b) {
    const bool an = isNull(a), bn = isNull(b);
    if (an || bn) {
        return an == bn ? 0 : (an ? 1 : -1);
    }
    if (a.index() != b.index()) {
        return a.index() < b.index() ? -1 : 1;
    }
    if (const auto* ai = std::get_if<int64_t>(&a)) {
        int64_t bi = std::get<int64_t>(b);
        return *ai < bi ? -1 : (*ai > bi ? 1 : 0);
    }
    int c = std::get<std::string>(a).compare(std::get<std::string>(b));
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

bool PlanEvaluator::matchesClause(const FilterClause& clause, const Row& row) const {
    const FieldValue& v = row.get(clause.field);
    if (isNull(v)) return false;

    switch (clause.op) {
        case FilterOp::EQUALS:
            return compareValues(v, clause.value) == 0;
        case FilterOp::CONTAINS: {
            const auto* s = std::get_if<std::string>(&v);
            const auto* needle = std::get_if<std::string>(&clause.value);
            return s && needle && containsIgnoreCase(*s, *needle);
        }
        case FilterOp::GTE: return compareValues(v, clause.value) >= 0;
        case FilterOp::LTE: return compareValues(v, clause.value) <= 0;
        case FilterOp::GT: return compareValues(v, clause.value) > 0;
        case FilterOp::LT: return compareValues(v, clause.value) < 0;
        case FilterOp::RANGE:
            return compareValues(v, clause.value) >= 0 && compareValues(v, clause.upper) <= 0;
    }
    return false;
}

bool PlanEvaluator::matchesAny(const SearchSpec& spec, const std::string& lowered, const Row& row) {
    for (const auto& field : spec.fields) {
        const auto* s = std::get_if<std::string>(&row.get(field));
        if (s && containsIgnoreCase(*s, lowered)) {
            return true;
        }
    }
    return false;
}

bool PlanEvaluator::matches(const Row& row) const {
    for (const auto& clause : plan_.filters()) {
        if (!matchesClause(clause, row)) return false;
    }
    if (!search_lower_.empty() && !matchesAny(*plan_.search(), search_lower_, row)) {
        return false;
    }
    if (!name_lower_.empty() && !matchesAny(*plan_.nameMatch(), name_lower_, row)) {
        return false;
    }
    return true;
}

bool PlanEvaluator::less(const Row& a, const Row& b) const {
    for (const auto& term : plan_.order()) {
        int c = compareValues(a.get(term.field), b.get(term.field));
        if (c != 0) {
            return term.direction == SortDirection::ASC ? c < 0 : c > 0;
        }
    }
    return a.id < b.id;
}

std::vector<Row> PlanEvaluator::selectPage(std::vector<Row> matched) const {
    const auto& page = plan_.pagination();
    const int64_t total = static_cast<int64_t>(matched.size());
    const int64_t start = page.startIndex();
    if (start >= total) {
        return {};
    }
    const int64_t end = std::min(total, start + page.maxRows());

    auto cmp = [this](const Row& a, const Row& b) { return less(a, b); };
    if (end < total) {
        std::partial_sort(matched.begin(), matched.begin() + end, matched.end(), cmp);
    } else {
        std::sort(matched.begin(), matched.end(), cmp);
    }

    return std::vector<Row>(std::make_move_iterator(matched.begin() + start),
                            std::make_move_iterator(matched.begin() + end));
}

} // namespace query
} // namespace rolodex
