#include "query/plan_builder.h"
#include "utils/date_time.h"
#include "utils/logger.h"

#include <algorithm>
#include <charconv>
#include <limits>

namespace rolodex {
namespace query {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

std::vector<std::string> splitOn(std::string_view s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        parts.emplace_back(s.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return parts;
}

std::optional<int64_t> parseInt(std::string_view s) {
    s = trim(s);
    if (s.empty()) return std::nullopt;
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

} // namespace

QueryPlanBuilder::QueryPlanBuilder(const schema::SchemaRegistry& registry)
    : registry_(registry) {}

QueryPlanBuilder::QueryPlanBuilder(const schema::SchemaRegistry& registry, Config config)
    : registry_(registry), config_(config) {
    if (config_.max_page_size < 1) config_.max_page_size = 1;
    config_.default_page_size = std::clamp<int64_t>(config_.default_page_size, 1, config_.max_page_size);
}

bool QueryPlanBuilder::isReserved(std::string_view key) {
    return key == ORDERING || key == SEARCH || key == NAME || key == PAGE || key == PAGE_SIZE ||
           key == OFFSET || key == LIMIT || key == CANCEL;
}

std::string QueryPlanBuilder::normalizePath(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '_' && i + 1 < raw.size() && raw[i + 1] == '_') {
            out.push_back('.');
            ++i;
        } else {
            out.push_back(raw[i]);
        }
    }
    return out;
}

std::pair<std::string, std::string> QueryPlanBuilder::splitFilterKey(std::string_view key) {
    std::string path = normalizePath(key);
    auto dot = path.rfind('.');
    if (dot == std::string::npos) {
        return {path, ""};
    }
    std::string last = path.substr(dot + 1);
    if (!last.empty() && filterOpFromSuffix(last)) {
        return {path.substr(0, dot), last};
    }
    return {path, ""};
}

PlanStatus QueryPlanBuilder::coerce(const std::string& field, FieldType type, std::string_view raw,
                                    FieldValue& out) {
    switch (type) {
        case FieldType::STRING:
            out = std::string(raw);
            return PlanStatus::OK();
        case FieldType::INT: {
            auto v = parseInt(raw);
            if (!v) {
                return PlanStatus::Validation(field, "expected an integer, got '" + std::string(raw) + "'");
            }
            out = *v;
            return PlanStatus::OK();
        }
        case FieldType::DATE: {
            auto v = utils::DateTime::parse(trim(raw));
            if (!v) {
                return PlanStatus::Validation(field, "expected an ISO-8601 date, got '" + std::string(raw) + "'");
            }
            out = *v;
            return PlanStatus::OK();
        }
    }
    return PlanStatus::Validation(field, "unsupported field type");
}

PlanStatus QueryPlanBuilder::parseFilter(EntityKind entity, const std::string& key, const std::string& value,
                                         std::vector<FilterClause>& out) const {
    auto [path, suffix] = splitFilterKey(key);
    auto op = filterOpFromSuffix(suffix);

    auto [st, spec] = registry_.lookup(entity, path, schema::Capability::FILTER);
    if (!st.ok()) {
        return st;
    }
    if (!op || !isOperatorAllowed(*op, spec.type)) {
        const std::string opName = op ? filterOpToString(*op) : suffix;
        return PlanStatus::Validation(path, "operator '" + opName + "' is not supported for " +
                                            schema::fieldTypeToString(spec.type) + " field");
    }

    // Empty values are ignored, as the list endpoint always did
    if (trim(value).empty()) {
        return PlanStatus::OK();
    }

    FilterClause clause;
    clause.field = path;
    clause.type = spec.type;
    clause.op = *op;

    if (*op == FilterOp::RANGE) {
        auto bounds = splitOn(value, ',');
        if (bounds.size() != 2) {
            return PlanStatus::Validation(path, "range expects 'low,high', got '" + value + "'");
        }
        auto lst = coerce(path, spec.type, bounds[0], clause.value);
        if (!lst.ok()) return lst;
        auto ust = coerce(path, spec.type, bounds[1], clause.upper);
        if (!ust.ok()) return ust;
        if (std::get<int64_t>(clause.value) > std::get<int64_t>(clause.upper)) {
            return PlanStatus::Validation(path, "range lower bound exceeds upper bound");
        }
    } else {
        auto cst = coerce(path, spec.type, value, clause.value);
        if (!cst.ok()) return cst;
    }

    out.push_back(std::move(clause));
    return PlanStatus::OK();
}

PlanStatus QueryPlanBuilder::parseOrdering(EntityKind entity, const std::vector<std::string>& terms,
                                           OrderSpec& out) const {
    for (const auto& raw : terms) {
        std::string_view term = trim(raw);
        if (term.empty()) continue;

        SortDirection dir = SortDirection::ASC;
        if (term.front() == '-') {
            dir = SortDirection::DESC;
            term.remove_prefix(1);
        }
        std::string path = normalizePath(term);

        auto [st, spec] = registry_.lookup(entity, path, schema::Capability::ORDER);
        if (!st.ok()) {
            return st;
        }
        out.push_back(OrderTerm{path, spec.type, dir});
    }
    return PlanStatus::OK();
}

PlanStatus QueryPlanBuilder::parsePagination(const RawParams& params, Pagination& out) const {
    auto readInt = [&](const char* key, int64_t fallback, int64_t& dest) -> PlanStatus {
        auto it = params.find(key);
        if (it == params.end() || trim(it->second).empty()) {
            dest = fallback;
            return PlanStatus::OK();
        }
        auto v = parseInt(it->second);
        if (!v) {
            return PlanStatus::Validation(key, "expected an integer, got '" + it->second + "'");
        }
        dest = *v;
        return PlanStatus::OK();
    };

    const bool offsetMode = params.count(OFFSET) > 0 || params.count(LIMIT) > 0;
    if (offsetMode) {
        int64_t offset = 0, limit = 0;
        auto st = readInt(OFFSET, 0, offset);
        if (!st.ok()) return st;
        st = readInt(LIMIT, config_.default_page_size, limit);
        if (!st.ok()) return st;
        out = Pagination::byOffset(std::max<int64_t>(0, offset),
                                   std::clamp<int64_t>(limit, 1, config_.max_page_size));
        return PlanStatus::OK();
    }

    int64_t page = 1, pageSize = 0;
    auto st = readInt(PAGE, 1, page);
    if (!st.ok()) return st;
    st = readInt(PAGE_SIZE, config_.default_page_size, pageSize);
    if (!st.ok()) return st;
    // Upper bound keeps (page - 1) * page_size inside int64_t
    const int64_t maxPage = std::numeric_limits<int64_t>::max() / config_.max_page_size;
    out = Pagination::byPage(std::clamp<int64_t>(page, 1, maxPage),
                             std::clamp<int64_t>(pageSize, 1, config_.max_page_size));
    return PlanStatus::OK();
}

std::pair<PlanStatus, QueryPlanPtr> QueryPlanBuilder::build(EntityKind entity, const RawParams& params) const {
    if (!registry_.hasEntity(entity)) {
        return {PlanStatus::UnknownField("entity",
                    std::string("entity not registered: ") + schema::entityToString(entity)), nullptr};
    }

    std::vector<FilterClause> filters;
    for (const auto& [key, value] : params) {
        if (isReserved(key)) continue;
        auto st = parseFilter(entity, key, value, filters);
        if (!st.ok()) {
            ROLODEX_DEBUG("Plan rejected for {}: {}", schema::entityToString(entity), st.toString());
            return {st, nullptr};
        }
    }

    OrderSpec order;
    auto ordIt = params.find(ORDERING);
    std::vector<std::string> orderTerms;
    if (ordIt != params.end() && !trim(ordIt->second).empty()) {
        orderTerms = splitOn(ordIt->second, ',');
    } else {
        orderTerms = registry_.defaultOrdering(entity);
    }
    if (auto st = parseOrdering(entity, orderTerms, order); !st.ok()) {
        ROLODEX_DEBUG("Plan rejected for {}: {}", schema::entityToString(entity), st.toString());
        return {st, nullptr};
    }

    std::optional<SearchSpec> search;
    auto searchIt = params.find(SEARCH);
    if (searchIt != params.end() && !trim(searchIt->second).empty()) {
        SearchSpec spec;
        spec.term = std::string(trim(searchIt->second));
        for (const auto& f : registry_.fieldsWith(entity, schema::Capability::SEARCH)) {
            spec.fields.push_back(f.path);
        }
        search = std::move(spec);
    }

    std::optional<SearchSpec> nameMatch;
    auto nameIt = params.find(NAME);
    if (nameIt != params.end() && !trim(nameIt->second).empty()) {
        const auto& nameFields = registry_.nameFields(entity);
        if (nameFields.empty()) {
            return {PlanStatus::UnknownField(NAME, std::string("name matching is not available on ") +
                                                   schema::entityToString(entity)), nullptr};
        }
        nameMatch = SearchSpec{std::string(trim(nameIt->second)), nameFields};
    }

    Pagination pagination;
    if (auto st = parsePagination(params, pagination); !st.ok()) {
        return {st, nullptr};
    }

    auto plan = std::make_shared<const QueryPlan>(entity, std::move(filters), std::move(order),
                                                  std::move(search), std::move(nameMatch), pagination);
    ROLODEX_TRACE("Built plan: {}", plan->describe());
    return {PlanStatus::OK(), plan};
}

} // namespace query
} // namespace rolodex
