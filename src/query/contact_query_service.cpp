#include "query/contact_query_service.h"
#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace rolodex {
namespace query {

namespace {

std::string percentEncode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == ',') {
            out.push_back(static_cast<char>(c));
        } else {
            out += fmt::format("%{:02X}", c);
        }
    }
    return out;
}

ExecutionResult cancelledResult() {
    ExecutionResult result;
    result.status = ExecutionStatus::CANCELLED;
    result.metrics.status = ExecutionStatus::CANCELLED;
    result.error = "cancelled before dispatch";
    return result;
}

ServiceResponse badRequest(const PlanStatus& st) {
    ServiceResponse r;
    r.status_code = ContactQueryService::HTTP_BAD_REQUEST;
    r.body = {
        {"detail", st.message},
        {"field", st.field},
        {"code", PlanStatus::codeToString(st.code)}
    };
    return r;
}

} // namespace

ContactQueryService::ContactQueryService(const QueryPlanBuilder& builder, const QueryExecutor& executor,
                                         std::string base_path)
    : builder_(builder), executor_(executor), base_path_(std::move(base_path)) {}

bool ContactQueryService::cancelRequested(const RawParams& params) {
    auto it = params.find(QueryPlanBuilder::CANCEL);
    return it != params.end() && !it->second.empty();
}

std::string ContactQueryService::buildLink(const RawParams& params) const {
    std::string link = base_path_;
    char sep = '?';
    for (const auto& [key, value] : params) {
        link += sep;
        link += percentEncode(key);
        link += '=';
        link += percentEncode(value);
        sep = '&';
    }
    return link;
}

ServiceResponse ContactQueryService::errorResponse(const ExecutionResult& result) {
    ServiceResponse r;
    r.metrics = result.metrics;
    switch (result.status) {
        case ExecutionStatus::CANCELLED:
            r.status_code = HTTP_CLIENT_CLOSED_REQUEST;
            r.body = {{"detail", "Client closed request"}};
            break;
        case ExecutionStatus::TIMED_OUT:
            r.status_code = HTTP_GATEWAY_TIMEOUT;
            r.body = {{"detail", "Query timed out"}};
            break;
        default:
            r.status_code = HTTP_INTERNAL_ERROR;
            r.body = {{"detail", result.error.empty() ? "Query failed" : result.error}};
            break;
    }
    return r;
}

ServiceResponse ContactQueryService::list(EntityKind entity, const RawParams& params) const {
    // The client is gone; nothing else about the request matters
    if (cancelRequested(params)) {
        ROLODEX_INFO("Cancel requested for {} list", schema::entityToString(entity));
        return errorResponse(cancelledResult());
    }

    CancellationToken token(executor_.config().query_timeout);
    auto [st, plan] = builder_.build(entity, params);
    if (!st.ok()) {
        return badRequest(st);
    }

    ExecutionResult result = executor_.execute(plan, token, true);
    if (!result.ok()) {
        return errorResponse(result);
    }

    const auto& page = plan->pagination();
    const int64_t total = std::max<int64_t>(0, result.total_count);

    RawParams linkParams = params;
    linkParams.erase(QueryPlanBuilder::CANCEL);

    nlohmann::json next = nullptr;
    nlohmann::json previous = nullptr;
    if (page.mode == Pagination::Mode::PAGE) {
        if (page.page < page.pageCount(total)) {
            linkParams[QueryPlanBuilder::PAGE] = std::to_string(page.page + 1);
            next = buildLink(linkParams);
        }
        if (page.page > 1) {
            linkParams[QueryPlanBuilder::PAGE] = std::to_string(page.page - 1);
            previous = buildLink(linkParams);
        }
    } else {
        if (page.offset + page.limit < total) {
            linkParams[QueryPlanBuilder::OFFSET] = std::to_string(page.offset + page.limit);
            next = buildLink(linkParams);
        }
        if (page.offset > 0) {
            linkParams[QueryPlanBuilder::OFFSET] = std::to_string(std::max<int64_t>(0, page.offset - page.limit));
            previous = buildLink(linkParams);
        }
    }

    auto results = nlohmann::json::array();
    const auto& registry = builder_.registry();
    for (const auto& row : result.rows) {
        results.push_back(row.toJson(registry, entity));
    }

    ServiceResponse r;
    r.status_code = HTTP_OK;
    r.metrics = result.metrics;
    r.body = {
        {"count", total},
        {"page", page.page},
        {"page_size", page.page_size},
        {"next", next},
        {"previous", previous},
        {"results", std::move(results)}
    };
    return r;
}

ServiceResponse ContactQueryService::stats(const RawParams& params) const {
    if (cancelRequested(params)) {
        ROLODEX_INFO("Cancel requested for stats");
        return errorResponse(cancelledResult());
    }

    CancellationToken token(executor_.config().query_timeout);

    // Primary keys are positive, so "id >= 0" on a relation means "relation exists"
    const std::pair<const char*, RawParams> queries[] = {
        {"total_contacts", {}},
        {"contacts_with_address", {{"address__id__gte", "0"}}},
        {"contacts_with_relationship", {{"relationship__id__gte", "0"}}},
    };

    ServiceResponse r;
    r.body = nlohmann::json::object();
    for (const auto& [name, queryParams] : queries) {
        auto [st, plan] = builder_.build(EntityKind::APP_USER, queryParams);
        if (!st.ok()) {
            return badRequest(st);
        }
        ExecutionResult result = executor_.count(plan, token);
        if (!result.ok()) {
            return errorResponse(result);
        }
        r.body[name] = result.total_count;
        r.metrics.duration_ms += result.metrics.duration_ms;
        r.metrics.statement_count += result.metrics.statement_count;
    }
    r.metrics.status = ExecutionStatus::SUCCESS;
    r.status_code = HTTP_OK;
    return r;
}

} // namespace query
} // namespace rolodex
