#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "query/plan_builder.h"
#include "query/query_executor.h"

namespace rolodex {
namespace query {

/// Transport-neutral response: an HTTP-style status code and a JSON body.
struct ServiceResponse {
    int status_code = 200;
    nlohmann::json body;
    ExecutionMetrics metrics;
};

/**
 * Request boundary of the contacts API (list and stats), without HTTP.
 *
 * Each call creates its own CancellationToken with the executor's query
 * timeout. A non-empty "_cancel" parameter answers 499 before the parameters
 * are validated or the store is touched.
 *
 *   200  success
 *   400  unknown field or invalid value
 *   499  cancelled (client closed request)
 *   504  timed out
 *   500  store failure
 */
class ContactQueryService {
public:
    static constexpr int HTTP_OK = 200;
    static constexpr int HTTP_BAD_REQUEST = 400;
    static constexpr int HTTP_CLIENT_CLOSED_REQUEST = 499;
    static constexpr int HTTP_INTERNAL_ERROR = 500;
    static constexpr int HTTP_GATEWAY_TIMEOUT = 504;

    ContactQueryService(const QueryPlanBuilder& builder, const QueryExecutor& executor,
                        std::string base_path = "/api/contacts/");

    /// Paginated list: {count, page, page_size, next, previous, results}
    ServiceResponse list(EntityKind entity, const RawParams& params) const;

    /// {total_contacts, contacts_with_address, contacts_with_relationship}
    ServiceResponse stats(const RawParams& params) const;

    /// Maps a non-success execution onto its status code and error body
    static ServiceResponse errorResponse(const ExecutionResult& result);

    /// base_path?k=v&... with the keys in order and values percent-encoded
    std::string buildLink(const RawParams& params) const;

private:
    static bool cancelRequested(const RawParams& params);

    const QueryPlanBuilder& builder_;
    const QueryExecutor& executor_;
    std::string base_path_;
};

} // namespace query
} // namespace rolodex
