#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

#include "query/plan_builder.h"
#include "query/query_executor.h"
#include "query/query_plan.h"

namespace rolodex {
namespace bench {

/// Which page a pagination run fetches; NONE runs the template as is.
enum class PageVariant { NONE, FIRST, MIDDLE, LAST, RANDOM };

const char* pageVariantToString(PageVariant v);
std::optional<PageVariant> pageVariantFromString(std::string_view name);

struct BenchmarkScenario {
    std::string name;
    std::string description;
    schema::EntityKind entity = schema::EntityKind::APP_USER;
    /// Parameters the template was built from, kept for reports
    query::RawParams params;
    query::QueryPlanPtr plan;
    /// 0 uses the harness default
    int repetitions = 0;
    /// One run per entry and repetition; RANDOM may repeat
    std::vector<PageVariant> page_variants;

    bool hasPageVariants() const { return !page_variants.empty(); }
};

/// One run of one scenario (one page variant of one repetition).
struct BenchmarkResult {
    std::string scenario;
    int run_index = 0;
    query::QueryPlanPtr plan;
    query::ExecutionMetrics metrics;
    PageVariant variant = PageVariant::NONE;
    int64_t page = 0;
    std::string error;
    std::string timestamp;

    query::ExecutionStatus status() const { return metrics.status; }
    bool ok() const { return metrics.status == query::ExecutionStatus::SUCCESS; }

    nlohmann::json toJson() const;
};

} // namespace bench
} // namespace rolodex
