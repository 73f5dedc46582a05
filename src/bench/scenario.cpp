#include "bench/scenario.h"

namespace rolodex {
namespace bench {

const char* pageVariantToString(PageVariant v) {
    switch (v) {
        case PageVariant::NONE: return "none";
        case PageVariant::FIRST: return "first";
        case PageVariant::MIDDLE: return "middle";
        case PageVariant::LAST: return "last";
        case PageVariant::RANDOM: return "random";
    }
    return "none";
}

std::optional<PageVariant> pageVariantFromString(std::string_view name) {
    if (name == "none") return PageVariant::NONE;
    if (name == "first") return PageVariant::FIRST;
    if (name == "middle") return PageVariant::MIDDLE;
    if (name == "last") return PageVariant::LAST;
    if (name == "random") return PageVariant::RANDOM;
    return std::nullopt;
}

nlohmann::json BenchmarkResult::toJson() const {
    nlohmann::json j = {
        {"scenario", scenario},
        {"run_index", run_index},
        {"status", query::executionStatusToString(metrics.status)},
        {"duration_ms", metrics.duration_ms},
        {"query_count", metrics.statement_count},
        {"result_count", metrics.row_count},
        {"total_count", metrics.total_count},
        {"timestamp", timestamp}
    };
    if (variant != PageVariant::NONE) {
        j["variant"] = pageVariantToString(variant);
        j["page"] = page;
    }
    if (!error.empty()) {
        j["error"] = error;
    }
    if (plan) {
        j["plan"] = plan->toJson();
    }
    return j;
}

} // namespace bench
} // namespace rolodex
