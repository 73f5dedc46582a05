#pragma once

#include <string>
#include <utility>
#include <vector>

#include "bench/scenario.h"
#include "query/plan_builder.h"
#include "query/query_executor.h"

namespace rolodex {
namespace bench {

/// Values read from the store so that filter scenarios hit real data.
struct SampleValues {
    std::string first_name = "John";
    std::string city = "Berlin";
    std::string country = "Germany";
};

/// Builds benchmark scenarios from raw request parameters.
class ScenarioCatalog {
public:
    struct Options {
        int64_t list_page_size = 1000;
        int64_t pagination_page_size = 1000;
        /// RANDOM entries in the pagination scenario
        int random_pages = 10;
        /// 0 keeps the harness default
        int repetitions = 0;
    };

    explicit ScenarioCatalog(const query::QueryPlanBuilder& builder);
    ScenarioCatalog(const query::QueryPlanBuilder& builder, Options options);

    /// Compiles one scenario; fails with the plan builder's status
    std::pair<PlanStatus, BenchmarkScenario> make(std::string name, std::string description,
                                                  schema::EntityKind entity, query::RawParams params,
                                                  std::vector<PageVariant> page_variants = {}) const;

    /// The default suite: list load, name filter, single and multi-field
    /// sorts, filter + sort, multiple filters, search, complex query and the
    /// selected-pages pagination scenario
    std::vector<BenchmarkScenario> defaults(const SampleValues& samples) const;

    /// First user's first name and the city/country of the first user with an
    /// address; keeps the defaults for anything the store cannot provide
    static SampleValues loadSampleValues(const query::QueryPlanBuilder& builder,
                                         const query::QueryExecutor& executor);

    const Options& options() const { return options_; }

private:
    const query::QueryPlanBuilder& builder_;
    Options options_;
};

} // namespace bench
} // namespace rolodex
