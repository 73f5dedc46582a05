#include "bench/scenario_catalog.h"
#include "utils/logger.h"

#include <algorithm>
#include <optional>

namespace rolodex {
namespace bench {

ScenarioCatalog::ScenarioCatalog(const query::QueryPlanBuilder& builder)
    : ScenarioCatalog(builder, Options{}) {}

ScenarioCatalog::ScenarioCatalog(const query::QueryPlanBuilder& builder, Options options)
    : builder_(builder), options_(options) {}

std::pair<PlanStatus, BenchmarkScenario> ScenarioCatalog::make(std::string name, std::string description,
                                                               schema::EntityKind entity, query::RawParams params,
                                                               std::vector<PageVariant> page_variants) const {
    auto [st, plan] = builder_.build(entity, params);
    if (!st.ok()) {
        return {st, BenchmarkScenario{}};
    }
    BenchmarkScenario s;
    s.name = std::move(name);
    s.description = std::move(description);
    s.entity = entity;
    s.params = std::move(params);
    s.plan = std::move(plan);
    s.repetitions = options_.repetitions;
    s.page_variants = std::move(page_variants);
    return {PlanStatus::OK(), std::move(s)};
}

std::vector<BenchmarkScenario> ScenarioCatalog::defaults(const SampleValues& samples) const {
    using schema::EntityKind;
    const std::string listSize = std::to_string(options_.list_page_size);

    std::vector<PageVariant> pages = {PageVariant::FIRST, PageVariant::MIDDLE, PageVariant::LAST};
    pages.insert(pages.end(), static_cast<size_t>(std::max(0, options_.random_pages)), PageVariant::RANDOM);

    struct Entry {
        const char* name;
        std::string description;
        query::RawParams params;
        std::vector<PageVariant> variants;
    };
    std::vector<Entry> entries = {
        {"initial_list", "Initial List Load (page_size=" + listSize + ")",
         {{"page_size", listSize}}, {}},
        {"filter_by_name", "Filter by Name (name='" + samples.first_name + "')",
         {{"first_name__icontains", samples.first_name}}, {}},
        {"sort_created_desc", "Sort by Attribute (ordering='-created')",
         {{"ordering", "-created"}}, {}},
        {"sort_relationship_points", "Sort by Attribute (ordering='relationship__points')",
         {{"ordering", "relationship__points"}}, {}},
        {"sort_address_city", "Sort by Attribute (ordering='address__city')",
         {{"ordering", "address__city"}}, {}},
        {"multi_sort_points_name", "Multi-Field Sort (ordering='-relationship__points,last_name,first_name')",
         {{"ordering", "-relationship__points,last_name,first_name"}}, {}},
        {"multi_sort_country_city_created", "Multi-Field Sort (ordering='address__country,address__city,-created')",
         {{"ordering", "address__country,address__city,-created"}}, {}},
        {"filter_and_sort_city", "Filter + Sort (filter: city=" + samples.city + ", order: -relationship__points)",
         {{"address__city__icontains", samples.city}, {"ordering", "-relationship__points"}}, {}},
        {"multiple_filters", "Multiple Filters (gender + points + country)",
         {{"gender", "M"}, {"relationship__points__gte", "5000"}, {"address__country__icontains", samples.country}}, {}},
        {"search", "Search (search='" + samples.first_name + "')",
         {{"search", samples.first_name}}, {}},
        {"complex_query", "Complex Query (multiple filters)",
         {{"gender", "M"}, {"relationship__points__gte", "1000"},
          {"address__country__icontains", samples.country}, {"ordering", "-relationship__last_activity"}}, {}},
        {"pagination_selected_pages",
         "Pagination - Selected Pages (page_size=" + std::to_string(options_.pagination_page_size) + ")",
         {{"page_size", std::to_string(options_.pagination_page_size)}}, pages},
    };

    std::vector<BenchmarkScenario> scenarios;
    scenarios.reserve(entries.size());
    for (auto& e : entries) {
        auto [st, scenario] = make(e.name, std::move(e.description), EntityKind::APP_USER, std::move(e.params),
                                   std::move(e.variants));
        if (!st.ok()) {
            ROLODEX_ERROR("Scenario '{}' rejected: {}", e.name, st.toString());
            continue;
        }
        scenarios.push_back(std::move(scenario));
    }
    return scenarios;
}

SampleValues ScenarioCatalog::loadSampleValues(const query::QueryPlanBuilder& builder,
                                               const query::QueryExecutor& executor) {
    SampleValues samples;

    auto first = [&](const query::RawParams& params) -> std::optional<Row> {
        auto [st, plan] = builder.build(schema::EntityKind::APP_USER, params);
        if (!st.ok()) return std::nullopt;
        query::CancellationToken token(executor.config().query_timeout);
        auto result = executor.execute(plan, token, false);
        if (!result.ok() || result.rows.empty()) return std::nullopt;
        return std::move(result.rows.front());
    };

    if (auto user = first({{"ordering", "id"}, {"page_size", "1"}})) {
        if (const auto* name = std::get_if<std::string>(&user->get("first_name"))) {
            samples.first_name = *name;
        }
    } else {
        ROLODEX_WARN("No sample user found; using '{}'", samples.first_name);
    }

    if (auto user = first({{"address__id__gte", "0"}, {"ordering", "id"}, {"page_size", "1"}})) {
        if (const auto* city = std::get_if<std::string>(&user->get("address.city"))) {
            samples.city = *city;
        }
        if (const auto* country = std::get_if<std::string>(&user->get("address.country"))) {
            samples.country = *country;
        }
    } else {
        ROLODEX_WARN("No sample address found; using '{}'", samples.city);
    }
    return samples;
}

} // namespace bench
} // namespace rolodex
