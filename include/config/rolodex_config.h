#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

#include "bench/benchmark_harness.h"
#include "bench/report_exporter.h"
#include "bench/scenario_catalog.h"
#include "query/plan_builder.h"
#include "query/query_executor.h"
#include "storage/rocksdb_wrapper.h"
#include "storage/sample_data.h"

namespace rolodex {
namespace config {

using json = nlohmann::json;

/**
 * @brief Settings for the benchmark CLI and its components
 *
 * Every section converts to the component's own Config struct, so that
 * components stay usable without this file.
 */
struct RolodexConfig {
    struct StorageConfig {
        std::string backend = "memory";                 // "memory" | "rocksdb"
        std::string db_path = "./data/rolodex";
        int64_t sample_rows = 10000;                    // 0 = do not seed
        uint32_t seed = 42;
        std::chrono::milliseconds simulated_latency{0}; // memory backend only
        size_t block_cache_size_mb = 256;
        std::string compression = "none";

        RocksDBWrapper::Config toRocksDB() const;
        SampleDataGenerator::Config toSampleData() const;
    } storage;

    struct PlanBuilderConfig {
        int64_t max_page_size = 1000;
        int64_t default_page_size = 50;

        query::QueryPlanBuilder::Config toBuilder() const;
    } plan_builder;

    struct ExecutorConfig {
        std::chrono::milliseconds query_timeout{30000};
        std::chrono::milliseconds poll_interval{5};
        bool enable_cancellation = true;
        bool enable_statement_timeout = true;

        query::QueryExecutor::Config toExecutor() const;
    } executor;

    struct HarnessConfig {
        int repetitions = 1;
        std::chrono::milliseconds run_deadline{30000};
        int random_pages = 10;
        int64_t list_page_size = 1000;
        int64_t pagination_page_size = 1000;
        uint32_t seed = 42;
        std::string output_dir = "benchmark_results";
        bool export_results = true;
        bool export_charts = true;

        bench::BenchmarkHarness::Config toHarness() const;
        bench::ScenarioCatalog::Options toCatalog() const;
        bench::ReportExporter::Config toExporter() const;
    } harness;

    struct LoggingConfig {
        std::string file = "rolodex.log";
        std::string level = "info";
    } logging;

    /**
     * @brief Load configuration from a YAML file
     *
     * Missing keys keep their defaults. An unreadable or malformed file is
     * logged and yields the default configuration.
     */
    static RolodexConfig loadFromYaml(const std::string& yaml_path);

    /// Same layout as the YAML file
    static RolodexConfig fromJson(const json& j);

    json toJson() const;
};

} // namespace config
} // namespace rolodex
