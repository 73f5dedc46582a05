#include "config/rolodex_config.h"
#include "utils/logger.h"

#include <yaml-cpp/yaml.h>

namespace rolodex {
namespace config {

RocksDBWrapper::Config RolodexConfig::StorageConfig::toRocksDB() const {
    RocksDBWrapper::Config c;
    c.db_path = db_path;
    c.block_cache_size_mb = block_cache_size_mb;
    c.compression = compression;
    return c;
}

SampleDataGenerator::Config RolodexConfig::StorageConfig::toSampleData() const {
    SampleDataGenerator::Config c;
    c.users = sample_rows;
    c.seed = seed;
    return c;
}

query::QueryPlanBuilder::Config RolodexConfig::PlanBuilderConfig::toBuilder() const {
    query::QueryPlanBuilder::Config c;
    c.max_page_size = max_page_size;
    c.default_page_size = default_page_size;
    return c;
}

query::QueryExecutor::Config RolodexConfig::ExecutorConfig::toExecutor() const {
    query::QueryExecutor::Config c;
    c.query_timeout = query_timeout;
    c.poll_interval = poll_interval;
    c.enable_cancellation = enable_cancellation;
    c.enable_statement_timeout = enable_statement_timeout;
    return c;
}

bench::BenchmarkHarness::Config RolodexConfig::HarnessConfig::toHarness() const {
    bench::BenchmarkHarness::Config c;
    c.repetitions = repetitions;
    c.run_deadline = run_deadline;
    c.seed = seed;
    return c;
}

bench::ScenarioCatalog::Options RolodexConfig::HarnessConfig::toCatalog() const {
    bench::ScenarioCatalog::Options o;
    o.list_page_size = list_page_size;
    o.pagination_page_size = pagination_page_size;
    o.random_pages = random_pages;
    return o;
}

bench::ReportExporter::Config RolodexConfig::HarnessConfig::toExporter() const {
    bench::ReportExporter::Config c;
    c.output_dir = output_dir;
    c.export_charts = export_charts;
    return c;
}

RolodexConfig RolodexConfig::loadFromYaml(const std::string& yaml_path) {
    try {
        YAML::Node root = YAML::LoadFile(yaml_path);
        RolodexConfig result;

        if (auto storage = root["storage"]) {
            result.storage.backend = storage["backend"].as<std::string>("memory");
            result.storage.db_path = storage["db_path"].as<std::string>("./data/rolodex");
            result.storage.sample_rows = storage["sample_rows"].as<int64_t>(10000);
            result.storage.seed = storage["seed"].as<uint32_t>(42);
            result.storage.simulated_latency = std::chrono::milliseconds(
                storage["simulated_latency_ms"].as<int64_t>(0)
            );
            result.storage.block_cache_size_mb = storage["block_cache_size_mb"].as<size_t>(256);
            result.storage.compression = storage["compression"].as<std::string>("none");
        }

        if (auto builder = root["plan_builder"]) {
            result.plan_builder.max_page_size = builder["max_page_size"].as<int64_t>(1000);
            result.plan_builder.default_page_size = builder["default_page_size"].as<int64_t>(50);
        }

        if (auto executor = root["executor"]) {
            result.executor.query_timeout = std::chrono::milliseconds(
                executor["query_timeout_ms"].as<int64_t>(30000)
            );
            result.executor.poll_interval = std::chrono::milliseconds(
                executor["poll_interval_ms"].as<int64_t>(5)
            );
            result.executor.enable_cancellation = executor["enable_cancellation"].as<bool>(true);
            result.executor.enable_statement_timeout = executor["enable_statement_timeout"].as<bool>(true);
        }

        if (auto harness = root["harness"]) {
            result.harness.repetitions = harness["repetitions"].as<int>(1);
            result.harness.run_deadline = std::chrono::milliseconds(
                harness["run_deadline_ms"].as<int64_t>(30000)
            );
            result.harness.random_pages = harness["random_pages"].as<int>(10);
            result.harness.list_page_size = harness["list_page_size"].as<int64_t>(1000);
            result.harness.pagination_page_size = harness["pagination_page_size"].as<int64_t>(1000);
            result.harness.seed = harness["seed"].as<uint32_t>(42);
            result.harness.output_dir = harness["output_dir"].as<std::string>("benchmark_results");
            result.harness.export_results = harness["export"].as<bool>(true);
            result.harness.export_charts = harness["charts"].as<bool>(true);
        }

        if (auto logging = root["logging"]) {
            result.logging.file = logging["file"].as<std::string>("rolodex.log");
            result.logging.level = logging["level"].as<std::string>("info");
        }

        ROLODEX_INFO("Loaded configuration from {}", yaml_path);
        return result;
    } catch (const std::exception& e) {
        ROLODEX_ERROR("Failed to load configuration from {}: {}", yaml_path, e.what());
        return RolodexConfig();
    }
}

RolodexConfig RolodexConfig::fromJson(const json& j) {
    RolodexConfig result;

    try {
        if (j.contains("storage")) {
            const auto& storage = j["storage"];
            result.storage.backend = storage.value("backend", "memory");
            result.storage.db_path = storage.value("db_path", "./data/rolodex");
            result.storage.sample_rows = storage.value("sample_rows", int64_t{10000});
            result.storage.seed = storage.value("seed", uint32_t{42});
            result.storage.simulated_latency = std::chrono::milliseconds(
                storage.value("simulated_latency_ms", int64_t{0})
            );
            result.storage.block_cache_size_mb = storage.value("block_cache_size_mb", size_t{256});
            result.storage.compression = storage.value("compression", "none");
        }

        if (j.contains("plan_builder")) {
            const auto& builder = j["plan_builder"];
            result.plan_builder.max_page_size = builder.value("max_page_size", int64_t{1000});
            result.plan_builder.default_page_size = builder.value("default_page_size", int64_t{50});
        }

        if (j.contains("executor")) {
            const auto& executor = j["executor"];
            result.executor.query_timeout = std::chrono::milliseconds(
                executor.value("query_timeout_ms", int64_t{30000})
            );
            result.executor.poll_interval = std::chrono::milliseconds(
                executor.value("poll_interval_ms", int64_t{5})
            );
            result.executor.enable_cancellation = executor.value("enable_cancellation", true);
            result.executor.enable_statement_timeout = executor.value("enable_statement_timeout", true);
        }

        if (j.contains("harness")) {
            const auto& harness = j["harness"];
            result.harness.repetitions = harness.value("repetitions", 1);
            result.harness.run_deadline = std::chrono::milliseconds(
                harness.value("run_deadline_ms", int64_t{30000})
            );
            result.harness.random_pages = harness.value("random_pages", 10);
            result.harness.list_page_size = harness.value("list_page_size", int64_t{1000});
            result.harness.pagination_page_size = harness.value("pagination_page_size", int64_t{1000});
            result.harness.seed = harness.value("seed", uint32_t{42});
            result.harness.output_dir = harness.value("output_dir", "benchmark_results");
            result.harness.export_results = harness.value("export", true);
            result.harness.export_charts = harness.value("charts", true);
        }

        if (j.contains("logging")) {
            const auto& logging = j["logging"];
            result.logging.file = logging.value("file", "rolodex.log");
            result.logging.level = logging.value("level", "info");
        }
    } catch (const std::exception& e) {
        ROLODEX_ERROR("Failed to parse configuration from JSON: {}", e.what());
        return RolodexConfig();
    }

    return result;
}

json RolodexConfig::toJson() const {
    json j;

    j["storage"]["backend"] = storage.backend;
    j["storage"]["db_path"] = storage.db_path;
    j["storage"]["sample_rows"] = storage.sample_rows;
    j["storage"]["seed"] = storage.seed;
    j["storage"]["simulated_latency_ms"] = storage.simulated_latency.count();
    j["storage"]["block_cache_size_mb"] = storage.block_cache_size_mb;
    j["storage"]["compression"] = storage.compression;

    j["plan_builder"]["max_page_size"] = plan_builder.max_page_size;
    j["plan_builder"]["default_page_size"] = plan_builder.default_page_size;

    j["executor"]["query_timeout_ms"] = executor.query_timeout.count();
    j["executor"]["poll_interval_ms"] = executor.poll_interval.count();
    j["executor"]["enable_cancellation"] = executor.enable_cancellation;
    j["executor"]["enable_statement_timeout"] = executor.enable_statement_timeout;

    j["harness"]["repetitions"] = harness.repetitions;
    j["harness"]["run_deadline_ms"] = harness.run_deadline.count();
    j["harness"]["random_pages"] = harness.random_pages;
    j["harness"]["list_page_size"] = harness.list_page_size;
    j["harness"]["pagination_page_size"] = harness.pagination_page_size;
    j["harness"]["seed"] = harness.seed;
    j["harness"]["output_dir"] = harness.output_dir;
    j["harness"]["export"] = harness.export_results;
    j["harness"]["charts"] = harness.export_charts;

    j["logging"]["file"] = logging.file;
    j["logging"]["level"] = logging.level;

    return j;
}

} // namespace config
} // namespace rolodex
