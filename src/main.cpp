#include "bench/benchmark_harness.h"
#include "bench/report_exporter.h"
#include "bench/result_aggregator.h"
#include "bench/scenario_catalog.h"
#include "config/cli_options.h"
#include "config/rolodex_config.h"
#include "query/plan_builder.h"
#include "query/query_executor.h"
#include "schema/schema_registry.h"
#include "storage/memory_row_store.h"
#include "storage/rocksdb_row_store.h"
#include "storage/sample_data.h"
#include "utils/logger.h"

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace rolodex;
using json = nlohmann::json;

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

config::RolodexConfig loadConfig(const std::string& path) {
    if (endsWith(path, ".json")) {
        std::ifstream f(path);
        if (!f.is_open()) {
            ROLODEX_ERROR("Cannot open configuration file {}", path);
            return config::RolodexConfig();
        }
        json j = json::parse(f, nullptr, false);
        if (j.is_discarded()) {
            ROLODEX_ERROR("Malformed JSON in {}", path);
            return config::RolodexConfig();
        }
        return config::RolodexConfig::fromJson(j);
    }
    return config::RolodexConfig::loadFromYaml(path);
}

std::shared_ptr<RowStore> openStore(const config::RolodexConfig& cfg, const schema::SchemaRegistry& registry) {
    if (cfg.storage.backend == "rocksdb") {
        auto store = std::make_shared<RocksDBRowStore>(cfg.storage.toRocksDB(), registry);
        if (!store->open()) {
            ROLODEX_ERROR("Failed to open RocksDB at {}", cfg.storage.db_path);
            return nullptr;
        }
        return store;
    }
    if (cfg.storage.backend != "memory") {
        ROLODEX_ERROR("Unknown storage backend '{}'", cfg.storage.backend);
        return nullptr;
    }
    MemoryRowStore::Config memCfg;
    memCfg.simulated_latency = cfg.storage.simulated_latency;
    return std::make_shared<MemoryRowStore>(registry, memCfg);
}

} // namespace

int main(int argc, char* argv[]) {
    // Console only until the configuration names a log file
    utils::Logger::initConsole(utils::Logger::Level::INFO);

    try {
        auto parsed = config::parseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
        if (!parsed.ok) {
            std::cerr << parsed.error << "\n" << config::cliUsage(argv[0]);
            return 2;
        }
        const auto& options = parsed.options;
        if (options.help) {
            std::cout << config::cliUsage(argv[0]);
            return 0;
        }

        config::RolodexConfig cfg = options.config_path ? loadConfig(*options.config_path) : config::RolodexConfig();
        options.applyTo(cfg);

        utils::Logger::init(cfg.logging.file, utils::Logger::levelFromString(cfg.logging.level));
        ROLODEX_INFO("=== Rolodex list-query benchmark ===");
        ROLODEX_DEBUG("Configuration: {}", cfg.toJson().dump());

        const auto& registry = schema::SchemaRegistry::contacts();
        auto store = openStore(cfg, registry);
        if (!store) {
            return 1;
        }

        if (cfg.storage.sample_rows > 0) {
            SampleDataGenerator generator(cfg.storage.toSampleData());
            auto st = generator.seed(*store);
            if (!st.ok()) {
                ROLODEX_ERROR("Seeding failed: {}", st.message);
                return 1;
            }
        }

        query::QueryPlanBuilder builder(registry, cfg.plan_builder.toBuilder());
        query::QueryExecutor executor(store, cfg.executor.toExecutor());

        auto samples = bench::ScenarioCatalog::loadSampleValues(builder, executor);
        ROLODEX_INFO("Sample values: first_name='{}', city='{}', country='{}'", samples.first_name, samples.city,
                     samples.country);

        bench::ScenarioCatalog catalog(builder, cfg.harness.toCatalog());
        auto scenarios = catalog.defaults(samples);

        bench::BenchmarkHarness harness(executor, cfg.harness.toHarness());
        auto report = bench::ResultAggregator::aggregate(harness.run(scenarios));

        ROLODEX_INFO("================================================================================");
        ROLODEX_INFO("Summary");
        ROLODEX_INFO("================================================================================");
        for (const auto& s : report.summaries()) {
            ROLODEX_INFO("{}: {}/{} succeeded, duration {}", s.scenario, s.successes(), s.runs,
                         s.duration_ms.dump());
        }

        if (cfg.harness.export_results) {
            bench::ReportExporter exporter(cfg.harness.toExporter());
            auto exported = exporter.exportReport(report);
            if (!exported.ok) {
                ROLODEX_ERROR("Export incomplete: {}", json(exported.errors).dump());
                return 1;
            }
        }

        utils::Logger::shutdown();
        return 0;
    } catch (const std::exception& e) {
        ROLODEX_CRITICAL("Fatal error: {}", e.what());
        utils::Logger::shutdown();
        return 1;
    }
}
