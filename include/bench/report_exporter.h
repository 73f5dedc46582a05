#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "bench/result_aggregator.h"

namespace rolodex {
namespace bench {

/// Files written by one export; errors are collected, never thrown.
struct ExportResult {
    bool ok = true;
    std::vector<std::string> files;
    std::vector<std::string> errors;

    nlohmann::json toJson() const;
};

/**
 * Writes a BenchmarkReport to disk:
 *   benchmark_results_<ts>.json      {generated_at, runs[], summaries[]}
 *   benchmark_results_<ts>.csv       scenario,run_index,status,duration_ms,query_count,result_count
 *   pagination_report_<scenario>_<ts>.json   per paginated scenario
 *   chart_series_<ts>.json           numeric series only (export_charts)
 * where <ts> is YYYYmmdd_HHMMSS.
 */
class ReportExporter {
public:
    struct Config {
        std::string output_dir = "benchmark_results";
        bool export_charts = true;
        bool pretty_print = true;
    };

    ReportExporter();
    explicit ReportExporter(Config config);

    ExportResult exportReport(const BenchmarkReport& report) const;
    /// Fixed timestamp for reproducible file names
    ExportResult exportReport(const BenchmarkReport& report, std::chrono::system_clock::time_point when) const;

    static std::string toCsv(const BenchmarkReport& report);
    /// Quotes a CSV field when it contains a separator, quote or newline
    static std::string csvEscape(const std::string& field);

    const Config& config() const { return config_; }

private:
    bool writeFile(const std::string& name, const std::string& content, ExportResult& result) const;
    std::string dump(const nlohmann::json& j) const;

    Config config_;
};

} // namespace bench
} // namespace rolodex
