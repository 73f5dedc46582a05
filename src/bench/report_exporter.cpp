#include "bench/report_exporter.h"
#include "utils/date_time.h"
#include "utils/logger.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace rolodex {
namespace bench {

namespace {

// Scenario names end up in file names
std::string sanitizeFileComponent(const std::string& name) {
    std::string out = name;
    for (auto& c : out) {
        bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
                    c == '-';
        if (!keep) c = '_';
    }
    return out.empty() ? std::string("scenario") : out;
}

} // namespace

nlohmann::json ExportResult::toJson() const {
    return {{"ok", ok}, {"files", files}, {"errors", errors}};
}

ReportExporter::ReportExporter() : ReportExporter(Config{}) {}

ReportExporter::ReportExporter(Config config) : config_(std::move(config)) {}

ExportResult ReportExporter::exportReport(const BenchmarkReport& report) const {
    return exportReport(report, std::chrono::system_clock::now());
}

ExportResult ReportExporter::exportReport(const BenchmarkReport& report,
                                          std::chrono::system_clock::time_point when) const {
    ExportResult result;

    std::error_code ec;
    fs::create_directories(config_.output_dir, ec);
    if (ec) {
        result.ok = false;
        result.errors.push_back(fmt::format("Failed to create output directory {}: {}", config_.output_dir,
                                            ec.message()));
        ROLODEX_ERROR("{}", result.errors.back());
        return result;
    }

    const std::string ts = utils::DateTime::formatCompact(when);

    writeFile(fmt::format("benchmark_results_{}.json", ts), dump(report.toJson()), result);
    writeFile(fmt::format("benchmark_results_{}.csv", ts), toCsv(report), result);

    for (const auto& p : report.paginationSummaries()) {
        writeFile(fmt::format("pagination_report_{}_{}.json", sanitizeFileComponent(p.scenario), ts),
                  dump(p.toJson()), result);
    }

    if (config_.export_charts) {
        writeFile(fmt::format("chart_series_{}.json", ts), dump(report.chartSeries()), result);
    }

    if (result.ok) {
        ROLODEX_INFO("Exported {} file(s) to {}", result.files.size(), config_.output_dir);
    }
    return result;
}

std::string ReportExporter::toCsv(const BenchmarkReport& report) {
    std::ostringstream out;
    out << "scenario,run_index,status,duration_ms,query_count,result_count\n";
    for (const auto& r : report.results()) {
        out << csvEscape(r.scenario) << ','
            << r.run_index << ','
            << query::executionStatusToString(r.status()) << ','
            << fmt::format("{:.3f}", r.metrics.duration_ms) << ','
            << r.metrics.statement_count << ','
            << r.metrics.row_count << '\n';
    }
    return out.str();
}

std::string ReportExporter::csvEscape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

bool ReportExporter::writeFile(const std::string& name, const std::string& content, ExportResult& result) const {
    const std::string path = (fs::path(config_.output_dir) / name).string();
    std::ofstream output(path, std::ios::out | std::ios::trunc);
    if (!output.is_open()) {
        result.ok = false;
        result.errors.push_back("Failed to open output file: " + path);
        ROLODEX_ERROR("{}", result.errors.back());
        return false;
    }
    output << content;
    output.close();
    if (!output) {
        result.ok = false;
        result.errors.push_back("Failed to write output file: " + path);
        ROLODEX_ERROR("{}", result.errors.back());
        return false;
    }
    result.files.push_back(path);
    ROLODEX_DEBUG("Wrote {}", path);
    return true;
}

std::string ReportExporter::dump(const nlohmann::json& j) const {
    return config_.pretty_print ? j.dump(2) : j.dump();
}

} // namespace bench
} // namespace rolodex
