#include "config/cli_options.h"

#include <charconv>
#include <system_error>
#include <fmt/format.h>

namespace rolodex {
namespace config {

namespace {

// Whole argument must be a number
template<typename T>
std::optional<T> parseNumber(const std::string& text) {
    T value{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (first == last || ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

template<typename T>
void takeNumber(const std::string& flag, const std::string& value, std::optional<T>& out, CliParseResult& result) {
    out = parseNumber<T>(value);
    if (!out) {
        result.ok = false;
        result.error = fmt::format("Invalid number for {}: '{}'", flag, value);
    }
}

} // namespace

void CliOptions::applyTo(RolodexConfig& cfg) const {
    if (backend) cfg.storage.backend = *backend;
    if (db_path) cfg.storage.db_path = *db_path;
    if (rows) cfg.storage.sample_rows = *rows;
    if (repetitions) cfg.harness.repetitions = *repetitions;
    if (timeout_ms) {
        cfg.executor.query_timeout = std::chrono::milliseconds(*timeout_ms);
        cfg.harness.run_deadline = std::chrono::milliseconds(*timeout_ms);
    }
    if (output_dir) cfg.harness.output_dir = *output_dir;
    if (no_export) cfg.harness.export_results = false;
    if (no_charts) cfg.harness.export_charts = false;
}

CliParseResult parseCommandLine(const std::vector<std::string>& args) {
    CliParseResult result;
    auto& o = result.options;

    for (size_t i = 0; i < args.size() && result.ok; ++i) {
        const std::string& arg = args[i];
        const bool hasValue = i + 1 < args.size();

        if (arg == "--help" || arg == "-h") {
            o.help = true;
        } else if (arg == "--no-export") {
            o.no_export = true;
        } else if (arg == "--no-charts") {
            o.no_charts = true;
        } else if (!hasValue) {
            result.ok = false;
            result.error = "Unknown or incomplete option: " + arg;
        } else if (arg == "--config") {
            o.config_path = args[++i];
        } else if (arg == "--backend") {
            o.backend = args[++i];
        } else if (arg == "--db") {
            o.db_path = args[++i];
        } else if (arg == "--output") {
            o.output_dir = args[++i];
        } else if (arg == "--rows") {
            takeNumber(arg, args[++i], o.rows, result);
        } else if (arg == "--repetitions") {
            takeNumber(arg, args[++i], o.repetitions, result);
        } else if (arg == "--timeout-ms") {
            takeNumber(arg, args[++i], o.timeout_ms, result);
        } else {
            result.ok = false;
            result.error = "Unknown or incomplete option: " + arg;
        }
    }
    return result;
}

std::string cliUsage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "Options:\n"
           "  --config FILE     Load configuration from a YAML or JSON file\n"
           "  --backend NAME    Storage backend: memory | rocksdb (default: memory)\n"
           "  --db PATH         RocksDB path (default: ./data/rolodex)\n"
           "  --rows N          Sample users to seed; 0 keeps existing data (default: 10000)\n"
           "  --repetitions N   Runs per scenario (default: 1)\n"
           "  --timeout-ms N    Query timeout and per-run deadline in ms; 0 disables (default: 30000)\n"
           "  --output DIR      Directory for exported results (default: benchmark_results)\n"
           "  --no-export       Do not write result files\n"
           "  --no-charts       Do not write chart series\n"
           "  --help, -h        Show this help message\n";
}

} // namespace config
} // namespace rolodex
