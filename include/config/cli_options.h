#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "config/rolodex_config.h"

namespace rolodex {
namespace config {

/**
 * rolodex_bench command line. Every flag is optional and overrides the value
 * loaded from --config.
 */
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> backend;
    std::optional<std::string> db_path;
    std::optional<int64_t> rows;
    std::optional<int> repetitions;
    std::optional<int64_t> timeout_ms;   // query timeout and run deadline
    std::optional<std::string> output_dir;
    bool no_export = false;
    bool no_charts = false;
    bool help = false;

    void applyTo(RolodexConfig& cfg) const;
};

struct CliParseResult {
    bool ok = true;
    std::string error;
    CliOptions options;
};

/// args excludes the program name. Parsing stops at the first bad argument.
CliParseResult parseCommandLine(const std::vector<std::string>& args);

std::string cliUsage(const std::string& program);

} // namespace config
} // namespace rolodex
