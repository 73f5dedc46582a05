#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "storage/row_store.h"

namespace rolodex {

/**
 * Deterministic contacts fixture: users, their (optional) addresses and
 * (optional) loyalty relationships.
 *
 * No generated first or last name contains the marker name, so exactly
 * marker_count users match a case-insensitive search for it.
 */
class SampleDataGenerator {
public:
    struct Config {
        int64_t users = 10000;
        uint32_t seed = 42;
        /// Share of users with an address / a relationship
        double address_ratio = 0.8;
        double relationship_ratio = 0.7;
        std::string marker_first_name = "John";
        /// Users named marker_first_name; spread evenly over the id range
        int64_t marker_count = 37;
        /// created timestamps fall in [base_created, base_created + created_span_seconds)
        int64_t base_created = 1577836800;  // 2020-01-01T00:00:00Z
        int64_t created_span_seconds = 4 * 365 * 24 * 3600;
    };

    struct Dataset {
        std::vector<Record> users;
        std::vector<Record> addresses;
        std::vector<Record> relationships;
    };

    SampleDataGenerator();
    explicit SampleDataGenerator(Config config);

    Dataset generate() const;

    /// Generates and writes all three tables; addresses first
    StoreStatus seed(RowStore& store) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace rolodex
