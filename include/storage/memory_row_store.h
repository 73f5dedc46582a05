#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "schema/schema_registry.h"
#include "storage/row_store.h"

namespace rolodex {

/**
 * In-process row store.
 *
 * Tables are ordered maps keyed by id. Every INT column other than the
 * primary key is indexed so reverse relations (relationship via appuser_id)
 * resolve without a scan. Reads take a shared lock, writes an exclusive one.
 */
class MemoryRowStore : public RowStore {
public:
    struct Config {
        /// Artificial per-statement latency, used to exercise timeouts
        std::chrono::milliseconds simulated_latency{0};
        /// Rows scanned between statement timeout / abort checks
        uint32_t check_interval = 256;
    };

    explicit MemoryRowStore(const schema::SchemaRegistry& registry = schema::SchemaRegistry::contacts());
    MemoryRowStore(const schema::SchemaRegistry& registry, Config config);

    std::pair<StoreStatus, StoreResult> execute(const StoreRequest& request) override;
    std::pair<StoreStatus, StoreResult> count(const StoreRequest& request) override;
    StoreStatus putRecord(EntityKind entity, const Record& record) override;
    std::string name() const override { return "memory"; }

    size_t size(EntityKind entity) const;
    std::optional<Record> findRecord(EntityKind entity, int64_t id) const;

private:
    using Table = std::map<int64_t, Record>;
    // column -> value -> id
    using ColumnIndex = std::unordered_map<std::string, std::unordered_map<int64_t, int64_t>>;

    /// Scans the plan's entity; collects matching rows unless count_only
    StoreStatus scan(const StoreRequest& request, StatementGuard& guard, bool count_only,
                     std::vector<Row>& rows, int64_t& matched) const;
    StoreStatus simulateLatency(const StatementGuard& guard) const;
    /// Caller holds mutex_
    std::optional<Record> resolveLocked(const schema::RelationSpec& rel, int64_t key) const;

    const schema::SchemaRegistry& registry_;
    Config config_;

    mutable std::shared_mutex mutex_;
    std::map<EntityKind, Table> tables_;
    std::map<EntityKind, ColumnIndex> indexes_;
};

} // namespace rolodex
