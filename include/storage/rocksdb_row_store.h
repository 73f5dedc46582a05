#pragma once

#include <memory>
#include <optional>
#include <string>

#include "schema/schema_registry.h"
#include "storage/rocksdb_wrapper.h"
#include "storage/row_store.h"

namespace rolodex {

/**
 * Row store persisted in RocksDB.
 *
 * Layout (see KeySchema):
 *   appuser:00000000000000000042                       -> {"id":42,"first_name":...}
 *   idx:customer_relationship:appuser_id:<value>:<pk>  -> ""
 *
 * Every non-key INT column gets an index entry so reverse relations resolve
 * with a prefix seek. Queries scan the base table in id order and evaluate the
 * plan with PlanEvaluator, checking the statement guard while scanning.
 */
class RocksDBRowStore : public RowStore {
public:
    RocksDBRowStore(const RocksDBWrapper::Config& config,
                    const schema::SchemaRegistry& registry = schema::SchemaRegistry::contacts());
    ~RocksDBRowStore() override;

    RocksDBRowStore(const RocksDBRowStore&) = delete;
    RocksDBRowStore& operator=(const RocksDBRowStore&) = delete;

    /// Must be called before any query; not safe to race with queries
    bool open();
    void close();
    bool isOpen() const;

    std::pair<StoreStatus, StoreResult> execute(const StoreRequest& request) override;
    std::pair<StoreStatus, StoreResult> count(const StoreRequest& request) override;
    StoreStatus putRecord(EntityKind entity, const Record& record) override;
    StoreStatus putRecords(EntityKind entity, const std::vector<Record>& records) override;
    std::string name() const override { return "rocksdb"; }

    std::optional<Record> findRecord(EntityKind entity, int64_t id) const;

private:
    StoreStatus scan(const StoreRequest& request, StatementGuard& guard, bool count_only,
                     std::vector<Row>& rows, int64_t& matched) const;
    std::optional<Record> resolve(const schema::RelationSpec& rel, int64_t key) const;

    /// Adds the record and its index entries to the batch, replacing any previous version
    void stage(RocksDBWrapper::WriteBatchWrapper& batch, const schema::EntitySchema& schema,
               const Record& record) const;

    const schema::SchemaRegistry& registry_;
    std::unique_ptr<RocksDBWrapper> db_;
};

} // namespace rolodex
