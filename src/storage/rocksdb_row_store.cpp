#include "storage/rocksdb_row_store.h"
#include "query/plan_evaluator.h"
#include "storage/key_schema.h"
#include "storage/row_assembler.h"
#include "utils/logger.h"

namespace rolodex {

RocksDBRowStore::RocksDBRowStore(const RocksDBWrapper::Config& config,
                                 const schema::SchemaRegistry& registry)
    : registry_(registry)
    , db_(std::make_unique<RocksDBWrapper>(config)) {}

RocksDBRowStore::~RocksDBRowStore() {
    close();
}

bool RocksDBRowStore::open() {
    return db_->open();
}

void RocksDBRowStore::close() {
    db_->close();
}

bool RocksDBRowStore::isOpen() const {
    return db_->isOpen();
}

std::optional<Record> RocksDBRowStore::findRecord(EntityKind entity, int64_t id) const {
    const auto& schema = registry_.entity(entity);
    auto raw = db_->get(KeySchema::makeRelationalKey(schema.table, id));
    if (!raw) return std::nullopt;

    auto j = nlohmann::json::parse(*raw, nullptr, false);
    if (j.is_discarded()) {
        ROLODEX_WARN("Corrupt record {}:{}", schema.table, id);
        return std::nullopt;
    }
    return Record::fromJson(schema, j);
}

std::optional<Record> RocksDBRowStore::resolve(const schema::RelationSpec& rel, int64_t key) const {
    if (rel.target_field == "id") {
        return findRecord(rel.target, key);
    }

    const auto& target = registry_.entity(rel.target);
    std::optional<int64_t> id;
    db_->scanPrefix(KeySchema::makeSecondaryIndexPrefix(target.table, rel.target_field, KeySchema::formatId(key)),
                    [&](std::string_view k, std::string_view) {
                        id = KeySchema::parseId(KeySchema::extractPrimaryKey(k));
                        return false;
                    });
    if (!id) return std::nullopt;
    return findRecord(rel.target, *id);
}

StoreStatus RocksDBRowStore::scan(const StoreRequest& request, StatementGuard& guard, bool count_only,
                                  std::vector<Row>& rows, int64_t& matched) const {
    if (!request.plan) {
        return StoreStatus::Error("store request without a plan");
    }
    if (!db_->isOpen()) {
        return StoreStatus::Error("database is not open");
    }
    const EntityKind entity = request.plan->entity();
    if (!registry_.hasEntity(entity)) {
        return StoreStatus::Error(std::string("relation does not exist: ") + schema::entityToString(entity));
    }

    const auto& schema = registry_.entity(entity);
    RowAssembler assembler(registry_, entity);
    query::PlanEvaluator evaluator(*request.plan);
    auto resolver = [this](const schema::RelationSpec& rel, int64_t key) { return resolve(rel, key); };

    StoreStatus status = StoreStatus::OK();
    matched = 0;
    db_->scanPrefix(KeySchema::makeTablePrefix(schema.table), [&](std::string_view key, std::string_view value) {
        status = guard.tick();
        if (!status.ok()) return false;

        auto j = nlohmann::json::parse(value, nullptr, false);
        if (j.is_discarded()) {
            status = StoreStatus::Error("corrupt record at key " + std::string(key));
            return false;
        }
        Row row = assembler.assemble(Record::fromJson(schema, j), resolver);
        if (evaluator.matches(row)) {
            ++matched;
            if (!count_only) rows.push_back(std::move(row));
        }
        return true;
    });
    return status;
}

std::pair<StoreStatus, StoreResult> RocksDBRowStore::execute(const StoreRequest& request) {
    StatementGuard guard(request);
    if (auto st = guard.check(); !st.ok()) {
        return {st, {}};
    }
    std::vector<Row> rows;
    int64_t matched = 0;
    if (auto st = scan(request, guard, false, rows, matched); !st.ok()) {
        return {st, {}};
    }

    query::PlanEvaluator evaluator(*request.plan);
    StoreResult result;
    result.rows = evaluator.selectPage(std::move(rows));
    result.total_count = request.include_total ? matched : -1;
    result.statement_count = request.include_total ? 2 : 1;

    if (auto st = guard.check(); !st.ok()) {
        return {st, {}};
    }
    return {StoreStatus::OK(), std::move(result)};
}

std::pair<StoreStatus, StoreResult> RocksDBRowStore::count(const StoreRequest& request) {
    StatementGuard guard(request);
    if (auto st = guard.check(); !st.ok()) {
        return {st, {}};
    }
    std::vector<Row> unused;
    int64_t matched = 0;
    if (auto st = scan(request, guard, true, unused, matched); !st.ok()) {
        return {st, {}};
    }
    StoreResult result;
    result.total_count = matched;
    result.statement_count = 1;
    return {StoreStatus::OK(), std::move(result)};
}

void RocksDBRowStore::stage(RocksDBWrapper::WriteBatchWrapper& batch, const schema::EntitySchema& schema,
                            const Record& record) const {
    const std::string pk = KeySchema::formatId(record.id);

    auto indexKeys = [&](const Record& r) {
        std::vector<std::string> keys;
        for (const auto& col : schema.columns) {
            if (col.type != schema::FieldType::INT || col.name == "id") continue;
            FieldValue v = r.get(col.name);
            if (const auto* i = std::get_if<int64_t>(&v)) {
                keys.push_back(KeySchema::makeSecondaryIndexKey(schema.table, col.name, KeySchema::formatId(*i), pk));
            }
        }
        return keys;
    };

    if (auto previous = findRecord(schema.kind, record.id)) {
        for (const auto& key : indexKeys(*previous)) {
            batch.del(key);
        }
    }
    batch.put(KeySchema::makeRelationalKey(schema.table, pk), record.toJson(schema).dump());
    for (const auto& key : indexKeys(record)) {
        batch.put(key, "");
    }
}

StoreStatus RocksDBRowStore::putRecord(EntityKind entity, const Record& record) {
    return putRecords(entity, {record});
}

StoreStatus RocksDBRowStore::putRecords(EntityKind entity, const std::vector<Record>& records) {
    if (!registry_.hasEntity(entity)) {
        return StoreStatus::Error(std::string("relation does not exist: ") + schema::entityToString(entity));
    }
    if (!db_->isOpen()) {
        return StoreStatus::Error("database is not open");
    }
    const auto& schema = registry_.entity(entity);

    auto batch = db_->createWriteBatch();
    for (const auto& record : records) {
        stage(*batch, schema, record);
    }
    if (!batch->commit()) {
        return StoreStatus::Error("write batch commit failed for " + schema.table);
    }
    ROLODEX_DEBUG("Wrote {} record(s) to {}", records.size(), schema.table);
    return StoreStatus::OK();
}

} // namespace rolodex
