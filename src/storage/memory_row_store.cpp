#include "storage/memory_row_store.h"
#include "query/plan_evaluator.h"
#include "storage/row_assembler.h"
#include "utils/logger.h"

#include <algorithm>
#include <mutex>
#include <thread>

namespace rolodex {

MemoryRowStore::MemoryRowStore(const schema::SchemaRegistry& registry)
    : MemoryRowStore(registry, Config{}) {}

MemoryRowStore::MemoryRowStore(const schema::SchemaRegistry& registry, Config config)
    : registry_(registry), config_(config) {}

StoreStatus MemoryRowStore::simulateLatency(const StatementGuard& guard) const {
    if (config_.simulated_latency.count() <= 0) {
        return StoreStatus::OK();
    }
    const auto until = std::chrono::steady_clock::now() + config_.simulated_latency;
    const auto slice = std::chrono::milliseconds(2);
    while (std::chrono::steady_clock::now() < until) {
        if (auto st = guard.check(); !st.ok()) {
            return st;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            slice, until - std::chrono::steady_clock::now()));
    }
    return guard.check();
}

std::optional<Record> MemoryRowStore::resolveLocked(const schema::RelationSpec& rel, int64_t key) const {
    auto tit = tables_.find(rel.target);
    if (tit == tables_.end()) return std::nullopt;

    int64_t id = key;
    if (rel.target_field != "id") {
        auto iit = indexes_.find(rel.target);
        if (iit == indexes_.end()) return std::nullopt;
        auto cit = iit->second.find(rel.target_field);
        if (cit == iit->second.end()) return std::nullopt;
        auto vit = cit->second.find(key);
        if (vit == cit->second.end()) return std::nullopt;
        id = vit->second;
    }

    auto rit = tit->second.find(id);
    if (rit == tit->second.end()) return std::nullopt;
    return rit->second;
}

StoreStatus MemoryRowStore::scan(const StoreRequest& request, StatementGuard& guard, bool count_only,
                                 std::vector<Row>& rows, int64_t& matched) const {
    if (!request.plan) {
        return StoreStatus::Error("store request without a plan");
    }
    const EntityKind entity = request.plan->entity();
    if (!registry_.hasEntity(entity)) {
        return StoreStatus::Error(std::string("relation does not exist: ") + schema::entityToString(entity));
    }

    std::shared_lock lock(mutex_);
    matched = 0;
    auto tit = tables_.find(entity);
    if (tit == tables_.end()) {
        return StoreStatus::OK();
    }

    RowAssembler assembler(registry_, entity);
    query::PlanEvaluator evaluator(*request.plan);
    auto resolver = [this](const schema::RelationSpec& rel, int64_t key) { return resolveLocked(rel, key); };

    for (const auto& [id, record] : tit->second) {
        if (auto st = guard.tick(config_.check_interval); !st.ok()) {
            return st;
        }
        Row row = assembler.assemble(record, resolver);
        if (!evaluator.matches(row)) continue;
        ++matched;
        if (!count_only) {
            rows.push_back(std::move(row));
        }
    }
    return StoreStatus::OK();
}

std::pair<StoreStatus, StoreResult> MemoryRowStore::execute(const StoreRequest& request) {
    StatementGuard guard(request);
    if (auto st = simulateLatency(guard); !st.ok()) {
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

std::pair<StoreStatus, StoreResult> MemoryRowStore::count(const StoreRequest& request) {
    StatementGuard guard(request);
    if (auto st = simulateLatency(guard); !st.ok()) {
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

StoreStatus MemoryRowStore::putRecord(EntityKind entity, const Record& record) {
    if (!registry_.hasEntity(entity)) {
        return StoreStatus::Error(std::string("relation does not exist: ") + schema::entityToString(entity));
    }
    const auto& schema = registry_.entity(entity);

    std::unique_lock lock(mutex_);
    auto& table = tables_[entity];
    auto& index = indexes_[entity];

    auto old = table.find(record.id);
    if (old != table.end()) {
        for (auto& [column, values] : index) {
            FieldValue previous = old->second.get(column);
            if (const auto* v = std::get_if<int64_t>(&previous)) {
                auto it = values.find(*v);
                if (it != values.end() && it->second == record.id) {
                    values.erase(it);
                }
            }
        }
    }

    for (const auto& col : schema.columns) {
        if (col.type != schema::FieldType::INT || col.name == "id") continue;
        FieldValue v = record.get(col.name);
        if (const auto* i = std::get_if<int64_t>(&v)) {
            index[col.name][*i] = record.id;
        }
    }
    table[record.id] = record;
    return StoreStatus::OK();
}

size_t MemoryRowStore::size(EntityKind entity) const {
    std::shared_lock lock(mutex_);
    auto it = tables_.find(entity);
    return it == tables_.end() ? 0 : it->second.size();
}

std::optional<Record> MemoryRowStore::findRecord(EntityKind entity, int64_t id) const {
    std::shared_lock lock(mutex_);
    auto it = tables_.find(entity);
    if (it == tables_.end()) return std::nullopt;
    auto rit = it->second.find(id);
    if (rit == it->second.end()) return std::nullopt;
    return rit->second;
}

} // namespace rolodex
