#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "query/query_plan.h"
#include "schema/schema_registry.h"

namespace rolodex {

using schema::EntityKind;
using schema::FieldValue;

/// One stored row of an entity's own table.
struct Record {
    int64_t id = 0;
    std::map<std::string, FieldValue, std::less<>> fields;

    /// "id" resolves to the primary key; missing columns are NULL
    FieldValue get(std::string_view column) const;

    nlohmann::json toJson(const schema::EntitySchema& schema) const;
    static Record fromJson(const schema::EntitySchema& schema, const nlohmann::json& j);
};

/// A base record joined with its related records; keys are field paths
/// ("first_name", "address.city").
struct Row {
    int64_t id = 0;
    std::map<std::string, FieldValue, std::less<>> values;

    const FieldValue& get(std::string_view path) const;

    /// Base columns plus one nested object (or null) per relation
    nlohmann::json toJson(const schema::SchemaRegistry& registry, EntityKind entity) const;
};

struct StoreStatus {
    enum class Code { OK, STATEMENT_TIMEOUT, ABORTED, ERROR };

    Code code = Code::OK;
    std::string message;

    bool ok() const { return code == Code::OK; }

    static StoreStatus OK() { return {}; }
    static StoreStatus Timeout(std::string msg) { return StoreStatus{Code::STATEMENT_TIMEOUT, std::move(msg)}; }
    static StoreStatus Aborted(std::string msg) { return StoreStatus{Code::ABORTED, std::move(msg)}; }
    static StoreStatus Error(std::string msg) { return StoreStatus{Code::ERROR, std::move(msg)}; }

    static const char* codeToString(Code c);
};

/// Compiled request handed to a store.
struct StoreRequest {
    query::QueryPlanPtr plan;
    /// Store-side statement timeout; zero disables it
    std::chrono::milliseconds statement_timeout{0};
    /// Raised by the caller when it stops waiting; the store should give up
    std::shared_ptr<const std::atomic<bool>> abort_signal;
    /// Also compute the total number of matching rows (the list COUNT query)
    bool include_total = true;
};

struct StoreResult {
    std::vector<Row> rows;
    int64_t total_count = -1;
    /// Best-effort number of statements the store ran for this request
    uint32_t statement_count = 0;
};

/**
 * Relational backend consumed by the executor.
 *
 * Implementations must be safe for concurrent calls and must stop work once
 * the statement timeout elapses or the abort signal is raised.
 */
class RowStore {
public:
    virtual ~RowStore() = default;

    /// Filter, search, order and paginate according to request.plan
    virtual std::pair<StoreStatus, StoreResult> execute(const StoreRequest& request) = 0;

    /// Number of rows matching the plan's filters and search; pagination and
    /// ordering are ignored. The count is returned in StoreResult::total_count.
    virtual std::pair<StoreStatus, StoreResult> count(const StoreRequest& request) = 0;

    /// Insert or replace a record
    virtual StoreStatus putRecord(EntityKind entity, const Record& record) = 0;

    /// Bulk insert; stops at the first failing record
    virtual StoreStatus putRecords(EntityKind entity, const std::vector<Record>& records) {
        for (const auto& r : records) {
            auto st = putRecord(entity, r);
            if (!st.ok()) return st;
        }
        return StoreStatus::OK();
    }

    virtual std::string name() const = 0;
};

/**
 * Tracks the statement timeout and abort signal of one store request.
 * Stores call check() periodically while scanning.
 */
class StatementGuard {
public:
    explicit StatementGuard(const StoreRequest& request);

    /// OK while the statement may continue
    StoreStatus check() const;

    /// check() only every `interval` calls to tick()
    StoreStatus tick(uint32_t interval = 256);

private:
    std::chrono::steady_clock::time_point started_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<const std::atomic<bool>> abort_;
    uint32_t ticks_ = 0;
};

} // namespace rolodex
