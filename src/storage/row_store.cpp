#include "storage/row_store.h"
#include "utils/date_time.h"

namespace rolodex {

namespace {

const FieldValue& nullValue() {
    static const FieldValue null;
    return null;
}

nlohmann::json rawToJson(const FieldValue& v) {
    if (const auto* i = std::get_if<int64_t>(&v)) return *i;
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    return nullptr;
}

} // namespace

// ============================================================================
// Record
// ============================================================================

FieldValue Record::get(std::string_view column) const {
    if (column == "id") return id;
    auto it = fields.find(column);
    return it == fields.end() ? FieldValue{} : it->second;
}

nlohmann::json Record::toJson(const schema::EntitySchema& schema) const {
    nlohmann::json j = nlohmann::json::object();
    j["id"] = id;
    for (const auto& col : schema.columns) {
        if (col.name == "id") continue;
        j[col.name] = rawToJson(get(col.name));
    }
    return j;
}

Record Record::fromJson(const schema::EntitySchema& schema, const nlohmann::json& j) {
    Record r;
    r.id = j.value("id", int64_t{0});
    for (const auto& col : schema.columns) {
        if (col.name == "id" || !j.contains(col.name)) continue;
        const auto& v = j[col.name];
        if (v.is_null()) {
            r.fields[col.name] = FieldValue{};
        } else if (v.is_number_integer()) {
            r.fields[col.name] = v.get<int64_t>();
        } else if (v.is_string() && col.type == schema::FieldType::DATE) {
            auto ts = utils::DateTime::parse(v.get<std::string>());
            r.fields[col.name] = ts ? FieldValue{*ts} : FieldValue{};
        } else if (v.is_string()) {
            r.fields[col.name] = v.get<std::string>();
        }
    }
    return r;
}

// ============================================================================
// Row
// ============================================================================

const FieldValue& Row::get(std::string_view path) const {
    auto it = values.find(path);
    return it == values.end() ? nullValue() : it->second;
}

nlohmann::json Row::toJson(const schema::SchemaRegistry& registry, EntityKind entity) const {
    const auto& base = registry.entity(entity);
    nlohmann::json j = nlohmann::json::object();
    for (const auto& col : base.columns) {
        j[col.name] = query::fieldValueToJson(col.name == "id" ? FieldValue{id} : get(col.name), col.type);
    }
    for (const auto& rel : base.relations) {
        const auto& target = registry.entity(rel.target);
        const std::string prefix = rel.name + ".";
        if (std::holds_alternative<std::monostate>(get(prefix + "id"))) {
            j[rel.name] = nullptr;
            continue;
        }
        nlohmann::json nested = nlohmann::json::object();
        for (const auto& col : target.columns) {
            nested[col.name] = query::fieldValueToJson(get(prefix + col.name), col.type);
        }
        j[rel.name] = std::move(nested);
    }
    return j;
}

// ============================================================================
// StoreStatus / StatementGuard
// ============================================================================

const char* StoreStatus::codeToString(Code c) {
    switch (c) {
        case Code::OK: return "ok";
        case Code::STATEMENT_TIMEOUT: return "statement_timeout";
        case Code::ABORTED: return "aborted";
        case Code::ERROR: return "error";
    }
    return "ok";
}

StatementGuard::StatementGuard(const StoreRequest& request)
    : started_(std::chrono::steady_clock::now())
    , timeout_(request.statement_timeout)
    , abort_(request.abort_signal) {}

StoreStatus StatementGuard::check() const {
    if (abort_ && abort_->load(std::memory_order_acquire)) {
        return StoreStatus::Aborted("canceling statement due to user request");
    }
    if (timeout_.count() > 0 &&
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_) >=
            timeout_) {
        return StoreStatus::Timeout("canceling statement due to statement timeout");
    }
    return StoreStatus::OK();
}

StoreStatus StatementGuard::tick(uint32_t interval) {
    if (interval == 0 || ++ticks_ % interval == 0) {
        return check();
    }
    return StoreStatus::OK();
}

} // namespace rolodex
