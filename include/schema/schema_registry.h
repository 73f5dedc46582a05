#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "query/plan_status.h"

namespace rolodex {
namespace schema {

enum class EntityKind { APP_USER, ADDRESS, CUSTOMER_RELATIONSHIP };

enum class FieldType { STRING, INT, DATE };

/// Column value. monostate is SQL NULL; INT and DATE (epoch seconds) share int64_t.
using FieldValue = std::variant<std::monostate, int64_t, std::string>;

enum class Capability { FILTER, ORDER, SEARCH };

/// Query-visible field, possibly reached through a relation ("address.city").
struct FieldSpec {
    std::string path;
    FieldType type = FieldType::STRING;
    bool filterable = false;
    bool orderable = false;
    bool searchable = false;

    bool has(Capability cap) const {
        switch (cap) {
            case Capability::FILTER: return filterable;
            case Capability::ORDER: return orderable;
            case Capability::SEARCH: return searchable;
        }
        return false;
    }
};

/// Stored column of an entity's own table.
struct ColumnSpec {
    std::string name;
    FieldType type = FieldType::STRING;
};

/// Join from a base record to at most one target record:
/// target.target_field == base.local_field
struct RelationSpec {
    std::string name;
    EntityKind target = EntityKind::APP_USER;
    std::string local_field;
    std::string target_field;
};

struct EntitySchema {
    EntityKind kind = EntityKind::APP_USER;
    std::string table;
    std::vector<ColumnSpec> columns;
    std::vector<RelationSpec> relations;
    std::vector<FieldSpec> fields;
    std::vector<std::string> name_fields;       // fields matched by the "name" parameter
    std::vector<std::string> default_ordering;  // e.g. {"-created"}
};

const char* entityToString(EntityKind kind);
std::optional<EntityKind> entityFromString(std::string_view name);
const char* fieldTypeToString(FieldType type);
const char* capabilityToString(Capability cap);

/**
 * Declares the entities, their relations and per-field capabilities.
 *
 * Built once and read-only afterwards; all lookups are const and safe to call
 * from any thread. contacts() is the process-wide instance for the contacts
 * schema; tests may construct their own.
 */
class SchemaRegistry {
public:
    explicit SchemaRegistry(std::vector<EntitySchema> entities);

    SchemaRegistry(const SchemaRegistry&) = delete;
    SchemaRegistry& operator=(const SchemaRegistry&) = delete;

    static const SchemaRegistry& contacts();

    bool hasEntity(EntityKind kind) const;

    /// Throws std::out_of_range for an entity that was not registered.
    const EntitySchema& entity(EntityKind kind) const;

    /// nullptr if the path is not declared for this entity
    const FieldSpec* find(EntityKind kind, std::string_view path) const;

    /// Resolves a path that must carry the given capability.
    /// Fails with UNKNOWN_FIELD when the path is absent or lacks the capability.
    std::pair<PlanStatus, FieldSpec> lookup(EntityKind kind, std::string_view path, Capability cap) const;

    /// Fields with the capability, in declaration order
    std::vector<FieldSpec> fieldsWith(EntityKind kind, Capability cap) const;

    const std::vector<RelationSpec>& relationsOf(EntityKind kind) const;
    const std::vector<std::string>& defaultOrdering(EntityKind kind) const;
    const std::vector<std::string>& nameFields(EntityKind kind) const;

    std::vector<EntityKind> entities() const;

private:
    struct Entry {
        EntitySchema schema;
        std::unordered_map<std::string, size_t> by_path;
    };

    const Entry* findEntry(EntityKind kind) const;

    std::map<EntityKind, Entry> entities_;
};

} // namespace schema
} // namespace rolodex
