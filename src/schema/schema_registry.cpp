#include "schema/schema_registry.h"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace rolodex {
namespace schema {

const char* entityToString(EntityKind kind) {
    switch (kind) {
        case EntityKind::APP_USER: return "appuser";
        case EntityKind::ADDRESS: return "address";
        case EntityKind::CUSTOMER_RELATIONSHIP: return "customer_relationship";
    }
    return "appuser";
}

std::optional<EntityKind> entityFromString(std::string_view name) {
    if (name == "appuser" || name == "AppUser") return EntityKind::APP_USER;
    if (name == "address" || name == "Address") return EntityKind::ADDRESS;
    if (name == "customer_relationship" || name == "CustomerRelationship") {
        return EntityKind::CUSTOMER_RELATIONSHIP;
    }
    return std::nullopt;
}

const char* fieldTypeToString(FieldType type) {
    switch (type) {
        case FieldType::STRING: return "string";
        case FieldType::INT: return "int";
        case FieldType::DATE: return "date";
    }
    return "string";
}

const char* capabilityToString(Capability cap) {
    switch (cap) {
        case Capability::FILTER: return "filterable";
        case Capability::ORDER: return "orderable";
        case Capability::SEARCH: return "searchable";
    }
    return "filterable";
}

SchemaRegistry::SchemaRegistry(std::vector<EntitySchema> entities) {
    for (auto& schema : entities) {
        Entry entry;
        entry.schema = std::move(schema);
        for (size_t i = 0; i < entry.schema.fields.size(); ++i) {
            const auto& path = entry.schema.fields[i].path;
            if (!entry.by_path.emplace(path, i).second) {
                throw std::invalid_argument("duplicate field '" + path + "' on " +
                                            entry.schema.table);
            }
        }
        EntityKind kind = entry.schema.kind;
        if (!entities_.emplace(kind, std::move(entry)).second) {
            throw std::invalid_argument(std::string("entity registered twice: ") + entityToString(kind));
        }
    }
}

namespace {

FieldSpec field(std::string path, FieldType type, bool filter, bool order, bool search) {
    FieldSpec f;
    f.path = std::move(path);
    f.type = type;
    f.filterable = filter;
    f.orderable = order;
    f.searchable = search;
    return f;
}

constexpr bool Y = true;
constexpr bool N = false;

EntitySchema appUserSchema() {
    EntitySchema s;
    s.kind = EntityKind::APP_USER;
    s.table = "appuser";
    s.columns = {
        {"id", FieldType::INT},
        {"first_name", FieldType::STRING},
        {"last_name", FieldType::STRING},
        {"gender", FieldType::STRING},
        {"customer_id", FieldType::STRING},
        {"phone_number", FieldType::STRING},
        {"created", FieldType::DATE},
        {"birthday", FieldType::DATE},
        {"last_updated", FieldType::DATE},
        {"address_id", FieldType::INT},
    };
    s.relations = {
        {"address", EntityKind::ADDRESS, "address_id", "id"},
        {"relationship", EntityKind::CUSTOMER_RELATIONSHIP, "id", "appuser_id"},
    };
    //    path                                  type               filter/order/search
    s.fields = {
        field("id",                           FieldType::INT,    Y, Y, N),
        field("first_name",                   FieldType::STRING, Y, Y, Y),
        field("last_name",                    FieldType::STRING, Y, Y, Y),
        field("gender",                       FieldType::STRING, Y, Y, N),
        field("customer_id",                  FieldType::STRING, Y, Y, Y),
        field("phone_number",                 FieldType::STRING, Y, Y, Y),
        field("created",                      FieldType::DATE,   Y, Y, N),
        field("birthday",                     FieldType::DATE,   Y, Y, N),
        field("last_updated",                 FieldType::DATE,   Y, Y, N),
        field("address.id",                   FieldType::INT,    Y, N, N),
        field("address.street",               FieldType::STRING, Y, N, Y),
        field("address.city",                 FieldType::STRING, Y, Y, Y),
        field("address.city_code",            FieldType::STRING, Y, Y, N),
        field("address.country",              FieldType::STRING, Y, Y, Y),
        field("relationship.id",              FieldType::INT,    Y, N, N),
        field("relationship.points",          FieldType::INT,    Y, Y, N),
        field("relationship.created",         FieldType::DATE,   Y, Y, N),
        field("relationship.last_activity",   FieldType::DATE,   Y, Y, N),
    };
    s.name_fields = {"first_name", "last_name"};
    s.default_ordering = {"-created"};
    return s;
}

EntitySchema addressSchema() {
    EntitySchema s;
    s.kind = EntityKind::ADDRESS;
    s.table = "address";
    s.columns = {
        {"id", FieldType::INT},
        {"street", FieldType::STRING},
        {"street_number", FieldType::STRING},
        {"city_code", FieldType::STRING},
        {"city", FieldType::STRING},
        {"country", FieldType::STRING},
    };
    s.fields = {
        field("id",            FieldType::INT,    Y, Y, N),
        field("street",        FieldType::STRING, Y, Y, Y),
        field("street_number", FieldType::STRING, Y, Y, N),
        field("city_code",     FieldType::STRING, Y, Y, Y),
        field("city",          FieldType::STRING, Y, Y, Y),
        field("country",       FieldType::STRING, Y, Y, Y),
    };
    s.default_ordering = {"id"};
    return s;
}

EntitySchema relationshipSchema() {
    EntitySchema s;
    s.kind = EntityKind::CUSTOMER_RELATIONSHIP;
    s.table = "customer_relationship";
    s.columns = {
        {"id", FieldType::INT},
        {"appuser_id", FieldType::INT},
        {"points", FieldType::INT},
        {"created", FieldType::DATE},
        {"last_activity", FieldType::DATE},
    };
    s.relations = {
        {"appuser", EntityKind::APP_USER, "appuser_id", "id"},
    };
    s.fields = {
        field("id",                  FieldType::INT,    Y, Y, N),
        field("appuser_id",          FieldType::INT,    Y, Y, N),
        field("points",              FieldType::INT,    Y, Y, N),
        field("created",             FieldType::DATE,   Y, Y, N),
        field("last_activity",       FieldType::DATE,   Y, Y, N),
        field("appuser.first_name",  FieldType::STRING, Y, Y, Y),
        field("appuser.last_name",   FieldType::STRING, Y, Y, Y),
        field("appuser.customer_id", FieldType::STRING, Y, Y, Y),
    };
    s.default_ordering = {"-points"};
    return s;
}

} // namespace

const SchemaRegistry& SchemaRegistry::contacts() {
    static const SchemaRegistry registry({appUserSchema(), addressSchema(), relationshipSchema()});
    return registry;
}

const SchemaRegistry::Entry* SchemaRegistry::findEntry(EntityKind kind) const {
    auto it = entities_.find(kind);
    return it == entities_.end() ? nullptr : &it->second;
}

bool SchemaRegistry::hasEntity(EntityKind kind) const {
    return findEntry(kind) != nullptr;
}

const EntitySchema& SchemaRegistry::entity(EntityKind kind) const {
    const Entry* e = findEntry(kind);
    if (!e) {
        throw std::out_of_range(std::string("entity not registered: ") + entityToString(kind));
    }
    return e->schema;
}

const FieldSpec* SchemaRegistry::find(EntityKind kind, std::string_view path) const {
    const Entry* e = findEntry(kind);
    if (!e) return nullptr;
    auto it = e->by_path.find(std::string(path));
    if (it == e->by_path.end()) return nullptr;
    return &e->schema.fields[it->second];
}

std::pair<PlanStatus, FieldSpec> SchemaRegistry::lookup(EntityKind kind, std::string_view path,
                                                        Capability cap) const {
    const FieldSpec* spec = find(kind, path);
    if (!spec) {
        return {PlanStatus::UnknownField(std::string(path),
                    "no field '" + std::string(path) + "' on " + entityToString(kind)),
                FieldSpec{}};
    }
    if (!spec->has(cap)) {
        return {PlanStatus::UnknownField(std::string(path),
                    "field '" + std::string(path) + "' is not " + capabilityToString(cap) +
                    " on " + entityToString(kind)),
                FieldSpec{}};
    }
    return {PlanStatus::OK(), *spec};
}

std::vector<FieldSpec> SchemaRegistry::fieldsWith(EntityKind kind, Capability cap) const {
    std::vector<FieldSpec> out;
    const Entry* e = findEntry(kind);
    if (!e) return out;
    std::copy_if(e->schema.fields.begin(), e->schema.fields.end(), std::back_inserter(out),
                 [cap](const FieldSpec& f) { return f.has(cap); });
    return out;
}

const std::vector<RelationSpec>& SchemaRegistry::relationsOf(EntityKind kind) const {
    return entity(kind).relations;
}

const std::vector<std::string>& SchemaRegistry::defaultOrdering(EntityKind kind) const {
    return entity(kind).default_ordering;
}

const std::vector<std::string>& SchemaRegistry::nameFields(EntityKind kind) const {
    return entity(kind).name_fields;
}

std::vector<EntityKind> SchemaRegistry::entities() const {
    std::vector<EntityKind> out;
    out.reserve(entities_.size());
    for (const auto& [kind, entry] : entities_) {
        out.push_back(kind);
    }
    return out;
}

} // namespace schema
} // namespace rolodex
