#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include "schema/schema_registry.h"
#include "storage/row_store.h"

namespace rolodex {

/// Joins a base record with its related records into a Row.
///
/// Every base column lands under its own name; each column of a related
/// record lands under "<relation>.<column>". A missing relation leaves those
/// paths NULL (LEFT JOIN).
class RowAssembler {
public:
    /// Returns the record of rel.target whose rel.target_field equals key
    using Resolver = std::function<std::optional<Record>(const schema::RelationSpec& rel, int64_t key)>;

    RowAssembler(const schema::SchemaRegistry& registry, EntityKind base);

    Row assemble(const Record& base, const Resolver& resolve) const;

    EntityKind base() const { return base_; }

private:
    EntityKind base_;
    const schema::EntitySchema& schema_;
    const schema::SchemaRegistry& registry_;
};

} // namespace rolodex
