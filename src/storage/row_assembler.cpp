#include "storage/row_assembler.h"

namespace rolodex {

RowAssembler::RowAssembler(const schema::SchemaRegistry& registry, EntityKind base)
    : base_(base)
    , schema_(registry.entity(base))
    , registry_(registry) {}

Row RowAssembler::assemble(const Record& base, const Resolver& resolve) const {
    Row row;
    row.id = base.id;
    for (const auto& col : schema_.columns) {
        row.values[col.name] = base.get(col.name);
    }

    for (const auto& rel : schema_.relations) {
        FieldValue key = base.get(rel.local_field);
        const auto* k = std::get_if<int64_t>(&key);
        if (!k) continue;

        auto related = resolve(rel, *k);
        if (!related) continue;

        const std::string prefix = rel.name + ".";
        for (const auto& col : registry_.entity(rel.target).columns) {
            row.values[prefix + col.name] = related->get(col.name);
        }
    }
    return row;
}

} // namespace rolodex
