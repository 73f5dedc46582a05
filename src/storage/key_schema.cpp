#include "storage/key_schema.h"

#include <charconv>
#include <sstream>
#include <fmt/format.h>

namespace rolodex {

std::string KeySchema::makeRelationalKey(std::string_view table, std::string_view pk) {
    std::ostringstream oss;
    oss << table << SEPARATOR << pk;
    return oss.str();
}

std::string KeySchema::makeRelationalKey(std::string_view table, int64_t id) {
    return makeRelationalKey(table, formatId(id));
}

std::string KeySchema::makeTablePrefix(std::string_view table) {
    std::string prefix(table);
    prefix.push_back(SEPARATOR);
    return prefix;
}

std::string KeySchema::makeSecondaryIndexKey(
    std::string_view table,
    std::string_view column,
    std::string_view value,
    std::string_view pk
) {
    std::ostringstream oss;
    oss << "idx" << SEPARATOR << table << SEPARATOR << column << SEPARATOR << value << SEPARATOR << pk;
    return oss.str();
}

std::string KeySchema::makeSecondaryIndexPrefix(
    std::string_view table,
    std::string_view column,
    std::string_view value
) {
    std::ostringstream oss;
    oss << "idx" << SEPARATOR << table << SEPARATOR << column << SEPARATOR << value << SEPARATOR;
    return oss.str();
}

std::string KeySchema::makeMetaKey(std::string_view name) {
    std::ostringstream oss;
    oss << "meta" << SEPARATOR << name;
    return oss.str();
}

std::string KeySchema::formatId(int64_t id) {
    return fmt::format("{:020d}", id);
}

std::optional<int64_t> KeySchema::parseId(std::string_view pk) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(pk.data(), pk.data() + pk.size(), v);
    if (ec != std::errc() || ptr != pk.data() + pk.size()) {
        return std::nullopt;
    }
    return v;
}

KeySchema::KeyType KeySchema::parseKeyType(std::string_view key) {
    if (key.starts_with("idx:")) return KeyType::SECONDARY_INDEX;
    if (key.starts_with("meta:")) return KeyType::META;
    return KeyType::RELATIONAL;
}

std::string KeySchema::extractPrimaryKey(std::string_view key) {
    auto last_sep = key.rfind(SEPARATOR);
    if (last_sep != std::string_view::npos) {
        return std::string(key.substr(last_sep + 1));
    }
    return std::string(key);
}

} // namespace rolodex
