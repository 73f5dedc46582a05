#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rolodex {

/// Key layout of the RocksDB row store.
/// Rows and index entries are plain key-value pairs; ids are zero-padded so
/// that lexicographic key order equals numeric id order.
class KeySchema {
public:
    enum class KeyType : uint8_t {
        RELATIONAL,       // table:pk
        SECONDARY_INDEX,  // idx:table:column:value:pk
        META,             // meta:name
    };

    /// table:pk
    static std::string makeRelationalKey(std::string_view table, std::string_view pk);
    static std::string makeRelationalKey(std::string_view table, int64_t id);

    /// "table:" - prefix of every row of the table
    static std::string makeTablePrefix(std::string_view table);

    /// idx:table:column:value:pk
    static std::string makeSecondaryIndexKey(
        std::string_view table,
        std::string_view column,
        std::string_view value,
        std::string_view pk
    );

    /// idx:table:column:value: - prefix of all entries for one value
    static std::string makeSecondaryIndexPrefix(
        std::string_view table,
        std::string_view column,
        std::string_view value
    );

    static std::string makeMetaKey(std::string_view name);

    /// 20-digit zero-padded decimal; negative ids are not used by the store
    static std::string formatId(int64_t id);
    static std::optional<int64_t> parseId(std::string_view pk);

    static KeyType parseKeyType(std::string_view key);

    /// Text after the last separator
    static std::string extractPrimaryKey(std::string_view key);

private:
    static constexpr char SEPARATOR = ':';
};

} // namespace rolodex
