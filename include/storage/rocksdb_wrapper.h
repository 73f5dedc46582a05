#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace rocksdb {
    class DB;
    class WriteBatch;
    class Options;
    class ReadOptions;
    class WriteOptions;
}

namespace rolodex {

/// Thin wrapper around rocksdb::DB used by the persistent row store.
/// Values are opaque byte strings (the row store writes JSON).
class RocksDBWrapper {
public:
    struct Config {
        std::string db_path = "./data/rolodex";
        size_t memtable_size_mb = 64;
        size_t block_cache_size_mb = 256;
        int bloom_bits_per_key = 10;
        bool sync_writes = false;
        int max_background_jobs = 2;
        // "none", "lz4", "zstd", "snappy", "zlib"
        std::string compression = "none";
    };

    explicit RocksDBWrapper(const Config& config);
    ~RocksDBWrapper();

    RocksDBWrapper(const RocksDBWrapper&) = delete;
    RocksDBWrapper& operator=(const RocksDBWrapper&) = delete;

    /// Creates the directory if needed; false (and logs) on failure
    bool open();
    void close();
    bool isOpen() const;

    // ===== CRUD =====

    std::optional<std::string> get(std::string_view key) const;
    bool put(std::string_view key, std::string_view value);
    bool del(std::string_view key);

    // ===== Atomic batches =====

    class WriteBatchWrapper {
    public:
        explicit WriteBatchWrapper(RocksDBWrapper* db);
        ~WriteBatchWrapper();

        void put(std::string_view key, std::string_view value);
        void del(std::string_view key);
        size_t count() const;

        /// Commit the batch atomically
        bool commit();
        void rollback();

    private:
        RocksDBWrapper* db_;
        std::unique_ptr<rocksdb::WriteBatch> batch_;
    };

    std::unique_ptr<WriteBatchWrapper> createWriteBatch();

    // ===== Scanning =====

    /// Return false from the callback to stop the scan
    using ScanCallback = std::function<bool(std::string_view key, std::string_view value)>;
    void scanPrefix(std::string_view prefix, const ScanCallback& callback) const;

    // ===== Maintenance =====

    void flush();
    uint64_t getApproximateKeyCount() const;

    const Config& getConfig() const { return config_; }

private:
    bool commitBatch(rocksdb::WriteBatch* batch);
    void configureOptions();

    Config config_;
    std::unique_ptr<rocksdb::DB> db_;
    std::unique_ptr<rocksdb::Options> options_;
    std::unique_ptr<rocksdb::ReadOptions> read_options_;
    std::unique_ptr<rocksdb::WriteOptions> write_options_;
};

} // namespace rolodex
