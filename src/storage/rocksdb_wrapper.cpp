#include "storage/rocksdb_wrapper.h"
#include "utils/logger.h"

#include <rocksdb/cache.h>
#include <rocksdb/db.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/table.h>
#include <rocksdb/write_batch.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace rolodex {

namespace {

rocksdb::CompressionType toCompression(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "lz4") return rocksdb::kLZ4Compression;
    if (v == "zstd") return rocksdb::kZSTD;
    if (v == "snappy") return rocksdb::kSnappyCompression;
    if (v == "zlib") return rocksdb::kZlibCompression;
    return rocksdb::kNoCompression;
}

} // namespace

RocksDBWrapper::RocksDBWrapper(const Config& config) : config_(config) {
    options_ = std::make_unique<rocksdb::Options>();
    read_options_ = std::make_unique<rocksdb::ReadOptions>();
    write_options_ = std::make_unique<rocksdb::WriteOptions>();
    configureOptions();
}

RocksDBWrapper::~RocksDBWrapper() {
    close();
}

void RocksDBWrapper::configureOptions() {
    options_->create_if_missing = true;
    options_->write_buffer_size = config_.memtable_size_mb * 1024 * 1024;
    options_->max_background_jobs = config_.max_background_jobs;

    rocksdb::BlockBasedTableOptions table_options;
    table_options.block_cache = rocksdb::NewLRUCache(config_.block_cache_size_mb * 1024 * 1024);
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(config_.bloom_bits_per_key, false));
    options_->table_factory.reset(rocksdb::NewBlockBasedTableFactory(table_options));

    options_->compression = toCompression(config_.compression);
    write_options_->sync = config_.sync_writes;
}

bool RocksDBWrapper::open() {
    if (db_) return true;

    std::error_code ec;
    std::filesystem::create_directories(config_.db_path, ec);
    if (ec) {
        ROLODEX_ERROR("Failed to create DB directory '{}': {}", config_.db_path, ec.message());
        return false;
    }

    rocksdb::DB* raw = nullptr;
    rocksdb::Status status = rocksdb::DB::Open(*options_, config_.db_path, &raw);
    if (!status.ok()) {
        ROLODEX_ERROR("Failed to open RocksDB at {}: {}", config_.db_path, status.ToString());
        return false;
    }
    db_.reset(raw);
    ROLODEX_INFO("Opened RocksDB at: {}", config_.db_path);
    return true;
}

void RocksDBWrapper::close() {
    if (db_) {
        ROLODEX_INFO("Closing RocksDB at: {}", config_.db_path);
        db_.reset();
    }
}

bool RocksDBWrapper::isOpen() const {
    return db_ != nullptr;
}

std::optional<std::string> RocksDBWrapper::get(std::string_view key) const {
    if (!db_) return std::nullopt;

    std::string value;
    rocksdb::Status status = db_->Get(*read_options_, rocksdb::Slice(key.data(), key.size()), &value);
    if (status.ok()) {
        return value;
    }
    if (!status.IsNotFound()) {
        ROLODEX_WARN("RocksDB get failed: {}", status.ToString());
    }
    return std::nullopt;
}

bool RocksDBWrapper::put(std::string_view key, std::string_view value) {
    if (!db_) return false;

    rocksdb::Status status = db_->Put(*write_options_,
                                      rocksdb::Slice(key.data(), key.size()),
                                      rocksdb::Slice(value.data(), value.size()));
    return status.ok();
}

bool RocksDBWrapper::del(std::string_view key) {
    if (!db_) return false;

    rocksdb::Status status = db_->Delete(*write_options_, rocksdb::Slice(key.data(), key.size()));
    return status.ok();
}

// WriteBatchWrapper

RocksDBWrapper::WriteBatchWrapper::WriteBatchWrapper(RocksDBWrapper* db)
    : db_(db), batch_(std::make_unique<rocksdb::WriteBatch>()) {}

RocksDBWrapper::WriteBatchWrapper::~WriteBatchWrapper() = default;

void RocksDBWrapper::WriteBatchWrapper::put(std::string_view key, std::string_view value) {
    batch_->Put(rocksdb::Slice(key.data(), key.size()), rocksdb::Slice(value.data(), value.size()));
}

void RocksDBWrapper::WriteBatchWrapper::del(std::string_view key) {
    batch_->Delete(rocksdb::Slice(key.data(), key.size()));
}

size_t RocksDBWrapper::WriteBatchWrapper::count() const {
    return static_cast<size_t>(batch_->Count());
}

bool RocksDBWrapper::WriteBatchWrapper::commit() {
    return db_->commitBatch(batch_.get());
}

void RocksDBWrapper::WriteBatchWrapper::rollback() {
    batch_->Clear();
}

std::unique_ptr<RocksDBWrapper::WriteBatchWrapper> RocksDBWrapper::createWriteBatch() {
    return std::make_unique<WriteBatchWrapper>(this);
}

bool RocksDBWrapper::commitBatch(rocksdb::WriteBatch* batch) {
    if (!db_) return false;
    rocksdb::Status status = db_->Write(*write_options_, batch);
    if (!status.ok()) {
        ROLODEX_ERROR("RocksDB batch commit failed: {}", status.ToString());
        return false;
    }
    return true;
}

void RocksDBWrapper::scanPrefix(std::string_view prefix, const ScanCallback& callback) const {
    if (!db_) return;

    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));
    rocksdb::Slice prefix_slice(prefix.data(), prefix.size());

    for (it->Seek(prefix_slice); it->Valid() && it->key().starts_with(prefix_slice); it->Next()) {
        std::string_view key(it->key().data(), it->key().size());
        std::string_view value(it->value().data(), it->value().size());
        if (!callback(key, value)) {
            break;
        }
    }
}

void RocksDBWrapper::flush() {
    if (!db_) return;
    rocksdb::Status status = db_->Flush(rocksdb::FlushOptions());
    if (!status.ok()) {
        ROLODEX_WARN("RocksDB flush failed: {}", status.ToString());
    }
}

uint64_t RocksDBWrapper::getApproximateKeyCount() const {
    if (!db_) return 0;
    uint64_t keys = 0;
    db_->GetIntProperty("rocksdb.estimate-num-keys", &keys);
    return keys;
}

} // namespace rolodex
