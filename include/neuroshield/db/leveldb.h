// NeuroShield - Database Backends
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// LevelDB-backed and in-memory implementations of db::Database.

#ifndef NEUROSHIELD_DB_LEVELDB_H
#define NEUROSHIELD_DB_LEVELDB_H

#include "neuroshield/db/database.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/write_batch.h>

#include <map>
#include <memory>
#include <mutex>

namespace neuroshield {
namespace db {

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const std::filesystem::path& path);
    ~LevelDBDatabase() override;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    const char* Name() const override { return "leveldb"; }

    const std::filesystem::path& GetPath() const { return path_; }

    static Status ConvertStatus(const leveldb::Status& s);

private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::filesystem::path path_;
};

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * Ordered map behind a mutex. Selected with db=memory and used by tests.
 */
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a snapshot taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    const char* Name() const override { return "memory"; }

    size_t Size() const;

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace neuroshield

#endif // NEUROSHIELD_DB_LEVELDB_H
