#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/slice.h>
#include <rocksdb/status.h>
#include <rocksdb/utilities/transaction_db.h>

namespace regstore {

class Bucket;

/**
 * regstore::Tx
 *
 * A read or write transaction over the bucket hierarchy.
 *
 * Read transactions see a RocksDB snapshot taken at Begin. Write
 * transactions are RocksDB transactions that also hold the store's writer
 * lock for their whole lifetime, so at most one is open at a time; they see
 * their own uncommitted writes.
 *
 * A transaction that is neither committed nor rolled back is rolled back on
 * destruction.
 */
class Tx {
 public:
  ~Tx();

  Tx(const Tx&) = delete;
  Tx& operator=(const Tx&) = delete;

  bool writable() const { return writable_; }

  /** The root bucket. Its children are the type buckets. */
  Bucket Root();

  /** Shorthands for Root().GetBucket / CreateBucketIfNotExists. */
  rocksdb::Status GetBucket(std::string_view name, Bucket* out);
  rocksdb::Status CreateBucketIfNotExists(std::string_view name, Bucket* out);

  /** Commit a write transaction. For a read transaction, just releases it. */
  rocksdb::Status Commit();

  /** Discard all writes. Safe to call more than once. */
  rocksdb::Status Rollback();

 private:
  friend class Bucket;
  friend class Store;

  Tx(rocksdb::TransactionDB* db,
     rocksdb::ColumnFamilyHandle* cf,
     std::unique_lock<std::mutex> writer_lock,
     int64_t lock_timeout_ms);  // write
  Tx(rocksdb::TransactionDB* db, rocksdb::ColumnFamilyHandle* cf);  // read

  rocksdb::Status Check() const;
  rocksdb::Status CheckWritable() const;

  rocksdb::Status RawGet(const std::string& key, std::string* value) const;
  rocksdb::Status RawPut(const std::string& key, rocksdb::Slice value);
  rocksdb::Status RawDelete(const std::string& key);
  rocksdb::Status RawScan(const std::string& prefix,
                          const std::function<rocksdb::Status(rocksdb::Slice key,
                                                              rocksdb::Slice value)>& fn) const;
  void Release();

  rocksdb::TransactionDB* db_ = nullptr;
  rocksdb::ColumnFamilyHandle* cf_ = nullptr;
  bool writable_ = false;
  bool done_ = false;

  std::unique_ptr<rocksdb::Transaction> txn_;   // write only
  const rocksdb::Snapshot* snapshot_ = nullptr;  // read only
  rocksdb::ReadOptions ro_;
  std::unique_lock<std::mutex> writer_lock_;
};

/**
 * regstore::Bucket
 *
 * A named namespace inside a transaction holding flat key/value entries and
 * child buckets. Entries and child buckets share one namespace: a name is
 * either a value or a bucket, never both.
 *
 * A Bucket is a lightweight handle (transaction pointer + path) and is only
 * valid while its transaction is open.
 */
class Bucket {
 public:
  Bucket() = default;

  bool valid() const { return tx_ != nullptr; }
  const std::vector<std::string>& path() const { return path_; }
  std::string_view name() const {
    return path_.empty() ? std::string_view() : std::string_view(path_.back());
  }

  /** NotFound if name is absent or names a child bucket. */
  rocksdb::Status Get(std::string_view key, std::string* value) const;

  /** InvalidArgument if key is empty or names a child bucket. */
  rocksdb::Status Put(std::string_view key, std::string_view value);

  /** Remove a flat entry. Absent keys are ignored. */
  rocksdb::Status Delete(std::string_view key);

  /** NotFound if there is no child bucket with that name. */
  rocksdb::Status GetBucket(std::string_view name, Bucket* out) const;

  /** True if a child bucket with that name exists. */
  rocksdb::Status HasBucket(std::string_view name, bool* exists) const;

  /**
   * Create a child bucket. InvalidArgument if the name is empty, already a
   * bucket, or already a flat value.
   */
  rocksdb::Status CreateBucket(std::string_view name, Bucket* out);
  rocksdb::Status CreateBucketIfNotExists(std::string_view name, Bucket* out);

  /** Delete a child bucket and everything below it. NotFound if absent. */
  rocksdb::Status DeleteBucket(std::string_view name);

  /** Visit flat entries in key order. A non-OK return from fn stops the scan. */
  rocksdb::Status ForEach(
      const std::function<rocksdb::Status(std::string_view key,
                                          std::string_view value)>& fn) const;

  /** Visit child bucket names in key order. */
  rocksdb::Status ForEachBucket(
      const std::function<rocksdb::Status(std::string_view name)>& fn) const;

  /** Number of direct child buckets. */
  rocksdb::Status CountBuckets(uint64_t* out) const;

 private:
  friend class Tx;

  Bucket(Tx* tx, std::vector<std::string> path) : tx_(tx), path_(std::move(path)) {}

  std::vector<std::string> ChildPath(std::string_view name) const;

  Tx* tx_ = nullptr;
  std::vector<std::string> path_;
};

}  // namespace regstore
