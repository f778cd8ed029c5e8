#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/cache.h>
#include <rocksdb/options.h>
#include <rocksdb/status.h>
#include <rocksdb/utilities/transaction_db.h>

#include <regstore/bucket.hpp>
#include <regstore/record_codec.hpp>
#include <regstore/schema.hpp>
#include <regstore/value.hpp>

namespace regstore {

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., calls, errors, records matched). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., latency in microseconds, records scanned). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values. Default implementation does nothing. */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

/** A trace span interface (very small surface area). */
struct TraceSpan {
  virtual ~TraceSpan() = default;

  virtual void SetAttribute(std::string_view key, uint64_t value) = 0;
  virtual void SetAttribute(std::string_view key, std::string_view value) = 0;
  virtual void AddEvent(std::string_view name) = 0;

  /** Must be called exactly once to finish the span. */
  virtual void End(const rocksdb::Status& status) = 0;
};

/** A tracer creates spans. If unset, tracing is disabled. */
struct Tracer {
  virtual ~Tracer() = default;
  virtual std::unique_ptr<TraceSpan> StartSpan(std::string_view name) = 0;
};

/**
 * Options for the regstore typed object store.
 *
 * Passed explicitly to Store::Open; there is no process-wide configuration.
 */
struct Options {
  // Store location (a RocksDB directory).
  std::string path = "./regstore.db";

  // RocksDB performance knobs
  size_t block_cache_bytes = 64ull * 1024ull * 1024ull;
  int bloom_bits_per_key = 10;

  // Row lock wait inside a write transaction.
  int lock_timeout_ms = 2000;

  // How long Open waits for another handle to release the store's file lock
  // before giving up.
  int open_timeout_ms = 5000;

  // Observability hooks (optional)
  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Tracer> tracer;
};

/** Predicate over the requested subset of a record's fields. */
using FieldFilter = std::function<bool(const FieldValues&)>;

/** Per-record callback for IterateFields. */
using FieldVisitor = std::function<void(const Value&)>;

/**
 * regstore::Store
 *
 * A RocksDB-backed store for heterogeneous typed records, laid out as a
 * bucket hierarchy:
 *
 *   <type bucket> / <record key bucket> / <field>           tagged value
 *   <type bucket> / <record key bucket> / <map field> / k   raw value
 *
 * Every operation runs in exactly one transaction. Writes are serialized
 * (one writer at a time); reads run concurrently on snapshots.
 *
 * Records cross the API either as RecordValues with a SchemaBase, or as typed
 * records with a Schema<Record>.
 */
class Store {
 public:
  ~Store();

  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  /**
   * Open or create a store at opt.path.
   *
   * If another handle holds the store's lock, retries until
   * opt.open_timeout_ms has elapsed and then returns the last error.
   */
  static rocksdb::Status Open(const Options& opt, std::unique_ptr<Store>* out);

  /**
   * Replace the record under key with values. Any previous record under the
   * same key is removed first, nested map buckets included.
   */
  rocksdb::Status SaveValue(std::string_view type,
                            std::string_view key,
                            const SchemaBase& schema,
                            const RecordValues& values);

  /**
   * Load records by key. Keys with no record are left out of *out; this is
   * not an error.
   */
  rocksdb::Status LoadValues(std::string_view type,
                             const std::vector<std::string>& keys,
                             const SchemaBase& schema,
                             std::map<std::string, RecordValues>* out) const;

  /** Load every record of type. */
  rocksdb::Status LoadValuesAll(std::string_view type,
                                const SchemaBase& schema,
                                std::map<std::string, RecordValues>* out) const;

  /**
   * Load the records whose requested fields satisfy filter.
   *
   * Only the named fields are decoded to evaluate filter; fields with no
   * value are left out of the map it receives. Matching records are then
   * fully decoded in the same snapshot. An empty field list or an empty
   * filter matches every record.
   */
  rocksdb::Status LoadValuesByFilter(std::string_view type,
                                     const std::vector<std::string>& fields,
                                     const SchemaBase& schema,
                                     const FieldFilter& filter,
                                     std::map<std::string, RecordValues>* out) const;

  /**
   * Stream one field of every record of type to visit, in key order. Records
   * without the field yield an empty Value. An empty visit is a no-op.
   */
  rocksdb::Status IterateFields(std::string_view type,
                                std::string_view field,
                                const SchemaBase& schema,
                                const FieldVisitor& visit) const;

  /**
   * Overwrite the named fields of an existing record; other fields are kept.
   * A missing type or record is a no-op, not an insert.
   */
  rocksdb::Status UpdateValue(std::string_view type,
                              std::string_view key,
                              const FieldValues& properties);

  /** Delete records by key. Absent keys are ignored. */
  rocksdb::Status DeleteValues(std::string_view type, const std::vector<std::string>& keys);

  /** Number of records of type; zero if the type was never written. */
  rocksdb::Status CountValues(std::string_view type, uint64_t* out_count) const;

  /**
   * Run fn inside one transaction. A write transaction commits when fn
   * returns OK and rolls back otherwise; fn's status is returned unchanged.
   */
  rocksdb::Status Execute(bool writable, const std::function<rocksdb::Status(Tx*)>& fn);

  /**
   * Begin a caller-managed transaction. The caller must Commit or Rollback;
   * destroying an open Tx rolls it back. A writable Tx blocks other writers
   * for as long as it is open.
   */
  rocksdb::Status BeginTransaction(bool writable, std::unique_ptr<Tx>* out);

  /** Close the store and release RocksDB resources. Safe to call multiple times. */
  void Close();

  // ---------------------------------------------------------------------------
  // Typed overloads
  // ---------------------------------------------------------------------------

  template <typename Record>
  rocksdb::Status SaveValue(std::string_view type,
                            std::string_view key,
                            const Schema<Record>& schema,
                            const Record& record) {
    return SaveValue(type, key, static_cast<const SchemaBase&>(schema), schema.ToValues(record));
  }

  template <typename Record>
  rocksdb::Status LoadValues(std::string_view type,
                             const std::vector<std::string>& keys,
                             const Schema<Record>& schema,
                             std::map<std::string, Record>* out) const {
    if (!out) return rocksdb::Status::InvalidArgument("out is null");
    std::map<std::string, RecordValues> raw;
    rocksdb::Status s = LoadValues(type, keys, static_cast<const SchemaBase&>(schema), &raw);
    if (!s.ok()) return s;
    return Materialize(schema, raw, out);
  }

  template <typename Record>
  rocksdb::Status LoadValuesAll(std::string_view type,
                                const Schema<Record>& schema,
                                std::map<std::string, Record>* out) const {
    if (!out) return rocksdb::Status::InvalidArgument("out is null");
    std::map<std::string, RecordValues> raw;
    rocksdb::Status s = LoadValuesAll(type, static_cast<const SchemaBase&>(schema), &raw);
    if (!s.ok()) return s;
    return Materialize(schema, raw, out);
  }

  template <typename Record>
  rocksdb::Status LoadValuesByFilter(std::string_view type,
                                     const std::vector<std::string>& fields,
                                     const Schema<Record>& schema,
                                     const FieldFilter& filter,
                                     std::map<std::string, Record>* out) const {
    if (!out) return rocksdb::Status::InvalidArgument("out is null");
    std::map<std::string, RecordValues> raw;
    rocksdb::Status s = LoadValuesByFilter(
        type, fields, static_cast<const SchemaBase&>(schema), filter, &raw);
    if (!s.ok()) return s;
    return Materialize(schema, raw, out);
  }

 private:
  explicit Store(const Options& opt);

  template <typename Record>
  static rocksdb::Status Materialize(const Schema<Record>& schema,
                                     const std::map<std::string, RecordValues>& raw,
                                     std::map<std::string, Record>* out) {
    out->clear();
    for (const auto& [key, values] : raw) out->emplace(key, schema.FromValues(values));
    return rocksdb::Status::OK();
  }

  std::unique_ptr<Tx> NewReadTx() const;
  std::unique_ptr<Tx> NewWriteTx();

  // Run fn in a read (View) or write (Update) transaction.
  rocksdb::Status View(const std::function<rocksdb::Status(Tx*)>& fn) const;
  rocksdb::Status Update(const std::function<rocksdb::Status(Tx*)>& fn);

  Options opt_;

  rocksdb::TransactionDB* db_ = nullptr;
  std::vector<rocksdb::ColumnFamilyHandle*> handles_;
  rocksdb::ColumnFamilyHandle* buckets_cf_ = nullptr;
  std::shared_ptr<rocksdb::Cache> block_cache_;

  // Bucket writes read before they write; writers are serialized.
  std::mutex writer_mu_;
};

}  // namespace regstore
