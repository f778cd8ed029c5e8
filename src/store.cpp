#include <regstore/store.hpp>

#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <rocksdb/utilities/transaction.h>

#include <chrono>
#include <thread>

#include <spdlog/spdlog.h>

#include <regstore/internal.hpp>
#include <regstore/version.hpp>

namespace regstore {

namespace {

constexpr const char* kBucketsCF = "regstore_buckets";
constexpr int kOpenRetryIntervalMs = 50;

// --------------------------
// Observability helpers
// --------------------------
inline void EmitCounter(const regstore::Options& opt,
                        const std::string& name,
                        uint64_t delta = 1) {
  if (opt.metrics) opt.metrics->Counter(name, delta);
}

inline void EmitHistogram(const regstore::Options& opt,
                          const std::string& name,
                          uint64_t value) {
  if (opt.metrics) opt.metrics->Histogram(name, value);
}

// Map RocksDB statuses to low-cardinality strings for tracing.
// (Avoid putting status.ToString() into attributes; it's high-cardinality.)
inline std::string_view StatusKind(const rocksdb::Status& s) {
  if (s.ok()) return "ok";
  if (s.IsNotFound()) return "not_found";
  if (s.IsInvalidArgument()) return "invalid_argument";
  if (s.IsNotSupported()) return "not_supported";
  if (s.IsTimedOut()) return "timed_out";
  if (s.IsBusy()) return "busy";
  if (s.IsAborted()) return "aborted";
  if (s.IsCorruption()) return "corruption";
  if (s.IsIOError()) return "io_error";
  return "other";
}

inline void SpanAttr(regstore::TraceSpan* span,
                     std::string_view key,
                     uint64_t value) {
  if (span) span->SetAttribute(key, value);
}

inline void SpanAttr(regstore::TraceSpan* span,
                     std::string_view key,
                     std::string_view value) {
  if (span) span->SetAttribute(key, value);
}

// Per-operation metrics and span: "<prefix>.calls", "<prefix>.latency_us",
// "<prefix>.ok_total" / "<prefix>.error_total".
class OpScope {
 public:
  OpScope(const regstore::Options& opt, std::string_view metric, std::string_view span_name)
      : opt_(opt), prefix_("regstore." + std::string(metric)),
        start_us_(internal::NowMicros()) {
    EmitCounter(opt_, prefix_ + ".calls", 1);
    if (opt_.tracer) span_ = opt_.tracer->StartSpan(span_name);
  }

  TraceSpan* span() const { return span_.get(); }

  rocksdb::Status Finish(const rocksdb::Status& st) {
    const uint64_t dur_us = internal::NowMicros() - start_us_;
    EmitHistogram(opt_, prefix_ + ".latency_us", dur_us);
    EmitCounter(opt_, prefix_ + (st.ok() ? ".ok_total" : ".error_total"), 1);
    if (span_) {
      SpanAttr(span_.get(), "latency_us", dur_us);
      SpanAttr(span_.get(), "status", StatusKind(st));
      span_->End(st);
      span_.reset();
    }
    return st;
  }

 private:
  const regstore::Options& opt_;
  std::string prefix_;
  uint64_t start_us_;
  std::unique_ptr<TraceSpan> span_;
};

// Helper: build a ColumnFamilyOptions with shared cache + bloom
rocksdb::ColumnFamilyOptions MakeCFOptions(const std::shared_ptr<rocksdb::Cache>& cache,
                                           int bloom_bits_per_key) {
  rocksdb::BlockBasedTableOptions table;
  table.block_cache = cache;
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(bloom_bits_per_key, false));
  table.whole_key_filtering = true;

  rocksdb::ColumnFamilyOptions cfo;
  cfo.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));
  return cfo;
}

rocksdb::Status ListKeys(const Bucket& type_bucket, std::vector<std::string>* keys) {
  keys->clear();
  return type_bucket.ForEachBucket([&](std::string_view name) {
    keys->emplace_back(name);
    return rocksdb::Status::OK();
  });
}

rocksdb::Status LoadRecordsLocked(const Bucket& type_bucket,
                                  const std::vector<std::string>& keys,
                                  const SchemaBase& schema,
                                  std::map<std::string, RecordValues>* out) {
  for (const auto& key : keys) {
    Bucket record;
    rocksdb::Status s = type_bucket.GetBucket(key, &record);
    if (s.IsNotFound()) continue;
    if (!s.ok()) return s;

    RecordValues values;
    s = DeserializeRecord(record, schema, &values);
    if (!s.ok()) return s;
    (*out)[key] = std::move(values);
  }
  return rocksdb::Status::OK();
}

rocksdb::Status MatchRecordLocked(const Bucket& record,
                                  const std::vector<std::string>& fields,
                                  const SchemaBase& schema,
                                  const FieldFilter& filter,
                                  bool* matched) {
  *matched = true;
  if (fields.empty() || !filter) return rocksdb::Status::OK();

  FieldValues field_values;
  for (const auto& field : fields) {
    Value value;
    rocksdb::Status s = ReadField(record, schema, field, &value);
    if (!s.ok()) return s;
    if (!HasValue(value)) continue;
    field_values.emplace(field, std::move(value));
  }
  *matched = filter(field_values);
  return rocksdb::Status::OK();
}

}  // namespace

Store::Store(const Options& opt) : opt_(opt) {}

Store::~Store() { Close(); }

rocksdb::Status Store::Open(const Options& opt, std::unique_ptr<Store>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (opt.path.empty()) return rocksdb::Status::InvalidArgument("path is empty");

  auto store = std::unique_ptr<Store>(new Store(opt));

  rocksdb::Options options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;

  rocksdb::TransactionDBOptions txn_opts;
  txn_opts.transaction_lock_timeout = opt.lock_timeout_ms;

  auto cache = rocksdb::NewLRUCache(opt.block_cache_bytes);
  store->block_cache_ = cache;

  std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
  cfs.emplace_back(rocksdb::kDefaultColumnFamilyName, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kBucketsCF, MakeCFOptions(cache, opt.bloom_bits_per_key));

  std::vector<rocksdb::ColumnFamilyHandle*> handles;
  rocksdb::TransactionDB* db = nullptr;

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(opt.open_timeout_ms);
  bool warned = false;
  rocksdb::Status s;
  for (;;) {
    s = rocksdb::TransactionDB::Open(options, txn_opts, opt.path, cfs, &handles, &db);
    if (s.ok()) break;
    for (auto* h : handles) delete h;
    handles.clear();
    if (!internal::IsFileLockStatus(s) || std::chrono::steady_clock::now() >= deadline) {
      return s;
    }
    if (!warned) {
      spdlog::warn("[regstore] {} is locked by another handle, waiting up to {} ms",
                   opt.path, opt.open_timeout_ms);
      warned = true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kOpenRetryIntervalMs));
  }

  store->db_ = db;
  store->handles_ = std::move(handles);

  // Descriptor order = handle order
  store->buckets_cf_ = store->handles_[1];

  spdlog::info("[regstore] opened store at {} (regstore {})", opt.path, Version());
  *out = std::move(store);
  return rocksdb::Status::OK();
}

void Store::Close() {
  if (!db_) return;

  for (auto* h : handles_) delete h;
  handles_.clear();
  delete db_;
  db_ = nullptr;
  buckets_cf_ = nullptr;
  spdlog::info("[regstore] closed store at {}", opt_.path);
}

std::unique_ptr<Tx> Store::NewReadTx() const {
  return std::unique_ptr<Tx>(new Tx(db_, buckets_cf_));
}

std::unique_ptr<Tx> Store::NewWriteTx() {
  std::unique_lock<std::mutex> lock(writer_mu_);
  return std::unique_ptr<Tx>(new Tx(db_, buckets_cf_, std::move(lock), opt_.lock_timeout_ms));
}

rocksdb::Status Store::View(const std::function<rocksdb::Status(Tx*)>& fn) const {
  std::unique_ptr<Tx> tx = NewReadTx();
  rocksdb::Status s = fn(tx.get());
  rocksdb::Status r = tx->Rollback();
  return s.ok() ? r : s;
}

rocksdb::Status Store::Update(const std::function<rocksdb::Status(Tx*)>& fn) {
  std::unique_ptr<Tx> tx = NewWriteTx();
  rocksdb::Status s = tx->Check();
  if (!s.ok()) return s;

  s = fn(tx.get());
  if (!s.ok()) {
    rocksdb::Status r = tx->Rollback();
    if (!r.ok()) spdlog::warn("[regstore] rollback failed: {}", r.ToString());
    return s;
  }
  return tx->Commit();
}

rocksdb::Status Store::Execute(bool writable, const std::function<rocksdb::Status(Tx*)>& fn) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!fn) return rocksdb::Status::InvalidArgument("fn is empty");
  return writable ? Update(fn) : View(fn);
}

rocksdb::Status Store::BeginTransaction(bool writable, std::unique_ptr<Tx>* out) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::unique_ptr<Tx> tx = writable ? NewWriteTx() : NewReadTx();
  rocksdb::Status s = tx->Check();
  if (!s.ok()) return s;
  *out = std::move(tx);
  return rocksdb::Status::OK();
}

rocksdb::Status Store::SaveValue(std::string_view type,
                                 std::string_view key,
                                 const SchemaBase& schema,
                                 const RecordValues& values) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  OpScope op(opt_, "save", "regstore.SaveValue");
  SpanAttr(op.span(), "type", type);

  return op.Finish(Update([&](Tx* tx) {
    Bucket type_bucket;
    rocksdb::Status s = tx->CreateBucketIfNotExists(type, &type_bucket);
    if (!s.ok()) return s;

    // Drop the previous shape entirely before writing the new one.
    bool exists = false;
    s = type_bucket.HasBucket(key, &exists);
    if (!s.ok()) return s;
    if (exists) {
      s = type_bucket.DeleteBucket(key);
      if (!s.ok()) return s;
    }

    Bucket record;
    s = type_bucket.CreateBucket(key, &record);
    if (!s.ok()) return s;

    std::map<std::string, std::string> buffers;
    s = SerializeRecord(schema, values, &record, &buffers);
    if (!s.ok()) return s;
    for (const auto& [field_key, buffer] : buffers) {
      s = record.Put(field_key, buffer);
      if (!s.ok()) return s;
    }
    return rocksdb::Status::OK();
  }));
}

rocksdb::Status Store::LoadValues(std::string_view type,
                                  const std::vector<std::string>& keys,
                                  const SchemaBase& schema,
                                  std::map<std::string, RecordValues>* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  out->clear();
  if (keys.empty()) return rocksdb::Status::OK();

  OpScope op(opt_, "load", "regstore.LoadValues");
  SpanAttr(op.span(), "type", type);
  SpanAttr(op.span(), "keys", static_cast<uint64_t>(keys.size()));

  std::map<std::string, RecordValues> values;
  rocksdb::Status s = View([&](Tx* tx) {
    Bucket type_bucket;
    rocksdb::Status st = tx->GetBucket(type, &type_bucket);
    if (st.IsNotFound()) return rocksdb::Status::OK();
    if (!st.ok()) return st;
    return LoadRecordsLocked(type_bucket, keys, schema, &values);
  });
  if (s.ok()) {
    EmitHistogram(opt_, "regstore.load.records", static_cast<uint64_t>(values.size()));
    *out = std::move(values);
  }
  return op.Finish(s);
}

rocksdb::Status Store::LoadValuesAll(std::string_view type,
                                     const SchemaBase& schema,
                                     std::map<std::string, RecordValues>* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  OpScope op(opt_, "load_all", "regstore.LoadValuesAll");
  SpanAttr(op.span(), "type", type);

  out->clear();
  std::map<std::string, RecordValues> values;
  rocksdb::Status s = View([&](Tx* tx) {
    Bucket type_bucket;
    rocksdb::Status st = tx->GetBucket(type, &type_bucket);
    if (st.IsNotFound()) return rocksdb::Status::OK();
    if (!st.ok()) return st;

    std::vector<std::string> keys;
    st = ListKeys(type_bucket, &keys);
    if (!st.ok()) return st;
    return LoadRecordsLocked(type_bucket, keys, schema, &values);
  });
  if (s.ok()) *out = std::move(values);
  return op.Finish(s);
}

rocksdb::Status Store::LoadValuesByFilter(std::string_view type,
                                          const std::vector<std::string>& fields,
                                          const SchemaBase& schema,
                                          const FieldFilter& filter,
                                          std::map<std::string, RecordValues>* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  OpScope op(opt_, "load_filter", "regstore.LoadValuesByFilter");
  SpanAttr(op.span(), "type", type);
  SpanAttr(op.span(), "fields", static_cast<uint64_t>(fields.size()));

  out->clear();
  uint64_t scanned = 0;
  std::map<std::string, RecordValues> values;
  rocksdb::Status s = View([&](Tx* tx) {
    Bucket type_bucket;
    rocksdb::Status st = tx->GetBucket(type, &type_bucket);
    if (st.IsNotFound()) return rocksdb::Status::OK();
    if (!st.ok()) return st;

    std::vector<std::string> keys;
    st = ListKeys(type_bucket, &keys);
    if (!st.ok()) return st;

    for (const auto& key : keys) {
      Bucket record;
      st = type_bucket.GetBucket(key, &record);
      if (st.IsNotFound()) {
        spdlog::warn("[regstore] bucket not found for key {}, type {}", key, type);
        continue;
      }
      if (!st.ok()) return st;
      ++scanned;

      bool matched = false;
      st = MatchRecordLocked(record, fields, schema, filter, &matched);
      if (!st.ok()) return st;
      if (!matched) continue;

      RecordValues record_values;
      st = DeserializeRecord(record, schema, &record_values);
      if (!st.ok()) return st;
      values[key] = std::move(record_values);
    }
    return rocksdb::Status::OK();
  });
  if (s.ok()) {
    EmitHistogram(opt_, "regstore.load_filter.scanned", scanned);
    EmitHistogram(opt_, "regstore.load_filter.matched", static_cast<uint64_t>(values.size()));
    *out = std::move(values);
  }
  return op.Finish(s);
}

rocksdb::Status Store::IterateFields(std::string_view type,
                                     std::string_view field,
                                     const SchemaBase& schema,
                                     const FieldVisitor& visit) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!visit) return rocksdb::Status::OK();

  OpScope op(opt_, "iterate", "regstore.IterateFields");
  SpanAttr(op.span(), "type", type);

  return op.Finish(View([&](Tx* tx) {
    Bucket type_bucket;
    rocksdb::Status st = tx->GetBucket(type, &type_bucket);
    if (st.IsNotFound()) return rocksdb::Status::OK();
    if (!st.ok()) return st;

    std::vector<std::string> keys;
    st = ListKeys(type_bucket, &keys);
    if (!st.ok()) return st;

    for (const auto& key : keys) {
      Bucket record;
      st = type_bucket.GetBucket(key, &record);
      if (st.IsNotFound()) {
        spdlog::warn("[regstore] bucket not found for key {}, type {}", key, type);
        continue;
      }
      if (!st.ok()) return st;

      Value value;
      st = ReadField(record, schema, field, &value);
      if (!st.ok()) return st;
      visit(value);
    }
    return rocksdb::Status::OK();
  }));
}

rocksdb::Status Store::UpdateValue(std::string_view type,
                                   std::string_view key,
                                   const FieldValues& properties) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  OpScope op(opt_, "update", "regstore.UpdateValue");
  SpanAttr(op.span(), "type", type);
  SpanAttr(op.span(), "properties", static_cast<uint64_t>(properties.size()));

  return op.Finish(Update([&](Tx* tx) {
    Bucket type_bucket;
    rocksdb::Status s = tx->GetBucket(type, &type_bucket);
    if (s.IsNotFound()) return rocksdb::Status::OK();
    if (!s.ok()) return s;

    Bucket record;
    s = type_bucket.GetBucket(key, &record);
    if (s.IsNotFound()) return rocksdb::Status::OK();
    if (!s.ok()) return s;

    for (const auto& [name, value] : properties) {
      s = WriteField(&record, name, value);
      if (!s.ok()) return s;
    }
    return rocksdb::Status::OK();
  }));
}

rocksdb::Status Store::DeleteValues(std::string_view type, const std::vector<std::string>& keys) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (keys.empty()) return rocksdb::Status::OK();

  OpScope op(opt_, "delete", "regstore.DeleteValues");
  SpanAttr(op.span(), "type", type);
  SpanAttr(op.span(), "keys", static_cast<uint64_t>(keys.size()));

  return op.Finish(Update([&](Tx* tx) {
    Bucket type_bucket;
    rocksdb::Status s = tx->GetBucket(type, &type_bucket);
    if (s.IsNotFound()) return rocksdb::Status::OK();
    if (!s.ok()) return s;

    for (const auto& key : keys) {
      bool exists = false;
      s = type_bucket.HasBucket(key, &exists);
      if (!s.ok()) return s;
      if (!exists) continue;
      s = type_bucket.DeleteBucket(key);
      if (!s.ok()) return s;
    }
    return rocksdb::Status::OK();
  }));
}

rocksdb::Status Store::CountValues(std::string_view type, uint64_t* out_count) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out_count) return rocksdb::Status::InvalidArgument("out_count is null");

  OpScope op(opt_, "count", "regstore.CountValues");
  SpanAttr(op.span(), "type", type);

  uint64_t count = 0;
  rocksdb::Status s = View([&](Tx* tx) {
    Bucket type_bucket;
    rocksdb::Status st = tx->GetBucket(type, &type_bucket);
    if (st.IsNotFound()) return rocksdb::Status::OK();
    if (!st.ok()) return st;
    return type_bucket.CountBuckets(&count);
  });
  if (s.ok()) *out_count = count;
  return op.Finish(s);
}

}  // namespace regstore
