#include <regstore/bucket.hpp>

#include <rocksdb/utilities/transaction.h>

#include <regstore/internal.hpp>

namespace regstore {

using internal::kBucketMarkerKind;
using internal::kValueEntryKind;

// --------------------------
// Tx
// --------------------------

Tx::Tx(rocksdb::TransactionDB* db,
       rocksdb::ColumnFamilyHandle* cf,
       std::unique_lock<std::mutex> writer_lock,
       int64_t lock_timeout_ms)
    : db_(db), cf_(cf), writable_(true), writer_lock_(std::move(writer_lock)) {
  rocksdb::WriteOptions wo;
  rocksdb::TransactionOptions to;
  to.set_snapshot = true;
  to.lock_timeout = lock_timeout_ms;
  txn_.reset(db_->BeginTransaction(wo, to));
  if (txn_) ro_.snapshot = txn_->GetSnapshot();
}

Tx::Tx(rocksdb::TransactionDB* db, rocksdb::ColumnFamilyHandle* cf)
    : db_(db), cf_(cf), writable_(false) {
  snapshot_ = db_->GetSnapshot();
  ro_.snapshot = snapshot_;
}

Tx::~Tx() {
  if (!done_) (void)Rollback();
}

void Tx::Release() {
  done_ = true;
  if (snapshot_) {
    db_->ReleaseSnapshot(snapshot_);
    snapshot_ = nullptr;
  }
  txn_.reset();
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

rocksdb::Status Tx::Check() const {
  if (done_) return rocksdb::Status::InvalidArgument("transaction is closed");
  if (writable_ && !txn_) return rocksdb::Status::IOError("BeginTransaction returned null");
  return rocksdb::Status::OK();
}

rocksdb::Status Tx::CheckWritable() const {
  rocksdb::Status s = Check();
  if (!s.ok()) return s;
  if (!writable_) return rocksdb::Status::NotSupported("transaction is read-only");
  return rocksdb::Status::OK();
}

Bucket Tx::Root() { return Bucket(this, {}); }

rocksdb::Status Tx::GetBucket(std::string_view name, Bucket* out) {
  return Root().GetBucket(name, out);
}

rocksdb::Status Tx::CreateBucketIfNotExists(std::string_view name, Bucket* out) {
  Bucket root = Root();
  return root.CreateBucketIfNotExists(name, out);
}

rocksdb::Status Tx::Commit() {
  rocksdb::Status s = Check();
  if (!s.ok()) return s;
  if (writable_) s = txn_->Commit();
  Release();
  return s;
}

rocksdb::Status Tx::Rollback() {
  if (done_) return rocksdb::Status::OK();
  rocksdb::Status s;
  if (txn_) s = txn_->Rollback();
  Release();
  return s;
}

rocksdb::Status Tx::RawGet(const std::string& key, std::string* value) const {
  if (writable_) return txn_->Get(ro_, cf_, rocksdb::Slice(key), value);
  return db_->Get(ro_, cf_, rocksdb::Slice(key), value);
}

rocksdb::Status Tx::RawPut(const std::string& key, rocksdb::Slice value) {
  return txn_->Put(cf_, rocksdb::Slice(key), value);
}

rocksdb::Status Tx::RawDelete(const std::string& key) {
  return txn_->Delete(cf_, rocksdb::Slice(key));
}

rocksdb::Status Tx::RawScan(
    const std::string& prefix,
    const std::function<rocksdb::Status(rocksdb::Slice key, rocksdb::Slice value)>& fn) const {
  std::unique_ptr<rocksdb::Iterator> it(
      writable_ ? txn_->GetIterator(ro_, cf_) : db_->NewIterator(ro_, cf_));
  rocksdb::Slice prefix_slice(prefix);
  for (it->Seek(prefix_slice); it->Valid(); it->Next()) {
    if (!it->key().starts_with(prefix_slice)) break;
    rocksdb::Slice suffix(it->key().data() + prefix.size(), it->key().size() - prefix.size());
    rocksdb::Status s = fn(suffix, it->value());
    if (!s.ok()) return s;
  }
  return it->status();
}

// --------------------------
// Bucket
// --------------------------

std::vector<std::string> Bucket::ChildPath(std::string_view name) const {
  std::vector<std::string> child = path_;
  child.emplace_back(name);
  return child;
}

rocksdb::Status Bucket::Get(std::string_view key, std::string* value) const {
  if (!tx_) return rocksdb::Status::InvalidArgument("bucket is not bound to a transaction");
  if (!value) return rocksdb::Status::InvalidArgument("value is null");
  rocksdb::Status s = tx_->Check();
  if (!s.ok()) return s;
  if (key.empty()) return rocksdb::Status::NotFound();
  return tx_->RawGet(internal::MakeChildKey(kValueEntryKind, path_, key), value);
}

rocksdb::Status Bucket::Put(std::string_view key, std::string_view value) {
  if (!tx_) return rocksdb::Status::InvalidArgument("bucket is not bound to a transaction");
  rocksdb::Status s = tx_->CheckWritable();
  if (!s.ok()) return s;
  if (key.empty()) return rocksdb::Status::InvalidArgument("key required");

  std::string ignored;
  s = tx_->RawGet(internal::MakeChildKey(kBucketMarkerKind, path_, key), &ignored);
  if (s.ok()) return rocksdb::Status::InvalidArgument("incompatible value");
  if (!s.IsNotFound()) return s;

  return tx_->RawPut(internal::MakeChildKey(kValueEntryKind, path_, key),
                     rocksdb::Slice(value.data(), value.size()));
}

rocksdb::Status Bucket::Delete(std::string_view key) {
  if (!tx_) return rocksdb::Status::InvalidArgument("bucket is not bound to a transaction");
  rocksdb::Status s = tx_->CheckWritable();
  if (!s.ok()) return s;
  if (key.empty()) return rocksdb::Status::OK();
  return tx_->RawDelete(internal::MakeChildKey(kValueEntryKind, path_, key));
}

rocksdb::Status Bucket::HasBucket(std::string_view name, bool* exists) const {
  if (!tx_) return rocksdb::Status::InvalidArgument("bucket is not bound to a transaction");
  if (!exists) return rocksdb::Status::InvalidArgument("exists is null");
  rocksdb::Status s = tx_->Check();
  if (!s.ok()) return s;

  *exists = false;
  if (name.empty()) return rocksdb::Status::OK();

  std::string ignored;
  s = tx_->RawGet(internal::MakeChildKey(kBucketMarkerKind, path_, name), &ignored);
  if (s.IsNotFound()) return rocksdb::Status::OK();
  if (!s.ok()) return s;
  *exists = true;
  return rocksdb::Status::OK();
}

rocksdb::Status Bucket::GetBucket(std::string_view name, Bucket* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  bool exists = false;
  rocksdb::Status s = HasBucket(name, &exists);
  if (!s.ok()) return s;
  if (!exists) return rocksdb::Status::NotFound("bucket not found");
  *out = Bucket(tx_, ChildPath(name));
  return rocksdb::Status::OK();
}

rocksdb::Status Bucket::CreateBucket(std::string_view name, Bucket* out) {
  if (!tx_) return rocksdb::Status::InvalidArgument("bucket is not bound to a transaction");
  rocksdb::Status s = tx_->CheckWritable();
  if (!s.ok()) return s;
  if (name.empty()) return rocksdb::Status::InvalidArgument("bucket name required");
  if (path_.size() >= internal::kMaxBucketDepth) {
    return rocksdb::Status::InvalidArgument("bucket nesting too deep");
  }

  const std::string marker = internal::MakeChildKey(kBucketMarkerKind, path_, name);
  std::string ignored;
  s = tx_->RawGet(marker, &ignored);
  if (s.ok()) return rocksdb::Status::InvalidArgument("bucket already exists");
  if (!s.IsNotFound()) return s;

  s = tx_->RawGet(internal::MakeChildKey(kValueEntryKind, path_, name), &ignored);
  if (s.ok()) return rocksdb::Status::InvalidArgument("incompatible value");
  if (!s.IsNotFound()) return s;

  s = tx_->RawPut(marker, rocksdb::Slice());
  if (!s.ok()) return s;
  if (out) *out = Bucket(tx_, ChildPath(name));
  return rocksdb::Status::OK();
}

rocksdb::Status Bucket::CreateBucketIfNotExists(std::string_view name, Bucket* out) {
  bool exists = false;
  rocksdb::Status s = HasBucket(name, &exists);
  if (!s.ok()) return s;
  if (exists) {
    if (out) *out = Bucket(tx_, ChildPath(name));
    return rocksdb::Status::OK();
  }
  return CreateBucket(name, out);
}

rocksdb::Status Bucket::DeleteBucket(std::string_view name) {
  if (!tx_) return rocksdb::Status::InvalidArgument("bucket is not bound to a transaction");
  rocksdb::Status s = tx_->CheckWritable();
  if (!s.ok()) return s;

  Bucket child;
  s = GetBucket(name, &child);
  if (!s.ok()) return s;

  // Collect first; the scan must not observe its own deletes.
  std::vector<std::string> grandchildren;
  s = child.ForEachBucket([&](std::string_view n) {
    grandchildren.emplace_back(n);
    return rocksdb::Status::OK();
  });
  if (!s.ok()) return s;
  for (const auto& g : grandchildren) {
    s = child.DeleteBucket(g);
    if (!s.ok()) return s;
  }

  const std::string value_prefix = internal::MakeChildPrefix(kValueEntryKind, child.path_);
  std::vector<std::string> value_keys;
  s = tx_->RawScan(value_prefix, [&](rocksdb::Slice suffix, rocksdb::Slice) {
    value_keys.push_back(value_prefix + suffix.ToString());
    return rocksdb::Status::OK();
  });
  if (!s.ok()) return s;
  for (const auto& k : value_keys) {
    s = tx_->RawDelete(k);
    if (!s.ok()) return s;
  }

  return tx_->RawDelete(internal::MakeChildKey(kBucketMarkerKind, path_, name));
}

rocksdb::Status Bucket::ForEach(
    const std::function<rocksdb::Status(std::string_view key,
                                        std::string_view value)>& fn) const {
  if (!tx_) return rocksdb::Status::InvalidArgument("bucket is not bound to a transaction");
  rocksdb::Status s = tx_->Check();
  if (!s.ok()) return s;

  std::string key;
  return tx_->RawScan(internal::MakeChildPrefix(kValueEntryKind, path_),
                      [&](rocksdb::Slice suffix, rocksdb::Slice value) {
                        if (!internal::Unescape(std::string_view(suffix.data(), suffix.size()), &key)) {
                          return rocksdb::Status::Corruption("malformed value key");
                        }
                        return fn(key, std::string_view(value.data(), value.size()));
                      });
}

rocksdb::Status Bucket::ForEachBucket(
    const std::function<rocksdb::Status(std::string_view name)>& fn) const {
  if (!tx_) return rocksdb::Status::InvalidArgument("bucket is not bound to a transaction");
  rocksdb::Status s = tx_->Check();
  if (!s.ok()) return s;

  std::string name;
  return tx_->RawScan(internal::MakeChildPrefix(kBucketMarkerKind, path_),
                      [&](rocksdb::Slice suffix, rocksdb::Slice) {
                        if (!internal::Unescape(std::string_view(suffix.data(), suffix.size()), &name)) {
                          return rocksdb::Status::Corruption("malformed bucket key");
                        }
                        return fn(name);
                      });
}

rocksdb::Status Bucket::CountBuckets(uint64_t* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  uint64_t count = 0;
  rocksdb::Status s = ForEachBucket([&](std::string_view) {
    ++count;
    return rocksdb::Status::OK();
  });
  if (!s.ok()) return s;
  *out = count;
  return rocksdb::Status::OK();
}

}  // namespace regstore
