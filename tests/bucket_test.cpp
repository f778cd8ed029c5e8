// Unit tests for regstore/bucket.hpp
// Tests: nested buckets, shared value/bucket namespace, ordering, transactions

#include <gtest/gtest.h>

#include <regstore/bucket.hpp>
#include <regstore/store.hpp>
#include <regstore/test_utils.hpp>

#include <memory>
#include <string>
#include <vector>

namespace regstore {
namespace {

class BucketTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Options opt;
    opt.path = dir_.Join("db");
    ASSERT_TRUE(Store::Open(opt, &store_).ok());
  }

  void TearDown() override { store_.reset(); }

  rocksdb::Status Write(const std::function<rocksdb::Status(Tx*)>& fn) {
    return store_->Execute(true, fn);
  }

  rocksdb::Status Read(const std::function<rocksdb::Status(Tx*)>& fn) {
    return store_->Execute(false, fn);
  }

  static std::vector<std::string> ChildBuckets(const Bucket& b) {
    std::vector<std::string> names;
    EXPECT_TRUE(b.ForEachBucket([&](std::string_view name) {
                   names.emplace_back(name);
                   return rocksdb::Status::OK();
                 }).ok());
    return names;
  }

  static std::vector<std::string> EntryKeys(const Bucket& b) {
    std::vector<std::string> keys;
    EXPECT_TRUE(b.ForEach([&](std::string_view key, std::string_view) {
                   keys.emplace_back(key);
                   return rocksdb::Status::OK();
                 }).ok());
    return keys;
  }

  testing::TempDir dir_;
  std::unique_ptr<Store> store_;
};

// =============================================================================
// Basic Put/Get
// =============================================================================

TEST_F(BucketTest, PutGetAcrossTransactions) {
  ASSERT_TRUE(Write([](Tx* tx) {
    Bucket a;
    auto s = tx->CreateBucketIfNotExists("a", &a);
    if (!s.ok()) return s;
    return a.Put("k", "v");
  }).ok());

  std::string value;
  ASSERT_TRUE(Read([&](Tx* tx) {
    Bucket a;
    auto s = tx->GetBucket("a", &a);
    if (!s.ok()) return s;
    return a.Get("k", &value);
  }).ok());
  EXPECT_EQ(value, "v");
}

TEST_F(BucketTest, MissingBucketAndKey) {
  ASSERT_TRUE(Read([](Tx* tx) {
    Bucket a;
    EXPECT_TRUE(tx->GetBucket("nope", &a).IsNotFound());
    EXPECT_FALSE(a.valid());

    std::string value;
    EXPECT_TRUE(tx->Root().Get("nope", &value).IsNotFound());
    return rocksdb::Status::OK();
  }).ok());
}

TEST_F(BucketTest, WritesVisibleInsideOwnTransaction) {
  ASSERT_TRUE(Write([](Tx* tx) {
    Bucket a;
    auto s = tx->CreateBucketIfNotExists("a", &a);
    if (!s.ok()) return s;
    s = a.Put("k", "v1");
    if (!s.ok()) return s;

    std::string value;
    s = a.Get("k", &value);
    EXPECT_TRUE(s.ok());
    EXPECT_EQ(value, "v1");

    Bucket again;
    EXPECT_TRUE(tx->GetBucket("a", &again).ok());
    return rocksdb::Status::OK();
  }).ok());
}

// =============================================================================
// Shared Namespace
// =============================================================================

TEST_F(BucketTest, ValueAndBucketNamesCollide) {
  ASSERT_TRUE(Write([](Tx* tx) {
    Bucket root = tx->Root();
    Bucket child;
    EXPECT_TRUE(root.CreateBucket("child", &child).ok());
    EXPECT_TRUE(root.CreateBucket("child", &child).IsInvalidArgument());
    EXPECT_TRUE(root.Put("child", "x").IsInvalidArgument());

    EXPECT_TRUE(root.Put("value", "x").ok());
    EXPECT_TRUE(root.CreateBucket("value", &child).IsInvalidArgument());
    EXPECT_TRUE(root.CreateBucketIfNotExists("value", &child).IsInvalidArgument());

    std::string v;
    EXPECT_TRUE(root.Get("child", &v).IsNotFound());
    return rocksdb::Status::OK();
  }).ok());
}

TEST_F(BucketTest, EmptyNamesRejected) {
  ASSERT_TRUE(Write([](Tx* tx) {
    Bucket root = tx->Root();
    Bucket child;
    EXPECT_TRUE(root.CreateBucket("", &child).IsInvalidArgument());
    EXPECT_TRUE(root.Put("", "x").IsInvalidArgument());
    return rocksdb::Status::OK();
  }).ok());
}

// =============================================================================
// Nesting, Ordering, Deletion
// =============================================================================

TEST_F(BucketTest, ChildrenAreDirectAndOrdered) {
  ASSERT_TRUE(Write([](Tx* tx) {
    Bucket t;
    auto s = tx->CreateBucketIfNotExists("svc", &t);
    if (!s.ok()) return s;
    for (const char* key : {"b", "a", "c"}) {
      Bucket rec;
      s = t.CreateBucket(key, &rec);
      if (!s.ok()) return s;
      Bucket grandchild;
      s = rec.CreateBucket("nested", &grandchild);
      if (!s.ok()) return s;
      s = rec.Put("z", "1");
      if (!s.ok()) return s;
      s = rec.Put("y", "2");
      if (!s.ok()) return s;
    }
    return rocksdb::Status::OK();
  }).ok());

  ASSERT_TRUE(Read([&](Tx* tx) {
    Bucket t;
    auto s = tx->GetBucket("svc", &t);
    if (!s.ok()) return s;
    EXPECT_EQ(ChildBuckets(t), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(EntryKeys(t).empty());

    uint64_t n = 0;
    EXPECT_TRUE(t.CountBuckets(&n).ok());
    EXPECT_EQ(n, 3u);

    Bucket rec;
    s = t.GetBucket("b", &rec);
    if (!s.ok()) return s;
    EXPECT_EQ(EntryKeys(rec), (std::vector<std::string>{"y", "z"}));
    EXPECT_EQ(ChildBuckets(rec), (std::vector<std::string>{"nested"}));
    EXPECT_EQ(rec.path(), (std::vector<std::string>{"svc", "b"}));
    EXPECT_EQ(rec.name(), "b");
    return rocksdb::Status::OK();
  }).ok());
}

TEST_F(BucketTest, PrefixNamesDoNotLeak) {
  ASSERT_TRUE(Write([](Tx* tx) {
    Bucket root = tx->Root();
    Bucket ab, a;
    auto s = root.CreateBucket("ab", &ab);
    if (!s.ok()) return s;
    s = ab.Put("inner", "1");
    if (!s.ok()) return s;
    s = root.CreateBucket("a", &a);
    if (!s.ok()) return s;
    return a.Put("own", "2");
  }).ok());

  ASSERT_TRUE(Read([&](Tx* tx) {
    Bucket a;
    auto s = tx->GetBucket("a", &a);
    if (!s.ok()) return s;
    EXPECT_EQ(EntryKeys(a), (std::vector<std::string>{"own"}));
    EXPECT_TRUE(ChildBuckets(a).empty());
    return rocksdb::Status::OK();
  }).ok());
}

TEST_F(BucketTest, NamesWithNulBytes) {
  const std::string odd("a\0b", 3);
  const std::string odd2("a\0", 2);
  ASSERT_TRUE(Write([&](Tx* tx) {
    Bucket root = tx->Root();
    Bucket b;
    auto s = root.CreateBucket(odd, &b);
    if (!s.ok()) return s;
    s = b.Put(odd2, odd);
    if (!s.ok()) return s;
    Bucket plain;
    return root.CreateBucket("a", &plain);
  }).ok());

  ASSERT_TRUE(Read([&](Tx* tx) {
    EXPECT_EQ(ChildBuckets(tx->Root()), (std::vector<std::string>{"a", odd}));
    Bucket b;
    auto s = tx->GetBucket(odd, &b);
    if (!s.ok()) return s;
    std::string value;
    s = b.Get(odd2, &value);
    if (!s.ok()) return s;
    EXPECT_EQ(value, odd);
    return rocksdb::Status::OK();
  }).ok());
}

TEST_F(BucketTest, DeleteBucketIsRecursive) {
  ASSERT_TRUE(Write([](Tx* tx) {
    Bucket root = tx->Root();
    Bucket top, mid, leaf;
    auto s = root.CreateBucket("top", &top);
    if (!s.ok()) return s;
    s = top.CreateBucket("mid", &mid);
    if (!s.ok()) return s;
    s = mid.CreateBucket("leaf", &leaf);
    if (!s.ok()) return s;
    s = leaf.Put("k", "v");
    if (!s.ok()) return s;
    return top.Put("k", "v");
  }).ok());

  ASSERT_TRUE(Write([](Tx* tx) { return tx->Root().DeleteBucket("top"); }).ok());

  ASSERT_TRUE(Write([&](Tx* tx) {
    Bucket top;
    EXPECT_TRUE(tx->GetBucket("top", &top).IsNotFound());

    // Recreating must start empty.
    auto s = tx->Root().CreateBucket("top", &top);
    if (!s.ok()) return s;
    EXPECT_TRUE(EntryKeys(top).empty());
    EXPECT_TRUE(ChildBuckets(top).empty());
    return rocksdb::Status::OK();
  }).ok());
}

TEST_F(BucketTest, DeleteMissingBucketIsNotFound) {
  ASSERT_TRUE(Write([](Tx* tx) {
    EXPECT_TRUE(tx->Root().DeleteBucket("ghost").IsNotFound());
    EXPECT_TRUE(tx->Root().Delete("ghost").ok());
    return rocksdb::Status::OK();
  }).ok());
}

TEST_F(BucketTest, ForEachStopsOnError) {
  ASSERT_TRUE(Write([](Tx* tx) {
    Bucket root = tx->Root();
    for (const char* k : {"a", "b", "c"}) {
      auto s = root.Put(k, "v");
      if (!s.ok()) return s;
    }
    return rocksdb::Status::OK();
  }).ok());

  int visited = 0;
  auto s = Read([&](Tx* tx) {
    return tx->Root().ForEach([&](std::string_view, std::string_view) {
      ++visited;
      return rocksdb::Status::Aborted("stop");
    });
  });
  EXPECT_TRUE(s.IsAborted());
  EXPECT_EQ(visited, 1);
}

// =============================================================================
// Transactions
// =============================================================================

TEST_F(BucketTest, ReadTransactionRejectsWrites) {
  ASSERT_TRUE(Read([](Tx* tx) {
    EXPECT_FALSE(tx->writable());
    Bucket b;
    EXPECT_TRUE(tx->Root().Put("k", "v").IsNotSupported());
    EXPECT_TRUE(tx->CreateBucketIfNotExists("b", &b).IsNotSupported());
    return rocksdb::Status::OK();
  }).ok());
}

TEST_F(BucketTest, FailedWriteRollsBack) {
  auto s = Write([](Tx* tx) {
    Bucket b;
    auto st = tx->CreateBucketIfNotExists("b", &b);
    if (!st.ok()) return st;
    st = b.Put("k", "v");
    if (!st.ok()) return st;
    return rocksdb::Status::Aborted("boom");
  });
  EXPECT_TRUE(s.IsAborted());

  ASSERT_TRUE(Read([](Tx* tx) {
    Bucket b;
    EXPECT_TRUE(tx->GetBucket("b", &b).IsNotFound());
    return rocksdb::Status::OK();
  }).ok());
}

TEST_F(BucketTest, ReadSnapshotIgnoresLaterCommits) {
  std::unique_ptr<Tx> reader;
  ASSERT_TRUE(store_->BeginTransaction(false, &reader).ok());

  ASSERT_TRUE(Write([](Tx* tx) {
    Bucket b;
    return tx->CreateBucketIfNotExists("late", &b);
  }).ok());

  Bucket b;
  EXPECT_TRUE(reader->GetBucket("late", &b).IsNotFound());
  EXPECT_TRUE(reader->Rollback().ok());

  ASSERT_TRUE(store_->BeginTransaction(false, &reader).ok());
  EXPECT_TRUE(reader->GetBucket("late", &b).ok());
}

TEST_F(BucketTest, ManualCommitAndDestructorRollback) {
  {
    std::unique_ptr<Tx> tx;
    ASSERT_TRUE(store_->BeginTransaction(true, &tx).ok());
    Bucket b;
    ASSERT_TRUE(tx->CreateBucketIfNotExists("dropped", &b).ok());
    // tx destroyed without Commit
  }
  {
    std::unique_ptr<Tx> tx;
    ASSERT_TRUE(store_->BeginTransaction(true, &tx).ok());
    Bucket b;
    ASSERT_TRUE(tx->CreateBucketIfNotExists("kept", &b).ok());
    ASSERT_TRUE(tx->Commit().ok());

    // A finished transaction refuses further use.
    EXPECT_TRUE(tx->GetBucket("kept", &b).IsInvalidArgument());
    EXPECT_TRUE(tx->Rollback().ok());
  }

  ASSERT_TRUE(Read([](Tx* tx) {
    Bucket b;
    EXPECT_TRUE(tx->GetBucket("dropped", &b).IsNotFound());
    EXPECT_TRUE(tx->GetBucket("kept", &b).ok());
    return rocksdb::Status::OK();
  }).ok());
}

}  // namespace
}  // namespace regstore
