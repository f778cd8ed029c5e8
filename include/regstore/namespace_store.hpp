#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <rocksdb/status.h>

#include <regstore/model.hpp>
#include <regstore/store.hpp>

namespace regstore {

/**
 * regstore::NamespaceStore
 *
 * Namespace persistence on top of the generic object store. Records live in
 * the "namespace" type bucket keyed by namespace name.
 */
class NamespaceStore {
 public:
  explicit NamespaceStore(Store* store) : store_(store) {}

  /** Create the built-in namespaces ("default", "Polaris") if absent. */
  rocksdb::Status InitData();

  /** Save a new namespace. Name, owner and token are required; sets valid. */
  rocksdb::Status AddNamespace(model::Namespace* ns);

  /** Update owner and comment, stamping modify_time. */
  rocksdb::Status UpdateNamespace(const model::Namespace& ns);

  /** Replace the token, stamping modify_time. */
  rocksdb::Status UpdateNamespaceToken(const std::string& name, const std::string& token);

  /** Namespaces whose owner contains owner. */
  rocksdb::Status ListNamespaces(const std::string& owner,
                                 std::vector<model::Namespace>* out) const;

  /** NotFound if there is no such namespace. */
  rocksdb::Status GetNamespace(const std::string& name, model::Namespace* out) const;

  /**
   * One page of namespaces, newest modify_time first. The page starts at
   * offset * limit; a page past the end is empty.
   */
  rocksdb::Status GetNamespaces(uint32_t offset,
                                uint32_t limit,
                                std::vector<model::Namespace>* out) const;

  /** Namespaces modified strictly after mtime. */
  rocksdb::Status GetMoreNamespaces(Timestamp mtime, std::vector<model::Namespace>* out) const;

 private:
  Store* store_;
};

}  // namespace regstore
