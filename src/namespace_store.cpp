#include <regstore/namespace_store.hpp>

#include <algorithm>
#include <map>

namespace regstore {

namespace {

constexpr const char* kDefaultNamespace = "default";
constexpr const char* kPolarisNamespace = "Polaris";

struct BuiltinNamespace {
  const char* name;
  const char* comment;
  const char* token;
};

const BuiltinNamespace kBuiltinNamespaces[] = {
    {kDefaultNamespace, "Default Environment", "e2e473081d3d4306b52264e49f7ce227"},
    {kPolarisNamespace, "Polaris-server", "2d1bfe5d12e04d54b8ee69e62494c7fd"},
};

std::vector<model::Namespace> ToNamespaces(std::map<std::string, model::Namespace>* values) {
  std::vector<model::Namespace> out;
  out.reserve(values->size());
  for (auto& [key, ns] : *values) out.push_back(std::move(ns));
  return out;
}

}  // namespace

rocksdb::Status NamespaceStore::InitData() {
  for (const auto& builtin : kBuiltinNamespaces) {
    model::Namespace existing;
    rocksdb::Status s = GetNamespace(builtin.name, &existing);
    if (s.ok()) continue;
    if (!s.IsNotFound()) return s;

    model::Namespace ns;
    ns.name = builtin.name;
    ns.comment = builtin.comment;
    ns.token = builtin.token;
    ns.owner = "polaris";
    ns.create_time = TimestampNow();
    ns.modify_time = ns.create_time;
    s = AddNamespace(&ns);
    if (!s.ok()) return s;
  }
  return rocksdb::Status::OK();
}

rocksdb::Status NamespaceStore::AddNamespace(model::Namespace* ns) {
  if (!ns) return rocksdb::Status::InvalidArgument("namespace is null");
  if (ns->name.empty() || ns->owner.empty() || ns->token.empty()) {
    return rocksdb::Status::InvalidArgument("store add namespace some param are empty");
  }
  ns->valid = true;
  return store_->SaveValue(model::kNamespaceType, ns->name, model::NamespaceSchema(), *ns);
}

rocksdb::Status NamespaceStore::UpdateNamespace(const model::Namespace& ns) {
  if (ns.name.empty() || ns.owner.empty()) {
    return rocksdb::Status::InvalidArgument("store update namespace some param are empty");
  }
  FieldValues properties;
  properties["Owner"] = ns.owner;
  properties["Comment"] = ns.comment;
  properties["ModifyTime"] = TimestampNow();
  return store_->UpdateValue(model::kNamespaceType, ns.name, properties);
}

rocksdb::Status NamespaceStore::UpdateNamespaceToken(const std::string& name,
                                                     const std::string& token) {
  if (name.empty() || token.empty()) {
    return rocksdb::Status::InvalidArgument("update namespace token missing some params");
  }
  FieldValues properties;
  properties["Token"] = token;
  properties["ModifyTime"] = TimestampNow();
  return store_->UpdateValue(model::kNamespaceType, name, properties);
}

rocksdb::Status NamespaceStore::ListNamespaces(const std::string& owner,
                                               std::vector<model::Namespace>* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (owner.empty()) return rocksdb::Status::InvalidArgument("store list namespaces owner is empty");

  std::map<std::string, model::Namespace> values;
  rocksdb::Status s = store_->LoadValuesByFilter(
      model::kNamespaceType, {"Owner"}, model::NamespaceSchema(),
      [&owner](const FieldValues& fields) {
        auto it = fields.find("Owner");
        if (it == fields.end()) return false;
        const std::string* value = std::get_if<std::string>(&it->second);
        return value && value->find(owner) != std::string::npos;
      },
      &values);
  if (!s.ok()) return s;
  *out = ToNamespaces(&values);
  return rocksdb::Status::OK();
}

rocksdb::Status NamespaceStore::GetNamespace(const std::string& name, model::Namespace* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::map<std::string, model::Namespace> values;
  rocksdb::Status s =
      store_->LoadValues(model::kNamespaceType, {name}, model::NamespaceSchema(), &values);
  if (!s.ok()) return s;
  auto it = values.find(name);
  if (it == values.end()) return rocksdb::Status::NotFound("namespace not found");
  *out = std::move(it->second);
  return rocksdb::Status::OK();
}

rocksdb::Status NamespaceStore::GetNamespaces(uint32_t offset,
                                              uint32_t limit,
                                              std::vector<model::Namespace>* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();

  std::map<std::string, model::Namespace> values;
  rocksdb::Status s = store_->LoadValuesAll(model::kNamespaceType, model::NamespaceSchema(), &values);
  if (!s.ok()) return s;

  std::vector<model::Namespace> namespaces = ToNamespaces(&values);
  std::sort(namespaces.begin(), namespaces.end(),
            [](const model::Namespace& a, const model::Namespace& b) {
              return a.modify_time > b.modify_time;
            });

  const uint64_t start = static_cast<uint64_t>(offset) * limit;
  if (start >= namespaces.size()) return rocksdb::Status::OK();
  const uint64_t end = std::min<uint64_t>(start + limit, namespaces.size());
  out->assign(std::make_move_iterator(namespaces.begin() + static_cast<std::ptrdiff_t>(start)),
              std::make_move_iterator(namespaces.begin() + static_cast<std::ptrdiff_t>(end)));
  return rocksdb::Status::OK();
}

rocksdb::Status NamespaceStore::GetMoreNamespaces(Timestamp mtime,
                                                  std::vector<model::Namespace>* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::map<std::string, model::Namespace> values;
  rocksdb::Status s = store_->LoadValuesByFilter(
      model::kNamespaceType, {"ModifyTime"}, model::NamespaceSchema(),
      [mtime](const FieldValues& fields) {
        auto it = fields.find("ModifyTime");
        if (it == fields.end()) return false;
        const Timestamp* value = std::get_if<Timestamp>(&it->second);
        return value && *value > mtime;
      },
      &values);
  if (!s.ok()) return s;
  *out = ToNamespaces(&values);
  return rocksdb::Status::OK();
}

}  // namespace regstore
