#include <regstore/model.hpp>
#include <regstore/store.hpp>

#include <iostream>
#include <map>

int main() {
  regstore::Options opt;
  opt.path = "./regstore_db";
  std::unique_ptr<regstore::Store> db;

  auto s = regstore::Store::Open(opt, &db);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  const auto& schema = regstore::model::ServiceSchema();
  const char* type = regstore::model::kServiceType;

  regstore::model::Service svc;
  svc.id = "svc-1";
  svc.name = "payments";
  svc.namespace_name = "default";
  svc.owner = "polaris";
  svc.meta = {{"env", "prod"}, {"team", "billing"}};
  svc.valid = true;
  svc.create_time = regstore::TimestampNow();
  svc.modify_time = svc.create_time;

  s = db->SaveValue(type, svc.id, schema, svc);
  if (!s.ok()) {
    std::cerr << "SaveValue failed: " << s.ToString() << "\n";
    return 1;
  }

  // Partial update: only Revision changes, meta stays.
  s = db->UpdateValue(type, svc.id, {{"Revision", std::string("r2")}});
  if (!s.ok()) std::cerr << "UpdateValue failed: " << s.ToString() << "\n";

  std::map<std::string, regstore::model::Service> loaded;
  s = db->LoadValues(type, {svc.id, "svc-missing"}, schema, &loaded);
  if (!s.ok()) {
    std::cerr << "LoadValues failed: " << s.ToString() << "\n";
    return 1;
  }
  for (const auto& [key, value] : loaded) {
    std::cout << key << " name=" << value.name << " revision=" << value.revision
              << " meta.env=" << value.meta.at("env") << "\n";
  }

  uint64_t n = 0;
  s = db->CountValues(type, &n);
  if (!s.ok()) std::cerr << "CountValues failed: " << s.ToString() << "\n";
  std::cout << "services=" << n << "\n";

  s = db->DeleteValues(type, {svc.id});
  if (!s.ok()) std::cerr << "DeleteValues failed: " << s.ToString() << "\n";

  std::cout << "done\n";
  return 0;
}
