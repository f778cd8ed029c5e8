#include <regstore/config.hpp>
#include <regstore/field_mapper.hpp>
#include <regstore/namespace_store.hpp>
#include <regstore/store.hpp>
#include <regstore/tag_codec.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

static void usage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " [--db-path <path>] [--config <file>] <command> [args...]\n"
            << "  (" << argv0 << " --help for the command list)\n";
}

static void print_namespace(const regstore::model::Namespace& ns) {
  std::cout << ns.name << "\towner=" << ns.owner << "\ttoken=" << ns.token
            << "\tvalid=" << (ns.valid ? "true" : "false") << "\tcomment=" << ns.comment << "\n";
}

int main(int argc, char** argv) {
  regstore::Config config;
  try {
    config = regstore::Config::LoadFromArgs(argc, argv);
    config.Validate();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  }
  spdlog::set_level(spdlog::level::from_str(config.log_level));

  const std::vector<std::string>& args = config.command;
  if (args.empty()) { usage(argv[0]); return 2; }
  const std::string& cmd = args[0];

  std::unique_ptr<regstore::Store> db;
  auto s = regstore::Store::Open(config.store, &db);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }
  regstore::NamespaceStore namespaces(db.get());

  if (cmd == "count") {
    if (args.size() != 2) { usage(argv[0]); return 2; }
    uint64_t n = 0;
    s = db->CountValues(args[1], &n);
    if (!s.ok()) {
      std::cerr << "CountValues failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << n << "\n";
    return 0;
  } else if (cmd == "keys") {
    if (args.size() != 2) { usage(argv[0]); return 2; }
    s = db->Execute(false, [&](regstore::Tx* tx) {
      regstore::Bucket type_bucket;
      auto st = tx->GetBucket(args[1], &type_bucket);
      if (st.IsNotFound()) return rocksdb::Status::OK();
      if (!st.ok()) return st;
      return type_bucket.ForEachBucket([](std::string_view key) {
        std::cout << key << "\n";
        return rocksdb::Status::OK();
      });
    });
    if (!s.ok()) {
      std::cerr << "keys failed: " << s.ToString() << "\n";
      return 1;
    }
    return 0;
  } else if (cmd == "dump") {
    if (args.size() != 3) { usage(argv[0]); return 2; }
    s = db->Execute(false, [&](regstore::Tx* tx) {
      regstore::Bucket type_bucket;
      auto st = tx->GetBucket(args[1], &type_bucket);
      if (!st.ok()) return st;
      regstore::Bucket record;
      st = type_bucket.GetBucket(args[2], &record);
      if (!st.ok()) return st;
      st = record.ForEach([](std::string_view k, std::string_view v) {
        const uint8_t tag = v.empty() ? 0 : static_cast<uint8_t>(v[0]);
        std::cout << regstore::FromBucketKey(k) << "\t" << regstore::TypeTagName(tag)
                  << "\t" << (v.empty() ? 0 : v.size() - 1) << " bytes\n";
        return rocksdb::Status::OK();
      });
      if (!st.ok()) return st;
      return record.ForEachBucket([&](std::string_view k) {
        regstore::Bucket sub;
        auto sst = record.GetBucket(k, &sub);
        if (!sst.ok()) return sst;
        std::cout << regstore::FromBucketKey(k) << "\tmap\n";
        return sub.ForEach([](std::string_view mk, std::string_view mv) {
          std::cout << "  " << mk << "=" << mv << "\n";
          return rocksdb::Status::OK();
        });
      });
    });
    if (!s.ok()) {
      std::cerr << "dump failed: " << s.ToString() << "\n";
      return 1;
    }
    return 0;
  } else if (cmd == "del") {
    if (args.size() < 3) { usage(argv[0]); return 2; }
    std::vector<std::string> keys(args.begin() + 2, args.end());
    s = db->DeleteValues(args[1], keys);
    if (!s.ok()) {
      std::cerr << "DeleteValues failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "OK\n";
    return 0;
  } else if (cmd == "ns-init") {
    s = namespaces.InitData();
    if (!s.ok()) {
      std::cerr << "InitData failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "OK\n";
    return 0;
  } else if (cmd == "ns-add") {
    if (args.size() != 4 && args.size() != 5) { usage(argv[0]); return 2; }
    regstore::model::Namespace ns;
    ns.name = args[1];
    ns.owner = args[2];
    ns.token = args[3];
    if (args.size() == 5) ns.comment = args[4];
    ns.create_time = regstore::TimestampNow();
    ns.modify_time = ns.create_time;
    s = namespaces.AddNamespace(&ns);
    if (!s.ok()) {
      std::cerr << "AddNamespace failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "OK\n";
    return 0;
  } else if (cmd == "ns-get") {
    if (args.size() != 2) { usage(argv[0]); return 2; }
    regstore::model::Namespace ns;
    s = namespaces.GetNamespace(args[1], &ns);
    if (!s.ok()) {
      std::cerr << "GetNamespace failed: " << s.ToString() << "\n";
      return 1;
    }
    print_namespace(ns);
    return 0;
  } else if (cmd == "ns-list") {
    if (args.size() != 2) { usage(argv[0]); return 2; }
    std::vector<regstore::model::Namespace> list;
    s = namespaces.ListNamespaces(args[1], &list);
    if (!s.ok()) {
      std::cerr << "ListNamespaces failed: " << s.ToString() << "\n";
      return 1;
    }
    for (const auto& ns : list) print_namespace(ns);
    return 0;
  } else if (cmd == "ns-token") {
    if (args.size() != 3) { usage(argv[0]); return 2; }
    s = namespaces.UpdateNamespaceToken(args[1], args[2]);
    if (!s.ok()) {
      std::cerr << "UpdateNamespaceToken failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "OK\n";
    return 0;
  }

  usage(argv[0]);
  return 2;
}
