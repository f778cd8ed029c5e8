#include <regstore/namespace_store.hpp>
#include <regstore/store.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

// Counters and histogram totals, dumped once at exit.
class SummaryMetrics final : public regstore::MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lk(mu_);
    counters_[std::string(name)] += delta;
  }

  void Histogram(std::string_view name, uint64_t value) override {
    std::lock_guard<std::mutex> lk(mu_);
    auto& [count, sum] = hists_[std::string(name)];
    count += 1;
    sum += value;
  }

  void Dump(std::ostream& os) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [name, value] : counters_) os << name << " = " << value << "\n";
    for (const auto& [name, agg] : hists_) {
      os << name << " count=" << agg.first << " sum=" << agg.second << "\n";
    }
  }

 private:
  mutable std::mutex mu_;
  std::map<std::string, uint64_t> counters_;
  std::map<std::string, std::pair<uint64_t, uint64_t>> hists_;
};

// Logs each operation span through spdlog when it ends.
class LogSpan final : public regstore::TraceSpan {
 public:
  explicit LogSpan(std::string_view name)
      : name_(name), start_(std::chrono::steady_clock::now()) {}

  void SetAttribute(std::string_view key, uint64_t value) override {
    attrs_ += " " + std::string(key) + "=" + std::to_string(value);
  }

  void SetAttribute(std::string_view key, std::string_view value) override {
    attrs_ += " " + std::string(key) + "=" + std::string(value);
  }

  void AddEvent(std::string_view name) override { attrs_ += " event:" + std::string(name); }

  void End(const rocksdb::Status& status) override {
    const auto dur = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_);
    spdlog::info("[span] {} {} {}us{}", name_, status.ToString(), dur.count(), attrs_);
  }

 private:
  std::string name_;
  std::chrono::steady_clock::time_point start_;
  std::string attrs_;
};

class LogTracer final : public regstore::Tracer {
 public:
  std::unique_ptr<regstore::TraceSpan> StartSpan(std::string_view name) override {
    return std::make_unique<LogSpan>(name);
  }
};

}  // namespace

int main() {
  auto metrics = std::make_shared<SummaryMetrics>();

  regstore::Options opt;
  opt.path = "./regstore_db";
  opt.metrics = metrics;
  opt.tracer = std::make_shared<LogTracer>();

  std::unique_ptr<regstore::Store> db;
  auto s = regstore::Store::Open(opt, &db);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  regstore::NamespaceStore namespaces(db.get());
  s = namespaces.InitData();
  if (!s.ok()) {
    std::cerr << "InitData failed: " << s.ToString() << "\n";
    return 1;
  }

  std::vector<regstore::model::Namespace> owned;
  s = namespaces.ListNamespaces("polaris", &owned);
  if (!s.ok()) std::cerr << "ListNamespaces failed: " << s.ToString() << "\n";

  s = namespaces.UpdateNamespaceToken("default", "demo-token");
  if (!s.ok()) std::cerr << "UpdateNamespaceToken failed: " << s.ToString() << "\n";

  regstore::model::Namespace ns;
  s = namespaces.GetNamespace("missing", &ns);
  std::cout << "missing namespace: " << s.ToString() << "\n";

  metrics->Dump(std::cout);
  return 0;
}
