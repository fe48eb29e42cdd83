// ===========================================================================
// Engine throughput
// ---------------------------------------------------------------------------
// Claims under test:
//   - Key comparison stays cheap for mixed-type and array keys
//   - put/get cost is dominated by index maintenance, not by scheduling
//   - A full cursor walk costs one scheduler turn per position
//   - Disabling the dispatch trace removes its per-delivery overhead
//
// Methodology:
//   - Stores seeded through Registry::seed() with NUM_RECORDS records
//   - Each iteration runs one readwrite/readonly transaction to completion
// ===========================================================================

#include "mockidb/mockidb.hpp"

#include <benchmark/benchmark.h>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int NUM_RECORDS = 10'000;
constexpr int BATCH = 100;

// Records spread over a handful of categories so the index has duplicates.
mockidb::Value make_record(int id, std::mt19937 &rng) {
  std::uniform_int_distribution<int> category(0, 15);
  std::uniform_real_distribution<double> price(1.0, 500.0);
  return mockidb::Value::object(
      {{"id", id},
       {"category", "cat" + std::to_string(category(rng))},
       {"price", price(rng)},
       {"tags", mockidb::Value::array({"a", "b"})}});
}

std::vector<mockidb::Key> generate_keys(size_t n, int seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> shape(0, 2);
  std::uniform_real_distribution<double> number(-1e6, 1e6);
  std::vector<mockidb::Key> keys;
  keys.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    switch (shape(rng)) {
    case 0:
      keys.emplace_back(number(rng));
      break;
    case 1:
      keys.emplace_back(std::to_string(rng()));
      break;
    default:
      keys.push_back(mockidb::Key::array(
          {mockidb::Key(number(rng)), mockidb::Key(std::to_string(rng()))}));
    }
  }
  return keys;
}

} // namespace

// ----------------------------------------------------------------------------
// 1. Key Order
// ----------------------------------------------------------------------------
static void BM_CompareKeys(benchmark::State &state) {
  auto keys = generate_keys(1024, 42);
  size_t i = 0;
  for (auto _ : state) {
    int c = mockidb::compare_keys(keys[i % keys.size()],
                                  keys[(i + 1) % keys.size()]);
    benchmark::DoNotOptimize(c);
    ++i;
  }
}
BENCHMARK(BM_CompareKeys);

// ----------------------------------------------------------------------------
// 2. Store Operations (Integration)
// ----------------------------------------------------------------------------
class StoreFixture : public benchmark::Fixture {
public:
  std::unique_ptr<mockidb::Registry> registry;
  std::shared_ptr<mockidb::Connection> db;
  std::mt19937 rng{7};

  void SetUp(const benchmark::State &state) override {
    mockidb::RegistryOptions options;
    options.enable_trace = state.range(0) != 0;
    registry = std::make_unique<mockidb::Registry>(options);

    mockidb::StoreSchema items{
        .name = "items",
        .options = {.key_path = "id"},
        .indexes = {{"category", "category", {}},
                    {"tags", "tags", {.multi_entry = true}}}};
    for (int id = 0; id < NUM_RECORDS; ++id)
      items.records.push_back({make_record(id, rng)});

    mockidb::DatabaseSchema schema{.name = "bench", .stores = {items}};
    if (!registry->seed(schema))
      throw std::runtime_error("seeding the benchmark database failed");

    auto request = registry->open("bench");
    registry->run_until_idle();
    db = request->result();
  }

  void TearDown(const benchmark::State &) override {
    db.reset();
    registry.reset();
  }

  std::shared_ptr<mockidb::Transaction>
  begin(mockidb::TransactionMode mode) {
    return db->transaction({"items"}, mode).value();
  }
};

BENCHMARK_DEFINE_F(StoreFixture, PutBatch)(benchmark::State &state) {
  int next = NUM_RECORDS;
  for (auto _ : state) {
    auto txn = begin(mockidb::TransactionMode::ReadWrite);
    auto store = txn->store("items").value();
    for (int i = 0; i < BATCH; ++i)
      store.put(make_record(next++, rng));
    registry->run_until_idle();
  }
  state.SetItemsProcessed(state.iterations() * BATCH);
}
BENCHMARK_REGISTER_F(StoreFixture, PutBatch)->Arg(1)->Arg(0);

BENCHMARK_DEFINE_F(StoreFixture, GetBatch)(benchmark::State &state) {
  std::uniform_int_distribution<int> id(0, NUM_RECORDS - 1);
  for (auto _ : state) {
    auto txn = begin(mockidb::TransactionMode::ReadOnly);
    auto store = txn->store("items").value();
    for (int i = 0; i < BATCH; ++i)
      benchmark::DoNotOptimize(store.get(id(rng)));
    registry->run_until_idle();
  }
  state.SetItemsProcessed(state.iterations() * BATCH);
}
BENCHMARK_REGISTER_F(StoreFixture, GetBatch)->Arg(1)->Arg(0);

BENCHMARK_DEFINE_F(StoreFixture, IndexCursorWalk)(benchmark::State &state) {
  size_t visited = 0;
  for (auto _ : state) {
    auto txn = begin(mockidb::TransactionMode::ReadOnly);
    auto index = txn->store("items").value().index("category").value();
    auto request = index.open_cursor(mockidb::KeyRange::only("cat3"));
    request->on_success([&](mockidb::CursorRequest &r) {
      if (auto cursor = r.result()) {
        ++visited;
        if (!cursor->continue_())
          throw std::runtime_error("cursor continue failed");
      }
    });
    registry->run_until_idle();
  }
  state.counters["Visited"] = benchmark::Counter(
      static_cast<double>(visited), benchmark::Counter::kAvgIterations);
}
BENCHMARK_REGISTER_F(StoreFixture, IndexCursorWalk)->Arg(1)->Arg(0);

BENCHMARK_MAIN();
