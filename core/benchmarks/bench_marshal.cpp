// ===========================================================================
// Marshalling cost: Value <-> ray_value_t
// ---------------------------------------------------------------------------
// Measures the host-side conversion work of one call:
//   - to_native() of a parameter table (fixed-width and string columns)
//   - table_from_native() of a fetched batch
//   - a full execute + fetch_all through the reference engine
//
// Arg: row count. Custom counters: RowsPerSec, BytesPerRow.
// ===========================================================================

#include "fake_engine.hpp"
#include "raybind/marshal.hpp"
#include "raybind/session.hpp"
#include <benchmark/benchmark.h>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace {

raybind::Table make_table(size_t rows, int seed) {
  using namespace raybind;
  std::mt19937 rng(static_cast<unsigned>(seed));
  std::uniform_int_distribution<int64_t> ints(-1'000'000, 1'000'000);
  std::uniform_real_distribution<double> reals(-1.0, 1.0);

  std::vector<Value> ids, scores, names;
  ids.reserve(rows);
  scores.reserve(rows);
  names.reserve(rows);
  for (size_t i = 0; i < rows; ++i) {
    ids.push_back(Value::integer(ints(rng)));
    // Every 16th score is null.
    scores.push_back(i % 16 == 0 ? Value::null() : Value::floating(reals(rng)));
    names.push_back(Value::string("name_" + std::to_string(i)));
  }
  return unwrap(Table::make({{"id", Array(ElementType::I64, std::move(ids))},
                             {"score", Array(ElementType::F64, std::move(scores))},
                             {"name", Array(ElementType::String, std::move(names))}}));
}

} // namespace

static void BM_ToNative(benchmark::State &state) {
  const auto rows = static_cast<size_t>(state.range(0));
  raybind::Value table = raybind::Value::table(make_table(rows, 42));
  size_t bytes = 0;
  for (auto _ : state) {
    auto native = raybind::to_native(table);
    bytes = native->buffer_bytes();
    benchmark::DoNotOptimize(native->get());
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(rows));
  state.counters["RowsPerSec"] = benchmark::Counter(
      static_cast<double>(state.iterations() * rows),
      benchmark::Counter::kIsRate);
  state.counters["BytesPerRow"] =
      rows ? static_cast<double>(bytes) / static_cast<double>(rows) : 0.0;
}
BENCHMARK(BM_ToNative)->RangeMultiplier(10)->Range(10, 100'000);

static void BM_FromNative(benchmark::State &state) {
  const auto rows = static_cast<size_t>(state.range(0));
  auto native = raybind::to_native(raybind::Value::table(make_table(rows, 7)));
  for (auto _ : state) {
    auto table = raybind::table_from_native(native->get());
    benchmark::DoNotOptimize(table->num_rows());
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(rows));
  state.counters["RowsPerSec"] = benchmark::Counter(
      static_cast<double>(state.iterations() * rows),
      benchmark::Counter::kIsRate);
}
BENCHMARK(BM_FromNative)->RangeMultiplier(10)->Range(10, 100'000);

static void BM_ExecuteFetchAll(benchmark::State &state) {
  using namespace raybind;
  const auto rows = static_cast<size_t>(state.range(0));
  fake::reset();
  fake::define_result("bench", make_table(rows, 3));
  auto runtime = unwrap(Runtime::attach(fake::api(), "bench"));
  Connection conn = Connection::open(runtime, {.fetch_batch_rows = 4096});

  for (auto _ : state) {
    Table t = conn.execute("bench");
    benchmark::DoNotOptimize(t.num_rows());
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(rows));
  fake::reset();
}
BENCHMARK(BM_ExecuteFetchAll)->Arg(1)->Arg(1'000)->Arg(50'000);

BENCHMARK_MAIN();
