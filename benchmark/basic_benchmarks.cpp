#include <benchmark/benchmark.h>
#include "benchmark_data.h"
#include "csv_loader.h"
#include "tokenizer.h"
#include "validation.h"

#include <vector>

using namespace typedcsv;

// Split and tokenize every line without coercion
static void BM_Tokenize(benchmark::State& state) {
  const std::string& text = units_csv(static_cast<size_t>(state.range(0)));
  Tokenizer tokenizer;
  std::vector<FieldSpan> fields;

  for (auto _ : state) {
    LineSplitter lines(text);
    Line line;
    size_t total = 0;
    while (lines.next(line)) {
      tokenizer.tokenize(line.text, fields);
      total += fields.size();
    }
    benchmark::DoNotOptimize(total);
  }

  state.SetBytesProcessed(static_cast<int64_t>(text.size() * state.iterations()));
}
BENCHMARK(BM_Tokenize)->RangeMultiplier(10)->Range(1000, 100000)->Unit(benchmark::kMillisecond);

// Full parse into a TypedStore
static void BM_Parse(benchmark::State& state) {
  const std::string& text = units_csv(static_cast<size_t>(state.range(0)));
  Schema schema = units_schema();

  for (auto _ : state) {
    LoadResult result = parse(text, schema);
    if (!result) {
      state.SkipWithError(result.error().message.c_str());
      return;
    }
    benchmark::DoNotOptimize(result.store().num_rows());
  }

  state.SetBytesProcessed(static_cast<int64_t>(text.size() * state.iterations()));
  state.counters["Rows"] = static_cast<double>(state.range(0));
}
BENCHMARK(BM_Parse)->RangeMultiplier(10)->Range(1000, 100000)->Unit(benchmark::kMillisecond);

// Constraint evaluation over an already loaded store
static void BM_Validate(benchmark::State& state) {
  const std::string& text = units_csv(static_cast<size_t>(state.range(0)));
  Schema schema = units_schema();
  LoadResult result = parse(text, schema);
  if (!result) {
    state.SkipWithError(result.error().message.c_str());
    return;
  }
  const TypedStore& store = result.store();

  size_t errors = 0;
  for (auto _ : state) {
    ValidationReport report = validate(store, schema);
    errors = report.error_count();
    benchmark::DoNotOptimize(errors);
  }

  state.counters["Errors"] = static_cast<double>(errors);
}
BENCHMARK(BM_Validate)->RangeMultiplier(10)->Range(1000, 100000)->Unit(benchmark::kMillisecond);

// Index construction for a low-cardinality column, bypassing the store cache
static void BM_BuildIndex(benchmark::State& state) {
  const std::string& text = units_csv(static_cast<size_t>(state.range(0)));
  LoadResult result = parse(text, Schema());
  if (!result) {
    state.SkipWithError(result.error().message.c_str());
    return;
  }
  const TypedStore& store = result.store();

  for (auto _ : state) {
    ValueIndex index(store.column("Level"));
    benchmark::DoNotOptimize(index.distinct_count());
  }
}
BENCHMARK(BM_BuildIndex)->RangeMultiplier(10)->Range(1000, 100000)->Unit(benchmark::kMillisecond);

// Cached lookups after the first find_all
static void BM_FindAll(benchmark::State& state) {
  const std::string& text = units_csv(static_cast<size_t>(state.range(0)));
  LoadResult result = parse(text, Schema());
  if (!result) {
    state.SkipWithError(result.error().message.c_str());
    return;
  }
  const TypedStore& store = result.store();
  const CellValue key = CellValue::integer(42);

  for (auto _ : state) {
    auto rows = store.find_all("Level", key);
    benchmark::DoNotOptimize(rows.data());
  }
}
BENCHMARK(BM_FindAll)->RangeMultiplier(10)->Range(1000, 100000);
