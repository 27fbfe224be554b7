#include <benchmark/benchmark.h>
#include "benchmark_data.h"

#include <map>
#include <sstream>

// Generated CSV text shared across benchmarks, keyed by row count
static std::map<size_t, std::string> generated;

const std::string& units_csv(size_t rows) {
  auto it = generated.find(rows);
  if (it != generated.end()) {
    return it->second;
  }

  static const char* const names[] = {"Alice", "Bob", "Carol", "Dave", "\"Smith, John\""};
  std::ostringstream ss;
  ss << "ID,Name,Level,Score,Active\n";
  for (size_t i = 0; i < rows; ++i) {
    ss << (i + 1) << ',' << names[i % 5] << ',' << (i % 120) << ',' << (i % 1000) / 10.0 << ','
       << ((i % 3) ? "true" : "false") << '\n';
  }
  return generated.emplace(rows, ss.str()).first->second;
}

typedcsv::Schema units_schema() {
  return typedcsv::Schema::Builder()
      .field("ID").primary_key()
      .field("Name").not_null().max_length(32)
      .field("Level").range(1, 100)
      .field("Score").type_check(typedcsv::CellType::Float)
      .build();
}

BENCHMARK_MAIN();
