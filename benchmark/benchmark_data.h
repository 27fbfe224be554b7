#ifndef TYPEDCSV_BENCHMARK_DATA_H
#define TYPEDCSV_BENCHMARK_DATA_H

#include <cstddef>
#include <string>
#include "schema.h"

// ID,Name,Level,Score,Active rows; about one row in six breaks Range(1, 100)
const std::string& units_csv(size_t rows);

typedcsv::Schema units_schema();

#endif // TYPEDCSV_BENCHMARK_DATA_H
