/**
 * @file typedcsv.h
 * @brief typedcsv - schema-bound CSV loading with typed row/column access and
 *        constraint validation.
 * @version 0.1.0
 *
 * This is the main public header for the typedcsv library. Include this single
 * header to access all public functionality.
 *
 * @code
 * auto schema = typedcsv::Schema::Builder()
 *                   .field("ID").primary_key()
 *                   .field("Name").not_null()
 *                   .field("Level").range(1, 100)
 *                   .build();
 *
 * auto data = typedcsv::load_file("units.csv", schema);
 * for (size_t i : data.store.find_all("Level", typedcsv::CellValue::integer(10))) {
 *     std::cout << data.store.row(i).get("Name").to_string() << "\n";
 * }
 * @endcode
 */

#ifndef TYPEDCSV_H
#define TYPEDCSV_H

#define TYPEDCSV_VERSION_MAJOR 0
#define TYPEDCSV_VERSION_MINOR 1
#define TYPEDCSV_VERSION_PATCH 0
#define TYPEDCSV_VERSION_STRING "0.1.0"

#include "cell_value.h"
#include "csv_loader.h"
#include "debug.h"
#include "error.h"
#include "io_util.h"
#include "loader_options.h"
#include "schema.h"
#include "schema_binder.h"
#include "tokenizer.h"
#include "typed_store.h"
#include "utf8.h"
#include "validation.h"

#endif // TYPEDCSV_H
