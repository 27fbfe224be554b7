/**
 * @file schema_binder.h
 * @brief Resolve schema fields to source columns.
 */

#ifndef TYPEDCSV_SCHEMA_BINDER_H
#define TYPEDCSV_SCHEMA_BINDER_H

#include "schema.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace typedcsv {

class ErrorCollector;

/**
 * @brief Result of binding a Schema against a header (or against nothing).
 *
 * `columns[k]` is the source column of schema field k. `column_names` holds
 * one entry per known source column: the trimmed header text, or the schema
 * field's name/label when there is no header. Unnamed columns have "".
 */
struct ColumnBinding {
    std::vector<size_t> columns;
    std::vector<std::string> column_names;
    bool from_header = false;

    size_t size() const { return columns.size(); }
    size_t column_for(size_t field) const { return columns.at(field); }

    /// Header width, or the column count the bound fields require.
    size_t width() const { return column_names.size(); }

    /// Smallest row width that contains every bound column.
    size_t required_width() const;
};

/**
 * @brief Bind a schema to a header line.
 *
 * Named fields match header text case-insensitively after trimming; ordinal
 * fields bind to their column, which must lie within the header. A schema
 * with no fields binds every header column. Adds a FATAL error and returns
 * false on an empty header (EMPTY_HEADER), duplicate header names
 * (DUPLICATE_COLUMN_NAMES) or a field with no column (UNRESOLVED_FIELD).
 *
 * @param line 1-based line number of the header, for error locations
 * @param offset byte offset of the header line
 */
bool bind_to_header(const Schema& schema, const std::vector<std::string_view>& header,
                    ColumnBinding& out, ErrorCollector& errors, size_t line = 1,
                    size_t offset = 0);

/**
 * @brief Bind a schema without a header.
 *
 * Named field k binds to source column k; ordinal fields bind to their
 * column. Never fails.
 */
ColumnBinding bind_ordinal(const Schema& schema);

} // namespace typedcsv

#endif // TYPEDCSV_SCHEMA_BINDER_H
