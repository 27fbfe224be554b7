/**
 * @file loader_options.h
 * @brief Configuration for loading CSV text into a TypedStore.
 *
 * LoaderOptions holds the parameters that define how a CSV buffer is split,
 * which lines are skipped, how short rows are handled, and whether the
 * loaded store is validated against the schema's constraints.
 *
 * Number parsing is always locale-invariant: the decimal mark is '.', and no
 * grouping separators are accepted.
 */

#ifndef TYPEDCSV_LOADER_OPTIONS_H
#define TYPEDCSV_LOADER_OPTIONS_H

#include <string>

namespace typedcsv {

class DebugTrace;

/**
 * @brief What to do when a schema-bound column is missing from a data row.
 *
 * With a header, any row whose field count differs from the header's is a
 * mismatch. Without a header, only schema-bound columns beyond the row's last
 * field are.
 */
enum class MissingFieldPolicy {
    Throw,       ///< Abort the load with INCONSISTENT_FIELD_COUNT / MISSING_FIELD
    SetDefault,  ///< Store Null for each missing field
    Ignore       ///< Leave missing fields out of the row
};

const char* missing_field_policy_to_string(MissingFieldPolicy policy);

struct LoaderOptions {
    char delimiter = ',';
    char quote_char = '"';
    bool has_header = true;
    bool trim_fields = true;
    bool ignore_empty_lines = true;

    /// Lines whose trimmed content starts with this prefix are skipped.
    /// An empty prefix disables comment handling.
    std::string comment_prefix = "#";

    MissingFieldPolicy missing_field_policy = MissingFieldPolicy::Throw;

    /// load()/load_file() validate after parsing when set.
    bool validation_enabled = true;
    /// load()/load_file() throw ValidationException when the report has errors.
    bool throw_on_validation_error = true;

    /// Name stored on the TypedStore for diagnostics (defaults to the file stem).
    std::string data_name;

    /// Optional trace sink; not owned.
    DebugTrace* trace = nullptr;

    static LoaderOptions csv() { return LoaderOptions{}; }

    static LoaderOptions tsv() {
        LoaderOptions opts;
        opts.delimiter = '\t';
        return opts;
    }

    static LoaderOptions headerless() {
        LoaderOptions opts;
        opts.has_header = false;
        return opts;
    }

    bool has_comment_prefix() const { return !comment_prefix.empty(); }
};

} // namespace typedcsv

#endif // TYPEDCSV_LOADER_OPTIONS_H
