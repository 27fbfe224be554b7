/**
 * @file csv_loader.h
 * @brief Entry points: CSV text + Schema + LoaderOptions -> TypedStore.
 *
 * parse() never throws for malformed input; it returns either a store or
 * the single fatal error that stopped it. load() and load_file() are the
 * throwing convenience layer that also runs validation.
 *
 * @code
 * auto schema = typedcsv::Schema::Builder()
 *                   .field("ID").primary_key()
 *                   .field("Name").not_null()
 *                   .build();
 *
 * auto result = typedcsv::parse(text, schema);
 * if (!result) {
 *     std::cerr << result.error().to_string() << "\n";
 *     return 1;
 * }
 * auto report = typedcsv::validate(result.store(), schema);
 * @endcode
 */

#ifndef TYPEDCSV_CSV_LOADER_H
#define TYPEDCSV_CSV_LOADER_H

#include "error.h"
#include "loader_options.h"
#include "schema.h"
#include "typed_store.h"
#include "validation.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace typedcsv {

/// Outcome of parse(): a store, or the fatal error that prevented one.
class LoadResult {
public:
    explicit LoadResult(TypedStore store, std::vector<ParseError> errors = {})
        : store_(std::move(store)), errors_(std::move(errors)) {}
    explicit LoadResult(std::vector<ParseError> errors) : errors_(std::move(errors)) {}

    bool ok() const { return store_.has_value(); }
    explicit operator bool() const { return ok(); }

    /// @throws ParseException when the parse failed
    TypedStore& store();
    const TypedStore& store() const;

    /// Move the store out; the result no longer holds one afterwards.
    TypedStore take_store();

    /// The fatal error; throws std::logic_error when the parse succeeded.
    const ParseError& error() const;

    /// Every recorded error: recovered WARNING entries, then the FATAL one
    /// on failure.
    const std::vector<ParseError>& errors() const { return errors_; }

    std::vector<ParseError> warnings() const;

private:
    std::optional<TypedStore> store_;
    std::vector<ParseError> errors_;
};

/// A store together with its validation report.
struct LoadedData {
    TypedStore store;
    ValidationReport report;
};

/**
 * @brief Parse CSV text into a TypedStore.
 *
 * Lines are split on LF/CRLF; blank lines and comment lines are skipped per
 * the options and do not count as data rows. The first remaining line is
 * the header when `options.has_header` is set. A leading UTF-8 BOM is
 * skipped.
 */
LoadResult parse(std::string_view text, const Schema& schema,
                 const LoaderOptions& options = LoaderOptions());

/**
 * @brief Parse, then validate when `options.validation_enabled`.
 *
 * Recovered parse anomalies are added to the report as warnings.
 *
 * @throws ParseException on a fatal parse error
 * @throws SchemaException on an unusable constraint declaration
 * @throws ValidationException when the report has errors and
 *         `options.throw_on_validation_error` is set
 */
LoadedData load(std::string_view text, const Schema& schema,
                const LoaderOptions& options = LoaderOptions());

/**
 * @brief load() on the contents of a file.
 *
 * The store is named after the file stem unless `options.data_name` is set.
 * An unreadable file raises ParseException with ErrorCode::IO_ERROR.
 */
LoadedData load_file(const std::string& path, const Schema& schema,
                     const LoaderOptions& options = LoaderOptions());

} // namespace typedcsv

#endif // TYPEDCSV_CSV_LOADER_H
