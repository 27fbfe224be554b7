/**
 * @file validation.h
 * @brief Constraint evaluation over a loaded TypedStore.
 *
 * Evaluation never stops at the first bad cell: every violation of every
 * constraint in every row is collected into a ValidationReport. The only
 * hard failure is a malformed schema, detected before any row is looked at
 * and reported as SchemaException.
 *
 * Evaluation runs in two phases:
 * 1. Whole-column: PrimaryKey and Unique, each over the full column.
 * 2. Per-row: NotNull, Range, MinLength, MaxLength, Pattern, AllowedValues
 *    and TypeCheck, per row and field in declaration order.
 *
 * Range, length, pattern, allowed-value and type checks skip Null cells, and
 * Range also skips cells that are not Int or Float.
 */

#ifndef TYPEDCSV_VALIDATION_H
#define TYPEDCSV_VALIDATION_H

#include "schema.h"
#include "typed_store.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace re2 {
class RE2;
}

namespace typedcsv {

class DebugTrace;

struct ValidationIssue {
    size_t row = 0;  ///< 0-based data row
    std::string field;
    std::optional<ConstraintKind> kind;
    std::string message;

    /// "[Row N, Column 'F'] message" with N 1-based; "[Row N] message" when
    /// the issue has no field.
    std::string to_string() const;
};

class ValidationReport {
public:
    void add_error(size_t row, std::string field, std::string message,
                   std::optional<ConstraintKind> kind = std::nullopt);
    void add_warning(size_t row, std::string field, std::string message,
                     std::optional<ConstraintKind> kind = std::nullopt);

    bool is_valid() const { return errors_.empty(); }
    bool has_warnings() const { return !warnings_.empty(); }
    size_t error_count() const { return errors_.size(); }
    size_t warning_count() const { return warnings_.size(); }

    const std::vector<ValidationIssue>& errors() const { return errors_; }
    const std::vector<ValidationIssue>& warnings() const { return warnings_; }

    /// Errors on one field (case-insensitive), in report order.
    std::vector<ValidationIssue> errors_for(std::string_view field) const;

    /// Counts line followed by every issue, one per line.
    std::string summary() const;

private:
    std::vector<ValidationIssue> errors_;
    std::vector<ValidationIssue> warnings_;
};

/// Thrown by load()/load_file() when validation finds errors and the options
/// ask for it.
class ValidationException : public std::runtime_error {
public:
    explicit ValidationException(ValidationReport report);

    const ValidationReport& report() const { return report_; }

private:
    ValidationReport report_;
};

enum class EvaluationState {
    NOT_STARTED,
    RUNNING,
    COMPLETE,
    FAILED
};

const char* evaluation_state_to_string(EvaluationState state);

/**
 * @brief Evaluates a schema's constraints against a store, once.
 *
 * The store and schema must outlive the evaluator.
 */
class ConstraintEvaluator {
public:
    ConstraintEvaluator(const TypedStore& store, const Schema& schema,
                        DebugTrace* trace = nullptr);
    ~ConstraintEvaluator();

    ConstraintEvaluator(const ConstraintEvaluator&) = delete;
    ConstraintEvaluator& operator=(const ConstraintEvaluator&) = delete;

    /**
     * @brief Check the schema, then run both phases.
     *
     * @throws SchemaException for an unusable constraint declaration (the
     *         state stays NOT_STARTED)
     * @throws std::logic_error when called a second time
     */
    ValidationReport run();

    EvaluationState state() const { return state_; }

private:
    struct Bound;

    void prepare();
    void check_column(const Bound& b, bool primary_key, ValidationReport& report) const;
    void check_cell(const Bound& b, const Constraint& c, size_t row, const CellValue& value,
                    ValidationReport& report) const;

    const TypedStore& store_;
    const Schema& schema_;
    DebugTrace* trace_;
    EvaluationState state_ = EvaluationState::NOT_STARTED;
    std::vector<Bound> bound_;
};

/// Evaluate every constraint of `schema` against `store`.
ValidationReport validate(const TypedStore& store, const Schema& schema);

} // namespace typedcsv

#endif // TYPEDCSV_VALIDATION_H
