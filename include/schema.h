/**
 * @file schema.h
 * @brief Field declarations and per-field constraints.
 *
 * A Schema is an ordered list of fields. Each field is identified either by
 * a header name (matched case-insensitively) or by an ordinal source column,
 * and carries zero or more constraints. Schemas are built with
 * Schema::Builder and are immutable afterwards.
 *
 * @code
 * auto schema = typedcsv::Schema::Builder()
 *                   .field("ID").primary_key()
 *                   .field("Name").not_null()
 *                   .field("Level").range(1, 100)
 *                   .build();
 * @endcode
 */

#ifndef TYPEDCSV_SCHEMA_H
#define TYPEDCSV_SCHEMA_H

#include "cell_value.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace typedcsv {

/// A schema field identifier: a header name or an ordinal column position.
class FieldId {
public:
    static FieldId named(std::string name) { return FieldId(std::move(name), 0, false); }
    /// `name` optionally labels the column in the store when there is no header.
    static FieldId ordinal(size_t column, std::string name = std::string()) {
        return FieldId(std::move(name), column, true);
    }

    bool is_ordinal() const { return is_ordinal_; }
    const std::string& name() const { return name_; }
    size_t column() const { return column_; }

    /// Name, or "#N" (0-based) for an unlabelled ordinal field.
    std::string to_string() const;

private:
    FieldId(std::string name, size_t column, bool is_ordinal)
        : name_(std::move(name)), column_(column), is_ordinal_(is_ordinal) {}

    std::string name_;
    size_t column_;
    bool is_ordinal_;
};

enum class ConstraintKind {
    NotNull,
    Unique,
    PrimaryKey,
    Range,
    MinLength,
    MaxLength,
    Pattern,
    AllowedValues,
    TypeCheck
};

const char* constraint_kind_to_string(ConstraintKind kind);

/**
 * @brief One rule attached to a field.
 *
 * Only the parameters of the given kind are meaningful.
 */
struct Constraint {
    ConstraintKind kind = ConstraintKind::NotNull;
    double min = 0.0;
    double max = 0.0;
    size_t length = 0;
    std::string pattern;
    std::vector<CellValue> allowed;
    CellType type = CellType::String;

    static Constraint not_null();
    static Constraint unique();
    static Constraint primary_key();
    static Constraint range(double min, double max);
    static Constraint min_length(size_t n);
    static Constraint max_length(size_t n);
    static Constraint matches(std::string pattern);
    static Constraint allowed_values(std::vector<CellValue> values);
    /// Allowed values given as text, each coerced like a field.
    static Constraint allowed_text(const std::vector<std::string>& values);
    static Constraint type_check(CellType type);

    /// Evaluated over a whole column (Unique, PrimaryKey) rather than per row.
    bool is_column_wide() const {
        return kind == ConstraintKind::Unique || kind == ConstraintKind::PrimaryKey;
    }

    /// Human-readable form, e.g. "Range(1, 100)".
    std::string describe() const;
};

struct FieldDef {
    FieldId id;
    std::vector<Constraint> constraints;

    bool has(ConstraintKind kind) const;
    const Constraint* find(ConstraintKind kind) const;
};

/// A constraint together with the schema position of its field.
struct ConstraintEntry {
    size_t field;
    const Constraint* constraint;
};

class Schema {
public:
    class Builder;

    /// An empty schema: every source column is bound.
    Schema() = default;

    /// Unconstrained schema with one named field per entry.
    static Schema from_names(const std::vector<std::string>& names);

    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    const FieldDef& field(size_t i) const { return fields_.at(i); }
    const std::vector<FieldDef>& fields() const { return fields_; }

    /// Schema position of a named field (case-insensitive).
    std::optional<size_t> position_of(std::string_view name) const;

    /// Every (field position, constraint) pair in declaration order.
    std::vector<ConstraintEntry> constraints() const;
    bool has_constraints() const;

private:
    std::vector<FieldDef> fields_;
};

/**
 * @brief Incremental Schema construction.
 *
 * field()/ordinal() start a new field; constraint calls apply to the most
 * recently started field and throw std::logic_error when there is none.
 * build() throws SchemaException when two named fields share a name.
 */
class Schema::Builder {
public:
    Builder& field(std::string name);
    Builder& ordinal(size_t column, std::string name = std::string());

    Builder& constrain(Constraint c);
    Builder& not_null() { return constrain(Constraint::not_null()); }
    Builder& unique() { return constrain(Constraint::unique()); }
    Builder& primary_key() { return constrain(Constraint::primary_key()); }
    Builder& range(double min, double max) { return constrain(Constraint::range(min, max)); }
    Builder& min_length(size_t n) { return constrain(Constraint::min_length(n)); }
    Builder& max_length(size_t n) { return constrain(Constraint::max_length(n)); }
    Builder& matches(std::string pattern) { return constrain(Constraint::matches(std::move(pattern))); }
    Builder& allowed_values(std::vector<CellValue> values) {
        return constrain(Constraint::allowed_values(std::move(values)));
    }
    Builder& type_check(CellType type) { return constrain(Constraint::type_check(type)); }

    Schema build() const;

private:
    std::vector<FieldDef> fields_;
};

} // namespace typedcsv

#endif // TYPEDCSV_SCHEMA_H
