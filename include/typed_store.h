/**
 * @file typed_store.h
 * @brief Row-major and column-major storage of coerced CSV data.
 *
 * A TypedStore owns every loaded Row in source order and keeps one
 * materialized column per source column, so that for every row i and field f
 *
 *     store.row(i).get(f) == store.column(f)[i]
 *
 * Columns a row does not have (short rows under MissingFieldPolicy::Ignore)
 * read as Null in the column view. The store is append-only while it is
 * built and is then safe for concurrent readers; value indexes are built on
 * first request and cached.
 *
 * Lookup failures (row or column out of range, unknown field name) throw
 * std::out_of_range and are distinct from a Null value.
 */

#ifndef TYPEDCSV_TYPED_STORE_H
#define TYPEDCSV_TYPED_STORE_H

#include "cell_value.h"
#include "schema.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace typedcsv {

/// Source column names with case-insensitive lookup. Unnamed columns are "".
class ColumnNames {
public:
    ColumnNames() = default;
    explicit ColumnNames(std::vector<std::string> names);

    size_t size() const { return names_.size(); }

    /// Name of a source column; "" for unnamed columns and columns past the end.
    const std::string& name(size_t column) const;
    std::optional<size_t> find(std::string_view name) const;
    const std::vector<std::string>& names() const { return names_; }

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, size_t> lookup_;
};

/**
 * @brief One data row, indexed by source column.
 *
 * Rows are built by the loader from coerced cells and attached to a store's
 * column names by TypedStore::add; name-based access on a detached row throws.
 */
class Row {
public:
    Row() = default;
    explicit Row(std::vector<CellValue> cells) : cells_(std::move(cells)) {}

    /// Number of cells actually present.
    size_t size() const { return cells_.size(); }
    bool empty() const { return cells_.empty(); }

    /// true if the row holds a cell for the named field.
    bool has_field(std::string_view field) const;

    /// Value of a named field; Null when this row lacks the field.
    const CellValue& get(std::string_view field) const;

    /// Value at a source column; throws std::out_of_range past size().
    const CellValue& at(size_t column) const;

    /// Converted value; nullopt for Null or unconvertible values.
    template <typename T> std::optional<T> get_as(std::string_view field) const {
        return get(field).as<T>().value;
    }

    template <typename T> T get_or(std::string_view field, T default_value) const {
        return get(field).as<T>().get_or(default_value);
    }

    const std::vector<CellValue>& cells() const { return cells_; }

private:
    friend class TypedStore;

    std::vector<CellValue> cells_;
    std::shared_ptr<const ColumnNames> names_;
};

/**
 * @brief Value -> ascending row positions for one column.
 *
 * Null cells are indexed under CellValue::null() like any other value.
 */
class ValueIndex {
public:
    using Map = std::unordered_map<CellValue, std::vector<size_t>, CellValueHash>;

    explicit ValueIndex(const std::vector<CellValue>& column);

    /// Rows holding `value` in ascending order; empty when there are none.
    const std::vector<size_t>& rows(const CellValue& value) const;
    bool contains(const CellValue& value) const { return map_.count(value) > 0; }
    size_t distinct_count() const { return map_.size(); }
    const Map& entries() const { return map_; }

private:
    Map map_;
};

/// One group of TypedStore::group_by.
struct Group {
    CellValue key;
    std::vector<size_t> rows;
};

class TypedStore {
public:
    TypedStore();
    explicit TypedStore(std::vector<std::string> column_names, std::string name = std::string());

    /// The moved-from store is left empty with no columns.
    TypedStore(TypedStore&& other) noexcept;
    TypedStore& operator=(TypedStore&& other) noexcept;
    TypedStore(const TypedStore&) = delete;
    TypedStore& operator=(const TypedStore&) = delete;

    /// Append a row; a row wider than the store adds unnamed columns.
    void add(Row row);

    size_t num_rows() const { return rows_.size(); }
    size_t num_columns() const { return columns_.size(); }
    bool empty() const { return rows_.empty(); }

    const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }

    /// One entry per source column; "" for unnamed columns.
    std::vector<std::string> column_names() const;
    /// Named columns only, in column order.
    std::vector<std::string> field_names() const;
    bool has_field(std::string_view field) const { return names_->find(field).has_value(); }
    std::optional<size_t> column_index(std::string_view field) const { return names_->find(field); }

    /// Source column of a schema field identifier, if the store has it.
    std::optional<size_t> resolve(const FieldId& id) const;

    const Row& row(size_t i) const;
    const std::vector<Row>& rows() const { return rows_; }

    const std::vector<CellValue>& column(std::string_view field) const;
    const std::vector<CellValue>& column(size_t column) const;

    template <typename T>
    std::vector<std::optional<T>> column_as(std::string_view field) const {
        const auto& col = column(field);
        std::vector<std::optional<T>> out;
        out.reserve(col.size());
        for (const auto& v : col) {
            out.push_back(v.as<T>().value);
        }
        return out;
    }

    /// Cached index of a column. Safe to call from concurrent readers.
    std::shared_ptr<const ValueIndex> build_index(std::string_view field) const;
    std::shared_ptr<const ValueIndex> build_index(size_t column) const;

    /// First row whose field equals `value`.
    std::optional<size_t> find(std::string_view field, const CellValue& value) const;
    /// Every row whose field equals `value`, ascending.
    std::vector<size_t> find_all(std::string_view field, const CellValue& value) const;

    /// Groups in first-seen order; Null forms its own group.
    std::vector<Group> group_by(std::string_view field) const;

    /// Ascending indices of the rows satisfying `predicate`.
    std::vector<size_t> filter(const std::function<bool(const Row&)>& predicate) const;

private:
    struct IndexCache {
        std::mutex mutex;
        std::unordered_map<size_t, std::shared_ptr<const ValueIndex>> by_column;
    };

    size_t require_column(std::string_view field) const;
    void reset() noexcept;

    std::string name_;
    std::shared_ptr<const ColumnNames> names_;
    std::vector<Row> rows_;
    std::vector<std::vector<CellValue>> columns_;
    std::unique_ptr<IndexCache> cache_;
};

} // namespace typedcsv

#endif // TYPEDCSV_TYPED_STORE_H
