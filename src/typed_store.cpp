#include "typed_store.h"

#include "common_defs.h"

#include <stdexcept>

namespace typedcsv {

namespace {

std::string lower_key(std::string_view s) {
  std::string key(s);
  for (auto& c : key) {
    c = ascii_lower(c);
  }
  return key;
}

const CellValue& null_cell() {
  static const CellValue null;
  return null;
}

const std::shared_ptr<const ColumnNames>& empty_names() {
  static const std::shared_ptr<const ColumnNames> names = std::make_shared<const ColumnNames>();
  return names;
}

} // namespace

ColumnNames::ColumnNames(std::vector<std::string> names) : names_(std::move(names)) {
  for (size_t i = 0; i < names_.size(); ++i) {
    if (names_[i].empty()) continue;
    // First column wins when two columns share a name
    lookup_.emplace(lower_key(names_[i]), i);
  }
}

const std::string& ColumnNames::name(size_t column) const {
  static const std::string unnamed;
  return column < names_.size() ? names_[column] : unnamed;
}

std::optional<size_t> ColumnNames::find(std::string_view name) const {
  auto it = lookup_.find(lower_key(trim_view(name)));
  if (it == lookup_.end()) return std::nullopt;
  return it->second;
}

bool Row::has_field(std::string_view field) const {
  if (!names_) return false;
  auto col = names_->find(field);
  return col && *col < cells_.size();
}

const CellValue& Row::get(std::string_view field) const {
  if (!names_) {
    throw std::out_of_range("Row is not attached to a store");
  }
  auto col = names_->find(field);
  if (!col) {
    throw std::out_of_range("Unknown field '" + std::string(field) + "'");
  }
  return *col < cells_.size() ? cells_[*col] : null_cell();
}

const CellValue& Row::at(size_t column) const {
  if (column >= cells_.size()) {
    throw std::out_of_range("Column " + std::to_string(column) + " out of range (row has " +
                            std::to_string(cells_.size()) + " cells)");
  }
  return cells_[column];
}

ValueIndex::ValueIndex(const std::vector<CellValue>& column) {
  for (size_t i = 0; i < column.size(); ++i) {
    map_[column[i]].push_back(i);
  }
}

const std::vector<size_t>& ValueIndex::rows(const CellValue& value) const {
  static const std::vector<size_t> none;
  auto it = map_.find(value);
  return it == map_.end() ? none : it->second;
}

TypedStore::TypedStore()
    : names_(std::make_shared<const ColumnNames>()), cache_(std::make_unique<IndexCache>()) {}

TypedStore::TypedStore(std::vector<std::string> column_names, std::string name)
    : name_(std::move(name)), columns_(column_names.size()),
      cache_(std::make_unique<IndexCache>()) {
  names_ = std::make_shared<const ColumnNames>(std::move(column_names));
}

TypedStore::TypedStore(TypedStore&& other) noexcept
    : name_(std::move(other.name_)), names_(std::move(other.names_)),
      rows_(std::move(other.rows_)), columns_(std::move(other.columns_)),
      cache_(std::move(other.cache_)) {
  other.reset();
}

TypedStore& TypedStore::operator=(TypedStore&& other) noexcept {
  if (this != &other) {
    name_ = std::move(other.name_);
    names_ = std::move(other.names_);
    rows_ = std::move(other.rows_);
    columns_ = std::move(other.columns_);
    cache_ = std::move(other.cache_);
    other.reset();
  }
  return *this;
}

// A moved-from store reads as an empty store with no columns
void TypedStore::reset() noexcept {
  name_.clear();
  rows_.clear();
  columns_.clear();
  names_ = empty_names();
  cache_.reset();
}

void TypedStore::add(Row row) {
  const size_t existing = rows_.size();
  while (columns_.size() < row.size()) {
    columns_.emplace_back(existing, CellValue::null());
  }
  for (size_t c = 0; c < columns_.size(); ++c) {
    columns_[c].push_back(c < row.size() ? row.cells_[c] : CellValue::null());
  }

  row.names_ = names_;
  rows_.push_back(std::move(row));

  if (cache_) {
    std::lock_guard<std::mutex> lock(cache_->mutex);
    cache_->by_column.clear();
  }
}

std::vector<std::string> TypedStore::column_names() const {
  std::vector<std::string> out;
  out.reserve(columns_.size());
  for (size_t c = 0; c < columns_.size(); ++c) {
    out.push_back(names_->name(c));
  }
  return out;
}

std::vector<std::string> TypedStore::field_names() const {
  std::vector<std::string> out;
  for (size_t c = 0; c < columns_.size(); ++c) {
    if (!names_->name(c).empty()) out.push_back(names_->name(c));
  }
  return out;
}

std::optional<size_t> TypedStore::resolve(const FieldId& id) const {
  if (id.is_ordinal()) {
    if (id.column() < columns_.size()) return id.column();
    return std::nullopt;
  }
  auto col = names_->find(id.name());
  if (col && *col < columns_.size()) return col;
  return std::nullopt;
}

const Row& TypedStore::row(size_t i) const {
  if (i >= rows_.size()) {
    throw std::out_of_range("Row " + std::to_string(i) + " out of range (store has " +
                            std::to_string(rows_.size()) + " rows)");
  }
  return rows_[i];
}

size_t TypedStore::require_column(std::string_view field) const {
  auto col = names_->find(field);
  if (!col || *col >= columns_.size()) {
    throw std::out_of_range("Unknown field '" + std::string(field) + "'");
  }
  return *col;
}

const std::vector<CellValue>& TypedStore::column(std::string_view field) const {
  return columns_[require_column(field)];
}

const std::vector<CellValue>& TypedStore::column(size_t column) const {
  if (column >= columns_.size()) {
    throw std::out_of_range("Column " + std::to_string(column) + " out of range (store has " +
                            std::to_string(columns_.size()) + " columns)");
  }
  return columns_[column];
}

std::shared_ptr<const ValueIndex> TypedStore::build_index(std::string_view field) const {
  return build_index(require_column(field));
}

std::shared_ptr<const ValueIndex> TypedStore::build_index(size_t col) const {
  const auto& values = column(col);
  if (!cache_) {
    return std::make_shared<const ValueIndex>(values);
  }

  {
    std::lock_guard<std::mutex> lock(cache_->mutex);
    auto it = cache_->by_column.find(col);
    if (it != cache_->by_column.end()) return it->second;
  }

  // Built outside the lock; a concurrent reader may build the same index
  auto index = std::make_shared<const ValueIndex>(values);

  std::lock_guard<std::mutex> lock(cache_->mutex);
  auto inserted = cache_->by_column.emplace(col, std::move(index));
  return inserted.first->second;
}

std::optional<size_t> TypedStore::find(std::string_view field, const CellValue& value) const {
  const auto& values = column(field);
  for (size_t i = 0; i < values.size(); ++i) {
    if (values[i] == value) return i;
  }
  return std::nullopt;
}

std::vector<size_t> TypedStore::find_all(std::string_view field, const CellValue& value) const {
  return build_index(field)->rows(value);
}

std::vector<Group> TypedStore::group_by(std::string_view field) const {
  const auto& values = column(field);
  std::vector<Group> groups;
  std::unordered_map<CellValue, size_t, CellValueHash> position;

  for (size_t i = 0; i < values.size(); ++i) {
    auto it = position.find(values[i]);
    if (it == position.end()) {
      position.emplace(values[i], groups.size());
      groups.push_back(Group{values[i], {i}});
    } else {
      groups[it->second].rows.push_back(i);
    }
  }
  return groups;
}

std::vector<size_t> TypedStore::filter(const std::function<bool(const Row&)>& predicate) const {
  std::vector<size_t> out;
  for (size_t i = 0; i < rows_.size(); ++i) {
    if (predicate(rows_[i])) out.push_back(i);
  }
  return out;
}

} // namespace typedcsv
