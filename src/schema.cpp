#include "schema.h"

#include "common_defs.h"
#include "error.h"

#include <sstream>
#include <stdexcept>

namespace typedcsv {

std::string FieldId::to_string() const {
  if (!name_.empty()) {
    return name_;
  }
  return "#" + std::to_string(column_);
}

const char* constraint_kind_to_string(ConstraintKind kind) {
  switch (kind) {
  case ConstraintKind::NotNull:
    return "NotNull";
  case ConstraintKind::Unique:
    return "Unique";
  case ConstraintKind::PrimaryKey:
    return "PrimaryKey";
  case ConstraintKind::Range:
    return "Range";
  case ConstraintKind::MinLength:
    return "MinLength";
  case ConstraintKind::MaxLength:
    return "MaxLength";
  case ConstraintKind::Pattern:
    return "Pattern";
  case ConstraintKind::AllowedValues:
    return "AllowedValues";
  case ConstraintKind::TypeCheck:
    return "TypeCheck";
  }
  return "Unknown";
}

Constraint Constraint::not_null() {
  Constraint c;
  c.kind = ConstraintKind::NotNull;
  return c;
}

Constraint Constraint::unique() {
  Constraint c;
  c.kind = ConstraintKind::Unique;
  return c;
}

Constraint Constraint::primary_key() {
  Constraint c;
  c.kind = ConstraintKind::PrimaryKey;
  return c;
}

Constraint Constraint::range(double min, double max) {
  Constraint c;
  c.kind = ConstraintKind::Range;
  c.min = min;
  c.max = max;
  return c;
}

Constraint Constraint::min_length(size_t n) {
  Constraint c;
  c.kind = ConstraintKind::MinLength;
  c.length = n;
  return c;
}

Constraint Constraint::max_length(size_t n) {
  Constraint c;
  c.kind = ConstraintKind::MaxLength;
  c.length = n;
  return c;
}

Constraint Constraint::matches(std::string pattern) {
  Constraint c;
  c.kind = ConstraintKind::Pattern;
  c.pattern = std::move(pattern);
  return c;
}

Constraint Constraint::allowed_values(std::vector<CellValue> values) {
  Constraint c;
  c.kind = ConstraintKind::AllowedValues;
  c.allowed = std::move(values);
  return c;
}

Constraint Constraint::allowed_text(const std::vector<std::string>& values) {
  std::vector<CellValue> coerced;
  coerced.reserve(values.size());
  for (const auto& v : values) {
    coerced.push_back(coerce_value(trim_view(v)));
  }
  return allowed_values(std::move(coerced));
}

Constraint Constraint::type_check(CellType type) {
  Constraint c;
  c.kind = ConstraintKind::TypeCheck;
  c.type = type;
  return c;
}

std::string Constraint::describe() const {
  std::ostringstream ss;
  ss << constraint_kind_to_string(kind);
  switch (kind) {
  case ConstraintKind::Range:
    ss << "(" << CellValue::real(min).to_string() << ", " << CellValue::real(max).to_string()
       << ")";
    break;
  case ConstraintKind::MinLength:
  case ConstraintKind::MaxLength:
    ss << "(" << length << ")";
    break;
  case ConstraintKind::Pattern:
    ss << "('" << pattern << "')";
    break;
  case ConstraintKind::AllowedValues:
    ss << "[";
    for (size_t i = 0; i < allowed.size(); ++i) {
      if (i > 0) ss << ", ";
      ss << allowed[i].to_string();
    }
    ss << "]";
    break;
  case ConstraintKind::TypeCheck:
    ss << "(" << cell_type_to_string(type) << ")";
    break;
  default:
    break;
  }
  return ss.str();
}

bool FieldDef::has(ConstraintKind kind) const { return find(kind) != nullptr; }

const Constraint* FieldDef::find(ConstraintKind kind) const {
  for (const auto& c : constraints) {
    if (c.kind == kind) return &c;
  }
  return nullptr;
}

Schema Schema::from_names(const std::vector<std::string>& names) {
  Builder builder;
  for (const auto& name : names) {
    builder.field(name);
  }
  return builder.build();
}

std::optional<size_t> Schema::position_of(std::string_view name) const {
  for (size_t i = 0; i < fields_.size(); ++i) {
    const FieldId& id = fields_[i].id;
    if (!id.name().empty() && iequals(id.name(), name)) {
      return i;
    }
  }
  return std::nullopt;
}

std::vector<ConstraintEntry> Schema::constraints() const {
  std::vector<ConstraintEntry> entries;
  for (size_t i = 0; i < fields_.size(); ++i) {
    for (const auto& c : fields_[i].constraints) {
      entries.push_back(ConstraintEntry{i, &c});
    }
  }
  return entries;
}

bool Schema::has_constraints() const {
  for (const auto& f : fields_) {
    if (!f.constraints.empty()) return true;
  }
  return false;
}

Schema::Builder& Schema::Builder::field(std::string name) {
  fields_.push_back(FieldDef{FieldId::named(std::string(trim_view(name))), {}});
  return *this;
}

Schema::Builder& Schema::Builder::ordinal(size_t column, std::string name) {
  fields_.push_back(FieldDef{FieldId::ordinal(column, std::move(name)), {}});
  return *this;
}

Schema::Builder& Schema::Builder::constrain(Constraint c) {
  if (fields_.empty()) {
    throw std::logic_error("Constraint declared before any field");
  }
  fields_.back().constraints.push_back(std::move(c));
  return *this;
}

Schema Schema::Builder::build() const {
  for (size_t i = 0; i < fields_.size(); ++i) {
    const FieldId& a = fields_[i].id;
    if (a.is_ordinal()) continue;
    if (a.name().empty()) {
      throw SchemaException(a.name(), "field name is empty");
    }
    for (size_t j = i + 1; j < fields_.size(); ++j) {
      const FieldId& b = fields_[j].id;
      if (!b.is_ordinal() && iequals(a.name(), b.name())) {
        throw SchemaException(b.name(), "field is declared more than once");
      }
    }
  }

  Schema schema;
  schema.fields_ = fields_;
  return schema;
}

} // namespace typedcsv
