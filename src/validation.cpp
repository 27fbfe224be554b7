#include "validation.h"

#include "common_defs.h"
#include "debug.h"
#include "error.h"
#include "utf8.h"

#include <re2/re2.h>

#include <sstream>
#include <unordered_set>

namespace typedcsv {

std::string ValidationIssue::to_string() const {
  std::ostringstream ss;
  ss << "[Row " << (row + 1);
  if (!field.empty()) {
    ss << ", Column '" << field << "'";
  }
  ss << "] " << message;
  return ss.str();
}

void ValidationReport::add_error(size_t row, std::string field, std::string message,
                                 std::optional<ConstraintKind> kind) {
  errors_.push_back(ValidationIssue{row, std::move(field), kind, std::move(message)});
}

void ValidationReport::add_warning(size_t row, std::string field, std::string message,
                                   std::optional<ConstraintKind> kind) {
  warnings_.push_back(ValidationIssue{row, std::move(field), kind, std::move(message)});
}

std::vector<ValidationIssue> ValidationReport::errors_for(std::string_view field) const {
  std::vector<ValidationIssue> out;
  for (const auto& e : errors_) {
    if (iequals(e.field, field)) out.push_back(e);
  }
  return out;
}

std::string ValidationReport::summary() const {
  if (errors_.empty() && warnings_.empty()) {
    return "All validations passed";
  }

  std::ostringstream ss;
  ss << errors_.size() << " error(s), " << warnings_.size() << " warning(s)\n";
  for (const auto& e : errors_) {
    ss << "  ERROR   " << e.to_string() << "\n";
  }
  for (const auto& w : warnings_) {
    ss << "  WARNING " << w.to_string() << "\n";
  }
  return ss.str();
}

ValidationException::ValidationException(ValidationReport report)
    : std::runtime_error("Validation failed with " + std::to_string(report.error_count()) +
                         " error(s)"),
      report_(std::move(report)) {}

const char* evaluation_state_to_string(EvaluationState state) {
  switch (state) {
  case EvaluationState::NOT_STARTED:
    return "NOT_STARTED";
  case EvaluationState::RUNNING:
    return "RUNNING";
  case EvaluationState::COMPLETE:
    return "COMPLETE";
  case EvaluationState::FAILED:
    return "FAILED";
  }
  return "UNKNOWN";
}

// A schema field resolved against the store, with its compiled patterns
struct ConstraintEvaluator::Bound {
  size_t column = 0;
  std::string name;
  const FieldDef* def = nullptr;
  // Parallel to def->constraints; set for Pattern constraints only
  std::vector<std::unique_ptr<RE2>> patterns;
  bool has_row_checks = false;
};

ConstraintEvaluator::ConstraintEvaluator(const TypedStore& store, const Schema& schema,
                                         DebugTrace* trace)
    : store_(store), schema_(schema), trace_(trace) {}

ConstraintEvaluator::~ConstraintEvaluator() = default;

void ConstraintEvaluator::prepare() {
  bound_.clear();
  for (const auto& def : schema_.fields()) {
    if (def.constraints.empty()) continue;

    Bound b;
    b.def = &def;
    auto col = store_.resolve(def.id);
    b.name = def.id.to_string();
    if (!col) {
      throw SchemaException(b.name, "field is not present in the data");
    }
    b.column = *col;
    if (def.id.is_ordinal() && def.id.name().empty()) {
      std::string header = store_.column_names()[*col];
      if (!header.empty()) b.name = std::move(header);
    }

    const Constraint* min_len = def.find(ConstraintKind::MinLength);
    const Constraint* max_len = def.find(ConstraintKind::MaxLength);
    if (min_len && max_len && min_len->length > max_len->length) {
      throw SchemaException(b.name, "MinLength " + std::to_string(min_len->length) +
                                        " exceeds MaxLength " +
                                        std::to_string(max_len->length));
    }

    for (const auto& c : def.constraints) {
      std::unique_ptr<RE2> re;
      switch (c.kind) {
      case ConstraintKind::Range:
        if (c.min > c.max) {
          throw SchemaException(b.name, "Range minimum " + CellValue::real(c.min).to_string() +
                                            " exceeds maximum " +
                                            CellValue::real(c.max).to_string());
        }
        break;
      case ConstraintKind::AllowedValues:
        if (c.allowed.empty()) {
          throw SchemaException(b.name, "AllowedValues list is empty");
        }
        break;
      case ConstraintKind::Pattern:
        re = std::make_unique<RE2>(c.pattern, RE2::Quiet);
        if (!re->ok()) {
          throw SchemaException(b.name,
                                "invalid pattern '" + c.pattern + "': " + re->error());
        }
        break;
      default:
        break;
      }
      if (!c.is_column_wide()) b.has_row_checks = true;
      b.patterns.push_back(std::move(re));
    }
    bound_.push_back(std::move(b));
  }
}

void ConstraintEvaluator::check_column(const Bound& b, bool primary_key,
                                       ValidationReport& report) const {
  const auto& values = store_.column(b.column);
  const ConstraintKind kind = primary_key ? ConstraintKind::PrimaryKey : ConstraintKind::Unique;
  std::unordered_set<CellValue, CellValueHash> seen;
  seen.reserve(values.size());

  for (size_t i = 0; i < values.size(); ++i) {
    const CellValue& v = values[i];
    if (v.is_null_or_empty()) {
      if (primary_key) {
        report.add_error(i, b.name, "Primary key cannot be null or empty", kind);
      }
      continue;
    }
    if (!seen.insert(v).second) {
      if (primary_key) {
        report.add_error(i, b.name, "Duplicate primary key value: '" + v.to_string() + "'", kind);
      } else {
        report.add_error(i, b.name, "Duplicate value (Unique constraint): '" + v.to_string() + "'",
                         kind);
      }
    }
  }
}

void ConstraintEvaluator::check_cell(const Bound& b, const Constraint& c, size_t row,
                                     const CellValue& value, ValidationReport& report) const {
  if (c.kind == ConstraintKind::NotNull) {
    if (value.is_null_or_empty()) {
      report.add_error(row, b.name, "Value cannot be null or empty", c.kind);
    }
    return;
  }
  if (value.is_null()) {
    return;
  }

  switch (c.kind) {
  case ConstraintKind::Range: {
    auto n = value.numeric();
    if (n && (*n < c.min || *n > c.max)) {
      report.add_error(row, b.name,
                       "Value " + value.to_string() + " is out of range [" +
                           CellValue::real(c.min).to_string() + ", " +
                           CellValue::real(c.max).to_string() + "]",
                       c.kind);
    }
    break;
  }
  case ConstraintKind::MinLength: {
    size_t len = utf8_length(value.to_string());
    if (len < c.length) {
      report.add_error(row, b.name,
                       "Length " + std::to_string(len) + " is less than minimum " +
                           std::to_string(c.length),
                       c.kind);
    }
    break;
  }
  case ConstraintKind::MaxLength: {
    size_t len = utf8_length(value.to_string());
    if (len > c.length) {
      report.add_error(row, b.name,
                       "Length " + std::to_string(len) + " exceeds maximum " +
                           std::to_string(c.length),
                       c.kind);
    }
    break;
  }
  case ConstraintKind::Pattern: {
    const RE2* re = b.patterns[static_cast<size_t>(&c - b.def->constraints.data())].get();
    std::string text = value.to_string();
    if (!RE2::PartialMatch(text, *re)) {
      report.add_error(row, b.name,
                       "Value '" + text + "' does not match pattern '" + c.pattern + "'", c.kind);
    }
    break;
  }
  case ConstraintKind::AllowedValues: {
    bool found = false;
    for (const auto& allowed : c.allowed) {
      if (allowed == value) {
        found = true;
        break;
      }
    }
    if (!found) {
      std::string list;
      for (size_t i = 0; i < c.allowed.size(); ++i) {
        if (i > 0) list += ", ";
        list += c.allowed[i].to_string();
      }
      report.add_error(row, b.name,
                       "Value '" + value.to_string() + "' is not in allowed values: [" + list +
                           "]",
                       c.kind);
    }
    break;
  }
  case ConstraintKind::TypeCheck:
    if (!is_convertible(value, c.type)) {
      report.add_error(row, b.name,
                       "Value '" + value.to_string() + "' cannot be converted to type " +
                           cell_type_to_string(c.type),
                       c.kind);
    }
    break;
  default:
    break;
  }
}

ValidationReport ConstraintEvaluator::run() {
  if (state_ != EvaluationState::NOT_STARTED) {
    throw std::logic_error("ConstraintEvaluator::run called more than once");
  }

  // Schema problems surface before any row is evaluated
  prepare();
  if (trace_) trace_->start_phase("validate");

  state_ = EvaluationState::RUNNING;
  ValidationReport report;
  try {
    if (trace_) {
      trace_->log("Validating %zu rows against %zu constrained fields", store_.num_rows(),
                  bound_.size());
    }

    for (const auto& b : bound_) {
      if (b.def->has(ConstraintKind::PrimaryKey)) {
        check_column(b, true, report);
      } else if (b.def->has(ConstraintKind::Unique)) {
        check_column(b, false, report);
      }
    }

    for (size_t row = 0; row < store_.num_rows(); ++row) {
      for (const auto& b : bound_) {
        if (!b.has_row_checks) continue;
        const CellValue& value = store_.column(b.column)[row];
        for (const auto& c : b.def->constraints) {
          if (c.is_column_wide()) continue;
          check_cell(b, c, row, value, report);
        }
      }
    }
  } catch (...) {
    state_ = EvaluationState::FAILED;
    if (trace_) trace_->end_phase();
    throw;
  }

  state_ = EvaluationState::COMPLETE;
  if (trace_) {
    trace_->log("Validation complete: %zu error(s), %zu warning(s)", report.error_count(),
                report.warning_count());
    trace_->end_phase();
  }
  return report;
}

ValidationReport validate(const TypedStore& store, const Schema& schema) {
  ConstraintEvaluator evaluator(store, schema);
  return evaluator.run();
}

} // namespace typedcsv
