#include "schema_binder.h"

#include "common_defs.h"
#include "error.h"

#include <algorithm>

namespace typedcsv {

size_t ColumnBinding::required_width() const {
  size_t width = 0;
  for (size_t c : columns) {
    width = std::max(width, c + 1);
  }
  return width;
}

bool bind_to_header(const Schema& schema, const std::vector<std::string_view>& header,
                    ColumnBinding& out, ErrorCollector& errors, size_t line, size_t offset) {
  out = ColumnBinding();
  out.from_header = true;
  out.column_names.reserve(header.size());

  bool any_name = false;
  for (auto h : header) {
    std::string_view name = trim_view(h);
    any_name = any_name || !name.empty();
    out.column_names.emplace_back(name);
  }
  if (!any_name) {
    errors.add_error(ErrorCode::EMPTY_HEADER, ErrorSeverity::FATAL, line, 1, offset,
                     "Header line is empty");
    return false;
  }

  for (size_t i = 0; i < out.column_names.size(); ++i) {
    const std::string& a = out.column_names[i];
    if (a.empty()) continue;
    for (size_t j = i + 1; j < out.column_names.size(); ++j) {
      if (iequals(a, out.column_names[j])) {
        errors.add_error(ErrorCode::DUPLICATE_COLUMN_NAMES, ErrorSeverity::FATAL, line, j + 1,
                         offset, "Duplicate header name '" + out.column_names[j] + "'",
                         out.column_names[j]);
        return false;
      }
    }
  }

  if (schema.empty()) {
    for (size_t c = 0; c < out.column_names.size(); ++c) {
      out.columns.push_back(c);
    }
    return true;
  }

  for (const auto& field : schema.fields()) {
    const FieldId& id = field.id;
    if (id.is_ordinal()) {
      if (id.column() >= out.column_names.size()) {
        errors.add_error(ErrorCode::UNRESOLVED_FIELD, ErrorSeverity::FATAL, line, 1, offset,
                         "Column " + id.to_string() + " is beyond the header's " +
                             std::to_string(out.column_names.size()) + " columns",
                         id.to_string());
        return false;
      }
      out.columns.push_back(id.column());
      continue;
    }

    size_t found = out.column_names.size();
    for (size_t c = 0; c < out.column_names.size(); ++c) {
      if (iequals(out.column_names[c], id.name())) {
        found = c;
        break;
      }
    }
    if (found == out.column_names.size()) {
      errors.add_error(ErrorCode::UNRESOLVED_FIELD, ErrorSeverity::FATAL, line, 1, offset,
                       "Header '" + id.name() + "' not found", id.name());
      return false;
    }
    out.columns.push_back(found);
  }
  return true;
}

ColumnBinding bind_ordinal(const Schema& schema) {
  ColumnBinding out;
  out.from_header = false;

  const auto& fields = schema.fields();
  for (size_t k = 0; k < fields.size(); ++k) {
    out.columns.push_back(fields[k].id.is_ordinal() ? fields[k].id.column() : k);
  }

  out.column_names.assign(out.required_width(), std::string());
  for (size_t k = 0; k < fields.size(); ++k) {
    const std::string& name = fields[k].id.name();
    if (!name.empty() && out.column_names[out.columns[k]].empty()) {
      out.column_names[out.columns[k]] = name;
    }
  }
  return out;
}

} // namespace typedcsv
