#include "csv_loader.h"

#include "common_defs.h"
#include "debug.h"
#include "io_util.h"
#include "schema_binder.h"
#include "tokenizer.h"
#include "utf8.h"

#include <algorithm>

namespace typedcsv {

const char* missing_field_policy_to_string(MissingFieldPolicy policy) {
  switch (policy) {
  case MissingFieldPolicy::Throw:
    return "throw";
  case MissingFieldPolicy::SetDefault:
    return "set_default";
  case MissingFieldPolicy::Ignore:
    return "ignore";
  }
  return "unknown";
}

TypedStore& LoadResult::store() {
  if (!store_) throw ParseException(error());
  return *store_;
}

const TypedStore& LoadResult::store() const {
  if (!store_) throw ParseException(error());
  return *store_;
}

TypedStore LoadResult::take_store() {
  if (!store_) throw ParseException(error());
  TypedStore out = std::move(*store_);
  store_.reset();
  return out;
}

const ParseError& LoadResult::error() const {
  for (const auto& e : errors_) {
    if (e.severity == ErrorSeverity::FATAL) return e;
  }
  throw std::logic_error("LoadResult holds no fatal error");
}

std::vector<ParseError> LoadResult::warnings() const {
  std::vector<ParseError> out;
  for (const auto& e : errors_) {
    if (e.severity == ErrorSeverity::WARNING) out.push_back(e);
  }
  return out;
}

namespace {

constexpr size_t kContextLength = 64;

class Loader {
public:
  Loader(std::string_view text, const Schema& schema, const LoaderOptions& options)
      : schema_(schema), options_(options),
        tokenizer_(options.delimiter, options.quote_char, options.trim_fields),
        trace_(options.trace) {
    text_ = strip_utf8_bom(text);
    bom_ = text.size() - text_.size();
  }

  LoadResult run() {
    if (trace_) {
      trace_->start_phase("parse");
      trace_->log_options(options_.delimiter, options_.quote_char, options_.has_header,
                          missing_field_policy_to_string(options_.missing_field_policy));
      if (bom_ > 0) trace_->log("Skipped UTF-8 BOM");
    }

    LineSplitter lines(text_);
    Line line;

    if (options_.has_header) {
      if (!next_line(lines, line)) {
        errors_.add_error(ErrorCode::EMPTY_HEADER, ErrorSeverity::FATAL, 1, 1, bom_,
                          "Header line is missing");
        return fail();
      }
      if (!tokenizer_.tokenize(line.text, fields_, &errors_, line.number, offset(line))) {
        return fail();
      }
      auto header = field_views(line.text, fields_);
      if (trace_) trace_->dump_fields(line.number, header);
      if (!bind_to_header(schema_, header, binding_, errors_, line.number, offset(line))) {
        return fail();
      }
      expected_ = binding_.width();
    } else {
      binding_ = bind_ordinal(schema_);
      expected_ = binding_.required_width();
    }

    if (trace_) {
      trace_->log("Bound %zu field(s) over %zu column(s)%s", binding_.size(), binding_.width(),
                  binding_.from_header ? " from header" : "");
      for (size_t k = 0; k < binding_.size(); ++k) {
        size_t col = binding_.column_for(k);
        trace_->log("  field %zu -> column %zu '%s'", k, col,
                    binding_.column_names[col].c_str());
      }
    }

    store_ = TypedStore(binding_.column_names, options_.data_name);

    while (next_line(lines, line)) {
      if (!add_row(line)) {
        return fail();
      }
    }

    if (trace_) {
      trace_->log("Loaded %zu row(s), %zu column(s), %zu warning(s)", store_.num_rows(),
                  store_.num_columns(), errors_.warning_count());
      trace_->end_phase(text_.size());
    }
    return LoadResult(std::move(store_), errors_.errors());
  }

private:
  size_t offset(const Line& line) const { return bom_ + line.offset; }

  bool is_comment(std::string_view trimmed) const {
    const std::string& prefix = options_.comment_prefix;
    return !prefix.empty() && trimmed.substr(0, prefix.size()) == prefix;
  }

  // Advance to the next line that is neither blank (when skipped) nor a comment
  bool next_line(LineSplitter& lines, Line& line) {
    while (lines.next(line)) {
      std::string_view trimmed = trim_view(line.text);
      if (options_.ignore_empty_lines && trimmed.empty()) {
        if (trace_) trace_->log("Skipping blank line %zu", line.number);
        continue;
      }
      if (is_comment(trimmed)) {
        if (trace_) trace_->log("Skipping comment line %zu", line.number);
        continue;
      }
      return true;
    }
    return false;
  }

  CellValue coerce(const FieldSpan& field, std::string_view line) const {
    std::string_view text = field.view(line);
    if (!field.quoted && options_.trim_fields) {
      text = trim_view(text);
    }
    return coerce_value(text);
  }

  bool add_row(const Line& line) {
    const size_t row_index = store_.num_rows();
    if (!tokenizer_.tokenize(line.text, fields_, &errors_, line.number, offset(line))) {
      return false;
    }
    if (trace_ && trace_->dump_rows()) {
      trace_->dump_fields(line.number, field_views(line.text, fields_));
    }

    std::vector<CellValue> cells;
    cells.reserve(std::max(fields_.size(), expected_));
    for (const auto& f : fields_) {
      cells.push_back(coerce(f, line.text));
    }

    const size_t n = fields_.size();
    const bool mismatch = binding_.from_header ? n != expected_ : n < expected_;
    if (mismatch && !recover(line, row_index, cells)) {
      return false;
    }

    store_.add(Row(std::move(cells)));
    return true;
  }

  // Apply the missing-field policy to a row whose width doesn't fit the binding
  bool recover(const Line& line, size_t row_index, std::vector<CellValue>& cells) {
    const size_t n = cells.size();
    const MissingFieldPolicy policy = options_.missing_field_policy;

    ErrorCode code;
    std::string message;
    if (binding_.from_header) {
      code = ErrorCode::INCONSISTENT_FIELD_COUNT;
      message = "Expected " + std::to_string(expected_) + " fields but found " + std::to_string(n);
    } else {
      code = ErrorCode::MISSING_FIELD;
      message = "Row has " + std::to_string(n) + " field(s) but field '" +
                first_missing_field(n) + "' is bound to a later column";
    }

    if (policy == MissingFieldPolicy::Throw) {
      ParseError err(code, ErrorSeverity::FATAL, line.number, std::min(n, expected_) + 1,
                     offset(line), message, std::string(line.text.substr(0, kContextLength)));
      err.row = row_index;
      errors_.add_error(err);
      return false;
    }

    if (n > expected_) {
      message += "; extra columns kept";
    } else if (policy == MissingFieldPolicy::SetDefault) {
      cells.resize(expected_);
      message += "; missing fields set to null";
    } else {
      message += "; missing fields left out";
    }

    ParseError warn(code, ErrorSeverity::WARNING, line.number, std::min(n, expected_) + 1,
                    offset(line), message, std::string(line.text.substr(0, kContextLength)));
    warn.row = row_index;
    errors_.add_error(warn);
    if (trace_) trace_->log("Line %zu: %s", line.number, message.c_str());
    return true;
  }

  std::string first_missing_field(size_t width) const {
    for (size_t k = 0; k < binding_.size(); ++k) {
      if (binding_.column_for(k) >= width) {
        return schema_.field(k).id.to_string();
      }
    }
    return std::string();
  }

  LoadResult fail() {
    if (trace_) {
      if (const ParseError* err = errors_.first_fatal()) {
        trace_->log("Load failed: %s", err->to_string().c_str());
      }
      trace_->end_phase(text_.size());
    }
    return LoadResult(errors_.errors());
  }

  std::string_view text_;
  size_t bom_ = 0;
  const Schema& schema_;
  const LoaderOptions& options_;
  Tokenizer tokenizer_;
  ErrorCollector errors_;
  DebugTrace* trace_;

  ColumnBinding binding_;
  size_t expected_ = 0;
  std::vector<FieldSpan> fields_;
  TypedStore store_;
};

} // namespace

LoadResult parse(std::string_view text, const Schema& schema, const LoaderOptions& options) {
  Loader loader(text, schema, options);
  return loader.run();
}

LoadedData load(std::string_view text, const Schema& schema, const LoaderOptions& options) {
  LoadResult result = parse(text, schema, options);
  if (!result) {
    throw ParseException(result.error());
  }

  LoadedData data{result.take_store(), ValidationReport()};
  if (options.validation_enabled) {
    ConstraintEvaluator evaluator(data.store, schema, options.trace);
    data.report = evaluator.run();
  }
  for (const auto& w : result.warnings()) {
    data.report.add_warning(w.row == ParseError::npos ? 0 : w.row, std::string(), w.message);
  }

  if (options.throw_on_validation_error && !data.report.is_valid()) {
    throw ValidationException(std::move(data.report));
  }
  return data;
}

LoadedData load_file(const std::string& path, const Schema& schema,
                     const LoaderOptions& options) {
  std::string text;
  try {
    text = read_text_file(path);
  } catch (const std::runtime_error& e) {
    throw ParseException(
        ParseError(ErrorCode::IO_ERROR, ErrorSeverity::FATAL, 0, 0, 0, e.what(), path));
  }

  if (!options.data_name.empty()) {
    return load(text, schema, options);
  }
  LoaderOptions named = options;
  named.data_name = file_stem(path);
  return load(text, schema, named);
}

} // namespace typedcsv
