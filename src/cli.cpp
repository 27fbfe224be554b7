/**
 * typedcsv - Command-line front end for loading, inspecting and validating
 * CSV files with typedcsv.
 */

#include "typedcsv.h"

#include "common_defs.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace std;

constexpr size_t MAX_COLUMN_WIDTH = 40;
constexpr size_t DEFAULT_NUM_ROWS = 10;

void printVersion() {
  cout << "typedcsv version " << TYPEDCSV_VERSION_STRING << '\n';
}

void printUsage(const char* prog) {
  cerr << "typedcsv - Schema-bound CSV loading and validation\n\n";
  cerr << "Usage: " << prog << " <command> [options] [csvfile]\n\n";
  cerr << "Commands:\n";
  cerr << "  info          Row/column counts, field names and column types\n";
  cerr << "  head          Display the first N rows as a table (default: " << DEFAULT_NUM_ROWS
       << ")\n";
  cerr << "  group         Count rows per distinct value of a field (-c)\n";
  cerr << "  validate      Check constraints given as options; exit 1 on errors\n";
  cerr << "\nArguments:\n";
  cerr << "  csvfile       Path to CSV file, or '-' to read from stdin.\n";
  cerr << "                If omitted, reads from stdin.\n";
  cerr << "\nOptions:\n";
  cerr << "  -n <num>      Number of rows (for head)\n";
  cerr << "  -c <field>    Field to group by (for group)\n";
  cerr << "  -H            No header row in input\n";
  cerr << "  -d <delim>    Field delimiter\n";
  cerr << "                Values: comma, tab, semicolon, pipe, or single character\n";
  cerr << "  -C <prefix>   Comment prefix (default: #, empty string disables)\n";
  cerr << "  -P <policy>   Missing field policy: throw, default, ignore (default: throw)\n";
  cerr << "  -V            Verbose trace and timing on stderr\n";
  cerr << "  -h            Show this help message\n";
  cerr << "  -v            Show version information\n";
  cerr << "\nConstraints (for validate; each may be repeated):\n";
  cerr << "  --pk F                 Primary key (not null and unique)\n";
  cerr << "  --unique F             Unique values, nulls exempt\n";
  cerr << "  --not-null F           Value required\n";
  cerr << "  --range F:MIN:MAX      Numeric range, inclusive\n";
  cerr << "  --pattern F:REGEX      Value must contain a match of REGEX\n";
  cerr << "  --allowed F:V1|V2|...  Value must be one of the listed values\n";
  cerr << "  --min-length F:N       At least N characters\n";
  cerr << "  --max-length F:N       At most N characters\n";
  cerr << "  A field F is a header name, or #N for the 0-based column N.\n";
  cerr << "\nExamples:\n";
  cerr << "  " << prog << " info data.csv\n";
  cerr << "  " << prog << " head -n 5 data.csv\n";
  cerr << "  " << prog << " group -c Level data.csv\n";
  cerr << "  " << prog << " validate --pk ID --not-null Name --range Level:1:100 data.csv\n";
  cerr << "  cat data.csv | " << prog << " info\n";
}

static bool isStdinInput(const char* filename) {
  return filename == nullptr || strcmp(filename, "-") == 0;
}

static bool parseDelimiter(const string& delimiter_str, char& delimiter) {
  if (delimiter_str == "comma" || delimiter_str == ",") {
    delimiter = ',';
  } else if (delimiter_str == "tab" || delimiter_str == "\\t") {
    delimiter = '\t';
  } else if (delimiter_str == "semicolon" || delimiter_str == ";") {
    delimiter = ';';
  } else if (delimiter_str == "pipe" || delimiter_str == "|") {
    delimiter = '|';
  } else if (delimiter_str.size() == 1) {
    delimiter = delimiter_str[0];
  } else {
    return false;
  }
  return true;
}

static bool parsePolicy(const string& s, typedcsv::MissingFieldPolicy& policy) {
  if (s == "throw") {
    policy = typedcsv::MissingFieldPolicy::Throw;
  } else if (s == "default") {
    policy = typedcsv::MissingFieldPolicy::SetDefault;
  } else if (s == "ignore") {
    policy = typedcsv::MissingFieldPolicy::Ignore;
  } else {
    return false;
  }
  return true;
}

static bool parseSize(const char* s, size_t& out) {
  char* endptr;
  long val = strtol(s, &endptr, 10);
  if (*s == '\0' || *endptr != '\0' || val < 0) return false;
  out = static_cast<size_t>(val);
  return true;
}

static bool parseNumber(const string& s, double& out) {
  auto v = typedcsv::parse_double(typedcsv::trim_view(s));
  if (!v) return false;
  out = *v;
  return true;
}

// Split "F:rest" at the first ':'
static bool splitField(const string& arg, string& field, string& rest) {
  size_t colon = arg.find(':');
  if (colon == string::npos || colon == 0) return false;
  field = arg.substr(0, colon);
  rest = arg.substr(colon + 1);
  return true;
}

// Constraints collected from the command line, grouped by field in first-seen order
class SchemaSpec {
public:
  void add(const string& field, typedcsv::Constraint c) {
    auto it = std::find(order_.begin(), order_.end(), field);
    if (it == order_.end()) {
      order_.push_back(field);
    }
    constraints_[field].push_back(std::move(c));
  }

  bool empty() const { return order_.empty(); }

  typedcsv::Schema build() const {
    typedcsv::Schema::Builder builder;
    for (const auto& field : order_) {
      size_t column;
      if (field.size() > 1 && field[0] == '#' && parseSize(field.c_str() + 1, column)) {
        builder.ordinal(column);
      } else {
        builder.field(field);
      }
      for (const auto& c : constraints_.at(field)) {
        builder.constrain(c);
      }
    }
    return builder.build();
  }

private:
  vector<string> order_;
  map<string, vector<typedcsv::Constraint>> constraints_;
};

static bool loadInput(const char* filename, string& text) {
  try {
    text = isStdinInput(filename) ? typedcsv::read_text_stdin() : typedcsv::read_text_file(filename);
  } catch (const std::runtime_error& e) {
    cerr << "Error: " << e.what() << '\n';
    return false;
  }
  return true;
}

// Parse the input, reporting a fatal error on stderr
static bool parseInput(const string& text, const typedcsv::Schema& schema,
                       const typedcsv::LoaderOptions& options, typedcsv::LoadResult& result) {
  result = typedcsv::parse(text, schema, options);
  if (!result) {
    cerr << "Error: " << result.error().to_string() << '\n';
    return false;
  }
  return true;
}

static string columnLabel(const typedcsv::TypedStore& store, size_t column) {
  const auto names = store.column_names();
  if (column < names.size() && !names[column].empty()) return names[column];
  return "#" + to_string(column);
}

static string displayValue(const typedcsv::CellValue& v) {
  return v.is_null() ? string() : v.to_string();
}

// Command: info
int cmdInfo(const char* filename, const string& text, const typedcsv::LoadResult& result) {
  const auto& store = result.store();

  cout << "Source: " << (isStdinInput(filename) ? "<stdin>" : filename) << '\n';
  cout << "Size: " << text.size() << " bytes\n";
  cout << "Rows: " << store.num_rows() << '\n';
  cout << "Columns: " << store.num_columns() << '\n';

  cout << "\nColumns:\n";
  for (size_t c = 0; c < store.num_columns(); ++c) {
    size_t counts[5] = {0, 0, 0, 0, 0};
    for (const auto& v : store.column(c)) {
      ++counts[static_cast<size_t>(v.type())];
    }
    // Most frequent non-null type; null only when the column is all null
    size_t best = 0;
    for (size_t t = 1; t < 5; ++t) {
      if (counts[t] > 0 && (best == 0 || counts[t] > counts[best])) best = t;
    }
    cout << "  " << c << ": " << columnLabel(store, c) << " ("
         << typedcsv::cell_type_to_string(static_cast<typedcsv::CellType>(best)) << ", "
         << counts[0] << " null)\n";
  }

  auto warnings = result.warnings();
  if (!warnings.empty()) {
    cout << "\nWarnings: " << warnings.size() << '\n';
  }
  return 0;
}

// Command: head
int cmdHead(const typedcsv::LoadResult& result, size_t num_rows) {
  const auto& store = result.store();
  const size_t n = std::min(num_rows, store.num_rows());
  const size_t num_cols = store.num_columns();
  if (num_cols == 0) return 0;

  vector<size_t> widths(num_cols, 0);
  for (size_t c = 0; c < num_cols; ++c) {
    widths[c] = typedcsv::utf8_display_width(columnLabel(store, c));
    for (size_t r = 0; r < n; ++r) {
      widths[c] = max(widths[c], typedcsv::utf8_display_width(displayValue(store.column(c)[r])));
    }
    widths[c] = min(widths[c], MAX_COLUMN_WIDTH);
  }

  auto printSep = [&]() {
    cout << '+';
    for (size_t c = 0; c < num_cols; ++c) {
      cout << string(widths[c] + 2, '-') << '+';
    }
    cout << '\n';
  };

  auto printCells = [&](const vector<string>& cells) {
    cout << '|';
    for (size_t c = 0; c < num_cols; ++c) {
      cout << ' ' << typedcsv::utf8_pad_right(cells[c], widths[c]) << " |";
    }
    cout << '\n';
  };

  vector<string> cells(num_cols);
  printSep();
  for (size_t c = 0; c < num_cols; ++c) {
    cells[c] = columnLabel(store, c);
  }
  printCells(cells);
  printSep();
  for (size_t r = 0; r < n; ++r) {
    for (size_t c = 0; c < num_cols; ++c) {
      cells[c] = displayValue(store.column(c)[r]);
    }
    printCells(cells);
  }
  printSep();
  return 0;
}

// Command: group
int cmdGroup(const typedcsv::LoadResult& result, const string& field) {
  const auto& store = result.store();
  if (!store.has_field(field)) {
    cerr << "Error: Unknown field '" << field << "'\n";
    return 1;
  }

  for (const auto& group : store.group_by(field)) {
    cout << (group.key.is_null() ? "<null>" : group.key.to_string()) << '\t' << group.rows.size()
         << '\n';
  }
  return 0;
}

// Command: validate
int cmdValidate(const typedcsv::LoadResult& result, const typedcsv::Schema& schema,
                typedcsv::DebugTrace* trace) {
  const auto& store = result.store();

  typedcsv::ValidationReport report;
  try {
    typedcsv::ConstraintEvaluator evaluator(store, schema, trace);
    report = evaluator.run();
  } catch (const typedcsv::SchemaException& e) {
    cerr << "Error: " << e.what() << '\n';
    return 1;
  }

  for (const auto& w : result.warnings()) {
    report.add_warning(w.row == typedcsv::ParseError::npos ? 0 : w.row, string(), w.message);
  }

  cout << report.summary();
  if (report.is_valid() && !report.has_warnings()) cout << '\n';
  return report.is_valid() ? 0 : 1;
}

enum LongOption {
  OPT_PK = 256,
  OPT_UNIQUE,
  OPT_NOT_NULL,
  OPT_RANGE,
  OPT_PATTERN,
  OPT_ALLOWED,
  OPT_MIN_LENGTH,
  OPT_MAX_LENGTH
};

int main(int argc, char* argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  if (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0) {
    printUsage(argv[0]);
    return 0;
  }
  if (strcmp(argv[1], "-v") == 0 || strcmp(argv[1], "--version") == 0) {
    printVersion();
    return 0;
  }

  string command = argv[1];
  optind = 2;

  size_t num_rows = DEFAULT_NUM_ROWS;
  string group_field;
  bool verbose = false;
  typedcsv::LoaderOptions options;
  options.validation_enabled = false;
  options.throw_on_validation_error = false;
  SchemaSpec spec;

  static const struct option long_options[] = {
      {"pk", required_argument, nullptr, OPT_PK},
      {"unique", required_argument, nullptr, OPT_UNIQUE},
      {"not-null", required_argument, nullptr, OPT_NOT_NULL},
      {"range", required_argument, nullptr, OPT_RANGE},
      {"pattern", required_argument, nullptr, OPT_PATTERN},
      {"allowed", required_argument, nullptr, OPT_ALLOWED},
      {"min-length", required_argument, nullptr, OPT_MIN_LENGTH},
      {"max-length", required_argument, nullptr, OPT_MAX_LENGTH},
      {"help", no_argument, nullptr, 'h'},
      {"version", no_argument, nullptr, 'v'},
      {nullptr, 0, nullptr, 0}};

  int c;
  while ((c = getopt_long(argc, argv, "n:c:Hd:C:P:Vhv", long_options, nullptr)) != -1) {
    string field, rest;
    switch (c) {
    case 'n':
      if (!parseSize(optarg, num_rows)) {
        cerr << "Error: Invalid row count '" << optarg << "'\n";
        return 1;
      }
      break;
    case 'c':
      group_field = optarg;
      break;
    case 'H':
      options.has_header = false;
      break;
    case 'd':
      if (!parseDelimiter(optarg, options.delimiter)) {
        cerr << "Error: Invalid delimiter '" << optarg << "'\n";
        return 1;
      }
      break;
    case 'C':
      options.comment_prefix = optarg;
      break;
    case 'P':
      if (!parsePolicy(optarg, options.missing_field_policy)) {
        cerr << "Error: Invalid missing field policy '" << optarg << "'\n";
        return 1;
      }
      break;
    case 'V':
      verbose = true;
      break;
    case OPT_PK:
      spec.add(optarg, typedcsv::Constraint::primary_key());
      break;
    case OPT_UNIQUE:
      spec.add(optarg, typedcsv::Constraint::unique());
      break;
    case OPT_NOT_NULL:
      spec.add(optarg, typedcsv::Constraint::not_null());
      break;
    case OPT_RANGE: {
      double lo, hi;
      size_t colon;
      if (!splitField(optarg, field, rest) || (colon = rest.find(':')) == string::npos ||
          !parseNumber(rest.substr(0, colon), lo) || !parseNumber(rest.substr(colon + 1), hi)) {
        cerr << "Error: --range expects FIELD:MIN:MAX, got '" << optarg << "'\n";
        return 1;
      }
      spec.add(field, typedcsv::Constraint::range(lo, hi));
      break;
    }
    case OPT_PATTERN:
      if (!splitField(optarg, field, rest)) {
        cerr << "Error: --pattern expects FIELD:REGEX, got '" << optarg << "'\n";
        return 1;
      }
      spec.add(field, typedcsv::Constraint::matches(rest));
      break;
    case OPT_ALLOWED: {
      if (!splitField(optarg, field, rest)) {
        cerr << "Error: --allowed expects FIELD:V1|V2, got '" << optarg << "'\n";
        return 1;
      }
      vector<string> values;
      size_t start = 0;
      while (true) {
        size_t bar = rest.find('|', start);
        values.push_back(rest.substr(start, bar - start));
        if (bar == string::npos) break;
        start = bar + 1;
      }
      spec.add(field, typedcsv::Constraint::allowed_text(values));
      break;
    }
    case OPT_MIN_LENGTH:
    case OPT_MAX_LENGTH: {
      size_t n;
      if (!splitField(optarg, field, rest) || !parseSize(rest.c_str(), n)) {
        cerr << "Error: length constraint expects FIELD:N, got '" << optarg << "'\n";
        return 1;
      }
      spec.add(field, c == OPT_MIN_LENGTH ? typedcsv::Constraint::min_length(n)
                                          : typedcsv::Constraint::max_length(n));
      break;
    }
    case 'h':
      printUsage(argv[0]);
      return 0;
    case 'v':
      printVersion();
      return 0;
    default:
      printUsage(argv[0]);
      return 1;
    }
  }

  const char* filename = nullptr;
  if (optind < argc) {
    filename = argv[optind];
  }

  if (command != "info" && command != "head" && command != "group" && command != "validate") {
    cerr << "Error: Unknown command '" << command << "'\n";
    printUsage(argv[0]);
    return 1;
  }
  if (command == "group" && group_field.empty()) {
    cerr << "Error: -c option required for group command\n";
    return 1;
  }
  if (command == "validate" && spec.empty()) {
    cerr << "Error: validate needs at least one constraint option\n";
    return 1;
  }

  typedcsv::DebugConfig debug_config;
  debug_config.verbose = verbose;
  debug_config.timing = verbose;
  typedcsv::DebugTrace trace(debug_config);
  if (verbose) options.trace = &trace;

  string text;
  if (!loadInput(filename, text)) return 1;
  if (!isStdinInput(filename)) options.data_name = typedcsv::file_stem(filename);

  // Only validate binds a schema; the other commands see every column
  typedcsv::Schema schema;
  try {
    if (command == "validate") schema = spec.build();
  } catch (const typedcsv::SchemaException& e) {
    cerr << "Error: " << e.what() << '\n';
    return 1;
  }

  typedcsv::LoadResult result{std::vector<typedcsv::ParseError>()};
  if (!parseInput(text, schema, options, result)) return 1;

  int status = 0;
  if (command == "info") {
    status = cmdInfo(filename, text, result);
  } else if (command == "head") {
    status = cmdHead(result, num_rows);
  } else if (command == "group") {
    status = cmdGroup(result, group_field);
  } else {
    status = cmdValidate(result, schema, options.trace);
  }

  if (verbose) trace.print_timing_summary();
  std::cout.flush();
  return status;
}
