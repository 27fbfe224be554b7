#ifndef TYPEDCSV_ERROR_H
#define TYPEDCSV_ERROR_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace typedcsv {

// CSV load error types
enum class ErrorCode {
    NONE = 0,

    // Quote-related errors
    UNCLOSED_QUOTE,              // Quoted field not closed before end of line

    // Header and binding errors
    EMPTY_HEADER,                // Header line missing or blank
    DUPLICATE_COLUMN_NAMES,      // Header contains duplicate column names
    UNRESOLVED_FIELD,            // Schema field has no matching header column

    // Field structure errors
    INCONSISTENT_FIELD_COUNT,    // Row has different number of fields than header
    MISSING_FIELD,               // Schema-bound column beyond the row's last field

    // General errors
    IO_ERROR                     // File I/O error
};

// Error severity levels
enum class ErrorSeverity {
    WARNING,    // Recovered locally (e.g., short row under SetDefault policy)
    FATAL       // Aborts the load (e.g., unclosed quote)
};

// Detailed error information
struct ParseError {
    ErrorCode code;
    ErrorSeverity severity;

    // Location information
    size_t line;          // Line number (1-indexed)
    size_t column;        // Column number (1-indexed)
    size_t byte_offset;   // Byte offset in the source text

    // Context
    std::string message;  // Human-readable error message
    std::string context;  // Snippet of problematic data

    // Data row the error belongs to (0-indexed), or npos for header/structure errors
    size_t row = npos;

    static constexpr size_t npos = static_cast<size_t>(-1);

    ParseError(ErrorCode c, ErrorSeverity s, size_t l, size_t col,
               size_t offset, const std::string& msg, const std::string& ctx = "")
        : code(c), severity(s), line(l), column(col),
          byte_offset(offset), message(msg), context(ctx) {}

    // Convert error to string
    std::string to_string() const;
};

// Error collector - accumulates warnings and fatal errors during loading
class ErrorCollector {
public:
    ErrorCollector() : has_fatal_(false) {}

    void add_error(const ParseError& error) {
        errors_.push_back(error);
        if (error.severity == ErrorSeverity::FATAL) {
            has_fatal_ = true;
        }
    }

    void add_error(ErrorCode code, ErrorSeverity severity, size_t line,
                   size_t column, size_t offset, const std::string& message,
                   const std::string& context = "") {
        add_error(ParseError(code, severity, line, column, offset, message, context));
    }

    bool has_fatal_errors() const { return has_fatal_; }
    size_t error_count() const { return errors_.size(); }
    size_t warning_count() const;
    const std::vector<ParseError>& errors() const { return errors_; }

    // First fatal error, or nullptr
    const ParseError* first_fatal() const;

private:
    std::vector<ParseError> errors_;
    bool has_fatal_;
};

// Exception thrown for fatal load errors (when using exceptions)
class ParseException : public std::runtime_error {
public:
    explicit ParseException(const ParseError& error)
        : std::runtime_error(error.message), error_(error) {}

    const ParseError& error() const { return error_; }

private:
    ParseError error_;
};

// Thrown before validation starts when a constraint declaration is unusable
class SchemaException : public std::invalid_argument {
public:
    SchemaException(const std::string& field, const std::string& message)
        : std::invalid_argument("Invalid constraint on field '" + field + "': " + message),
          field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

const char* error_code_to_string(ErrorCode code);
const char* error_severity_to_string(ErrorSeverity severity);

} // namespace typedcsv

#endif // TYPEDCSV_ERROR_H
