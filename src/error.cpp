#include "error.h"
#include <sstream>

namespace typedcsv {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::UNCLOSED_QUOTE: return "UNCLOSED_QUOTE";
        case ErrorCode::EMPTY_HEADER: return "EMPTY_HEADER";
        case ErrorCode::DUPLICATE_COLUMN_NAMES: return "DUPLICATE_COLUMN_NAMES";
        case ErrorCode::UNRESOLVED_FIELD: return "UNRESOLVED_FIELD";
        case ErrorCode::INCONSISTENT_FIELD_COUNT: return "INCONSISTENT_FIELD_COUNT";
        case ErrorCode::MISSING_FIELD: return "MISSING_FIELD";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        default: return "UNKNOWN";
    }
}

const char* error_severity_to_string(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string ParseError::to_string() const {
    std::ostringstream ss;
    ss << "[" << error_severity_to_string(severity) << "] "
       << error_code_to_string(code) << " at line " << line
       << ", column " << column << " (byte " << byte_offset << "): "
       << message;

    if (!context.empty()) {
        ss << "\n  Context: " << context;
    }

    return ss.str();
}

size_t ErrorCollector::warning_count() const {
    size_t n = 0;
    for (const auto& err : errors_) {
        if (err.severity == ErrorSeverity::WARNING) ++n;
    }
    return n;
}

const ParseError* ErrorCollector::first_fatal() const {
    for (const auto& err : errors_) {
        if (err.severity == ErrorSeverity::FATAL) return &err;
    }
    return nullptr;
}

} // namespace typedcsv
