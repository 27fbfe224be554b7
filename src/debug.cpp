#include "debug.h"

#include <cstdarg>

namespace typedcsv {

void DebugTrace::log(const char* fmt, ...) {
  if (!config_.verbose) {
    return;
  }
  FILE* f = out();
  std::fputs("[typedcsv] ", f);
  va_list args;
  va_start(args, fmt);
  std::vfprintf(f, fmt, args);
  va_end(args);
  std::fputc('\n', f);
}

static const char* printable_char(char c, char* buf) {
  switch (c) {
  case '\t':
    return "\\t";
  case '\0':
    return "\\0";
  default:
    buf[0] = c;
    buf[1] = '\0';
    return buf;
  }
}

void DebugTrace::log_options(char delimiter, char quote_char, bool has_header,
                             const char* policy) {
  char d[2], q[2];
  log("Options: delimiter='%s' quote='%s' header=%s missing_field_policy=%s",
      printable_char(delimiter, d), printable_char(quote_char, q), has_header ? "yes" : "no",
      policy);
}

void DebugTrace::dump_fields(size_t line, const std::vector<std::string_view>& fields) {
  if (!config_.dump_rows) {
    return;
  }
  FILE* f = out();
  std::fprintf(f, "[typedcsv] LINE %zu (%zu fields):", line, fields.size());
  for (const auto& field : fields) {
    std::fprintf(f, " [%.*s]", static_cast<int>(field.size()), field.data());
  }
  std::fputc('\n', f);
}

void DebugTrace::start_phase(const char* name) {
  if (!config_.timing) {
    return;
  }
  current_phase_ = name;
  phase_start_ = std::chrono::steady_clock::now();
}

void DebugTrace::end_phase(size_t bytes_processed) {
  if (!config_.timing || current_phase_.empty()) {
    return;
  }
  auto elapsed = std::chrono::steady_clock::now() - phase_start_;
  PhaseTime pt;
  pt.name = current_phase_;
  pt.milliseconds = std::chrono::duration<double, std::milli>(elapsed).count();
  pt.bytes_processed = bytes_processed;
  phases_.push_back(pt);
  current_phase_.clear();
}

void DebugTrace::print_timing_summary() const {
  if (!config_.timing || phases_.empty()) {
    return;
  }
  FILE* f = out();
  double total = 0.0;
  std::fprintf(f, "[typedcsv] Timing summary:\n");
  for (const auto& p : phases_) {
    std::fprintf(f, "[typedcsv]   %-12s %10.3f ms", p.name.c_str(), p.milliseconds);
    if (p.bytes_processed > 0 && p.milliseconds > 0.0) {
      double mb_per_s = (p.bytes_processed / (1024.0 * 1024.0)) / (p.milliseconds / 1000.0);
      std::fprintf(f, "  (%.1f MB/s)", mb_per_s);
    }
    std::fputc('\n', f);
    total += p.milliseconds;
  }
  std::fprintf(f, "[typedcsv]   %-12s %10.3f ms\n", "total", total);
}

} // namespace typedcsv
