/**
 * @file debug.h
 * @brief Debug tracing for the typedcsv loader.
 *
 * The loader never writes to stdout/stderr on its own. Callers that want a
 * trace attach a DebugTrace through LoaderOptions::trace; all output then goes
 * to DebugConfig::output with a "[typedcsv]" prefix.
 */

#ifndef TYPEDCSV_DEBUG_H
#define TYPEDCSV_DEBUG_H

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace typedcsv {

struct DebugConfig {
    bool verbose = false;    ///< Log phase boundaries, bindings, skipped lines
    bool dump_rows = false;  ///< Dump the tokenized fields of every line
    bool timing = false;     ///< Record per-phase timing
    FILE* output = nullptr;  ///< Destination; nullptr means stderr

    bool enabled() const { return verbose || dump_rows || timing; }

    static DebugConfig all() {
        DebugConfig config;
        config.verbose = true;
        config.dump_rows = true;
        config.timing = true;
        return config;
    }
};

class DebugTrace {
public:
    struct PhaseTime {
        std::string name;
        double milliseconds = 0.0;
        size_t bytes_processed = 0;
    };

    explicit DebugTrace(const DebugConfig& config = DebugConfig()) : config_(config) {}

    bool verbose() const { return config_.verbose; }
    bool dump_rows() const { return config_.dump_rows; }
    bool timing() const { return config_.timing; }

    /// printf-style message, emitted only in verbose mode.
    void log(const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 2, 3)))
#endif
        ;

    void log_options(char delimiter, char quote_char, bool has_header, const char* policy);

    /// Dump the fields of one line (dump_rows mode).
    void dump_fields(size_t line, const std::vector<std::string_view>& fields);

    void start_phase(const char* name);
    void end_phase(size_t bytes_processed = 0);

    const std::vector<PhaseTime>& get_phase_times() const { return phases_; }
    void print_timing_summary() const;

private:
    FILE* out() const { return config_.output ? config_.output : stderr; }

    DebugConfig config_;
    std::vector<PhaseTime> phases_;
    std::string current_phase_;
    std::chrono::steady_clock::time_point phase_start_;
};

} // namespace typedcsv

#endif // TYPEDCSV_DEBUG_H
