/**
 * @file tokenizer.h
 * @brief Line splitting and RFC 4180 field tokenization.
 *
 * Fields never span lines: a quoted field must be closed on the line it
 * opens. Unquoted fields and quoted fields without doubled quotes are
 * returned as zero-copy spans into the line; only fields whose content had
 * "" escapes are materialized as owned strings.
 */

#ifndef TYPEDCSV_TOKENIZER_H
#define TYPEDCSV_TOKENIZER_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace typedcsv {

class ErrorCollector;

/**
 * @brief One delimiter-separated segment of a line.
 *
 * offset/length locate the field content inside the tokenized line, excluding
 * the delimiter and any surrounding quotes. When the content contained doubled
 * quotes, the decoded text is held in `decoded` instead.
 */
struct FieldSpan {
    size_t offset = 0;
    size_t length = 0;
    bool quoted = false;
    bool owned = false;
    std::string decoded;

    FieldSpan() = default;
    FieldSpan(size_t off, size_t len, bool was_quoted = false)
        : offset(off), length(len), quoted(was_quoted) {}

    /// Field text; `line` must be the line this span was produced from.
    std::string_view view(std::string_view line) const {
        if (owned) return decoded;
        return line.substr(offset, length);
    }
};

/// A line of the source buffer, without its line terminator.
struct Line {
    std::string_view text;
    size_t number = 0;  ///< 1-based physical line number
    size_t offset = 0;  ///< byte offset of the first character in the buffer
};

/**
 * @brief Splits a buffer into lines on LF or CRLF.
 *
 * A final line without a terminator is returned as a line; a buffer ending
 * with a terminator does not produce a trailing empty line.
 */
class LineSplitter {
public:
    explicit LineSplitter(std::string_view buf) : buf_(buf) {}

    /// Advance to the next line. Returns false at end of buffer.
    bool next(Line& out);

    size_t position() const { return pos_; }

private:
    std::string_view buf_;
    size_t pos_ = 0;
    size_t line_no_ = 0;
};

class Tokenizer {
public:
    /**
     * @param delimiter field separator
     * @param quote quote character; '\0' disables quoting
     * @param allow_space_before_quote treat `  "x"` as a quoted field
     */
    explicit Tokenizer(char delimiter = ',', char quote = '"',
                       bool allow_space_before_quote = true)
        : delimiter_(delimiter), quote_(quote),
          allow_space_before_quote_(allow_space_before_quote) {}

    /**
     * @brief Tokenize one line into field spans.
     *
     * An empty line yields zero fields; a line ending with the delimiter
     * yields a trailing empty field.
     *
     * @return false if a quoted field is not closed before the end of the
     *         line. An UNCLOSED_QUOTE error is added to `errors` when given.
     */
    bool tokenize(std::string_view line, std::vector<FieldSpan>& fields,
                  ErrorCollector* errors = nullptr, size_t line_no = 0,
                  size_t line_offset = 0) const;

    char delimiter() const { return delimiter_; }
    char quote() const { return quote_; }

private:
    char delimiter_;
    char quote_;
    bool allow_space_before_quote_;
};

/// Views of every field of a tokenized line, in order.
std::vector<std::string_view> field_views(std::string_view line,
                                          const std::vector<FieldSpan>& fields);

} // namespace typedcsv

#endif // TYPEDCSV_TOKENIZER_H
