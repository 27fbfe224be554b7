#include "tokenizer.h"

#include "common_defs.h"
#include "error.h"

namespace typedcsv {

bool LineSplitter::next(Line& out) {
  if (pos_ >= buf_.size()) {
    return false;
  }

  size_t start = pos_;
  size_t nl = buf_.find('\n', start);
  size_t end;
  if (nl == std::string_view::npos) {
    end = buf_.size();
    pos_ = buf_.size();
  } else {
    end = nl;
    pos_ = nl + 1;
  }
  if (end > start && buf_[end - 1] == '\r') {
    --end;
  }

  out.text = buf_.substr(start, end - start);
  out.number = ++line_no_;
  out.offset = start;
  return true;
}

bool Tokenizer::tokenize(std::string_view line, std::vector<FieldSpan>& fields,
                         ErrorCollector* errors, size_t line_no, size_t line_offset) const {
  fields.clear();
  if (line.empty()) {
    return true;
  }

  const size_t n = line.size();
  size_t i = 0;

  while (true) {
    size_t q = i;
    if (allow_space_before_quote_) {
      while (q < n && line[q] != delimiter_ && (line[q] == ' ' || line[q] == '\t')) {
        ++q;
      }
    }

    if (quote_ != '\0' && q < n && line[q] == quote_) {
      const size_t content = q + 1;
      size_t j = content;
      bool escaped = false;
      bool closed = false;
      std::string decoded;

      while (j < n) {
        char c = line[j];
        if (c == quote_) {
          if (j + 1 < n && line[j + 1] == quote_) {
            // Doubled quote: switch to an owned buffer on first escape
            if (!escaped) {
              decoded.assign(line.data() + content, j - content);
              escaped = true;
            }
            decoded.push_back(quote_);
            j += 2;
            continue;
          }
          closed = true;
          break;
        }
        if (escaped) {
          decoded.push_back(c);
        }
        ++j;
      }

      if (unlikely(!closed)) {
        if (errors) {
          errors->add_error(ErrorCode::UNCLOSED_QUOTE, ErrorSeverity::FATAL, line_no, q + 1,
                            line_offset + q, "Quoted field is not closed before end of line",
                            std::string(line.substr(q, 32)));
        }
        return false;
      }

      FieldSpan span(content, j - content, true);
      if (escaped) {
        span.owned = true;
        span.decoded = std::move(decoded);
      }
      fields.push_back(std::move(span));

      // Anything between the closing quote and the next delimiter is ignored
      size_t k = j + 1;
      while (k < n && line[k] != delimiter_) {
        ++k;
      }
      if (k >= n) {
        return true;
      }
      i = k + 1;
      continue;
    }

    size_t k = line.find(delimiter_, i);
    if (k == std::string_view::npos) {
      fields.emplace_back(i, n - i);
      return true;
    }
    fields.emplace_back(i, k - i);
    i = k + 1;
  }
}

std::vector<std::string_view> field_views(std::string_view line,
                                          const std::vector<FieldSpan>& fields) {
  std::vector<std::string_view> views;
  views.reserve(fields.size());
  for (const auto& f : fields) {
    views.push_back(f.view(line));
  }
  return views;
}

} // namespace typedcsv
