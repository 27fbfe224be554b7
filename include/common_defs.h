#ifndef TYPEDCSV_COMMON_DEFS_H
#define TYPEDCSV_COMMON_DEFS_H

#include <cstddef>
#include <string_view>

#ifdef _MSC_VER

#define really_inline inline

#ifndef likely
#define likely(x) x
#endif
#ifndef unlikely
#define unlikely(x) x
#endif

#else

#define really_inline inline __attribute__((always_inline, unused))

#ifndef likely
#define likely(x) __builtin_expect(!!(x), 1)
#endif
#ifndef unlikely
#define unlikely(x) __builtin_expect(!!(x), 0)
#endif

#endif  // _MSC_VER

namespace typedcsv {

// ASCII whitespace as accepted around fields and header names.
really_inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

really_inline char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline std::string_view trim_view(std::string_view s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && is_space(s[start])) ++start;
    while (end > start && is_space(s[end - 1])) --end;
    return s.substr(start, end - start);
}

// ASCII case-insensitive equality
inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (ascii_lower(a[i]) != ascii_lower(b[i])) return false;
    }
    return true;
}

}  // namespace typedcsv

#endif  // TYPEDCSV_COMMON_DEFS_H
