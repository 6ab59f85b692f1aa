#pragma once

#include <cstddef>
#include <string>

namespace sandscrape {

inline bool isUtf8Continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

/// Largest cut <= n that does not split a UTF-8 sequence in `text`.
inline size_t utf8Boundary(const std::string& text, size_t n) {
    if (n >= text.size()) return text.size();
    while (n > 0 && isUtf8Continuation(static_cast<unsigned char>(text[n]))) --n;
    return n;
}

/// Length of `text` without a trailing sequence that was cut short.
inline size_t utf8CompleteLength(const std::string& text) {
    size_t n = text.size();
    size_t lead = n;
    // A sequence is at most 4 bytes; look back for its lead byte.
    for (size_t back = 0; back < 4 && lead > 0; ++back) {
        --lead;
        unsigned char c = static_cast<unsigned char>(text[lead]);
        if (isUtf8Continuation(c)) continue;
        size_t want = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3
                    : (c >> 3) == 0x1E ? 4 : 1;
        return n - lead < want ? lead : n;
    }
    return n;
}

/// Truncate in place to at most `max_bytes`, on a character boundary.
inline void truncateUtf8(std::string& text, size_t max_bytes) {
    text.resize(utf8Boundary(text, max_bytes));
}

} // namespace sandscrape
