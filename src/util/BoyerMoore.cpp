#include "util/BoyerMoore.hpp"
#include <algorithm>
#include <utility>

namespace sift::util {

BoyerMooreSearch::BoyerMooreSearch(std::u32string pattern)
    : pattern_(std::move(pattern)) {
    compute_bad_char();
}

void BoyerMooreSearch::compute_bad_char() {
    const size_t m = pattern_.size();
    // All buckets default to maximum shift (pattern length)
    for (size_t i = 0; i < TABLE_SIZE; ++i) {
        bad_char_[i] = m;
    }
    // Code points in pattern (except last) get actual shift distances.
    // Later positions overwrite earlier ones, which can only shrink a shift.
    for (size_t i = 0; i + 1 < m; ++i) {
        size_t bucket = static_cast<size_t>(pattern_[i]) & (TABLE_SIZE - 1);
        bad_char_[bucket] = std::min(bad_char_[bucket], m - 1 - i);
    }
}

size_t BoyerMooreSearch::search(std::u32string_view text, size_t from) const {
    const size_t n = text.size();
    const size_t m = pattern_.size();

    if (from > n) return NPOS;
    if (m == 0) return from; // empty pattern matches immediately
    if (m > n - from) return NPOS;

    size_t i = from;
    while (i <= n - m) {
        size_t j = m;

        // Compare right to left
        while (j > 0 && text[i + j - 1] == pattern_[j - 1]) {
            --j;
        }

        if (j == 0) return i; // match

        // Bad character shift
        size_t bucket = static_cast<size_t>(text[i + m - 1]) & (TABLE_SIZE - 1);
        size_t shift = bad_char_[bucket];
        i += (shift > 0) ? shift : 1;
    }

    return NPOS;
}

} // namespace sift::util
