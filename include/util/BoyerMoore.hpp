#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sift::util {

// Boyer-Moore-Horspool literal search over code points.
// The bad character table is indexed by the low byte of a code point; code
// points sharing a bucket keep the smallest shift, so skips stay safe for
// any alphabet.
// Average case: O(n/m) sublinear. Worst case: O(n*m).
class BoyerMooreSearch {
public:
    static constexpr size_t NPOS = static_cast<size_t>(-1);

    explicit BoyerMooreSearch(std::u32string pattern);

    // Position of the first occurrence at or after `from`, or NPOS.
    [[nodiscard]] size_t search(std::u32string_view text, size_t from = 0) const;

    [[nodiscard]] const std::u32string& pattern() const { return pattern_; }

private:
    static constexpr size_t TABLE_SIZE = 256;

    size_t bad_char_[TABLE_SIZE];
    std::u32string pattern_;

    void compute_bad_char();
};

} // namespace sift::util
