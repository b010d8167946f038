#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <vector>

namespace sift::util {

struct CpRange {
    uint32_t lo, hi;   // inclusive

    bool operator==(const CpRange&) const = default;
};

// Set of code points as sorted, non-overlapping, non-adjacent ranges.
// Every mutator leaves the range list in canonical form.
class CharClass {
public:
    static constexpr uint32_t MAX_CODEPOINT = 0x10FFFF;

    CharClass() = default;
    CharClass(std::initializer_list<CpRange> ranges);

    static CharClass single(uint32_t cp);
    static CharClass any();                  // 0..0x10FFFF
    static CharClass any_except_newline();   // `.`
    static CharClass digit();                // \d  [0-9]
    static CharClass word();                 // \w  [0-9A-Za-z_]
    static CharClass space();                // \s  [\t\n\v\f\r ]

    void add(uint32_t lo, uint32_t hi);
    void add(uint32_t cp) { add(cp, cp); }
    void union_with(const CharClass& other);
    void negate();
    // Adds the simple case-fold counterpart of every member.
    void case_fold();

    [[nodiscard]] bool contains(uint32_t cp) const;
    [[nodiscard]] bool empty() const { return ranges_.empty(); }
    // Number of code points in the set.
    [[nodiscard]] size_t count() const;
    [[nodiscard]] const std::vector<CpRange>& ranges() const { return ranges_; }
    // The only member, when the set holds exactly one code point.
    [[nodiscard]] std::optional<uint32_t> single_codepoint() const;

    bool operator==(const CharClass&) const = default;

private:
    std::vector<CpRange> ranges_;

    void canonicalize();
};

// Simple case-fold counterpart of cp, or nullopt if cp has none.
[[nodiscard]] std::optional<uint32_t> simple_fold(uint32_t cp);

// ASCII word character, used by \b and \B.
[[nodiscard]] inline bool is_word_char(uint32_t cp) {
    return (cp >= '0' && cp <= '9') || (cp >= 'A' && cp <= 'Z')
        || (cp >= 'a' && cp <= 'z') || cp == '_';
}

} // namespace sift::util
