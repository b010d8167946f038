#include "util/CharClass.hpp"
#include <algorithm>
#include <utility>

namespace sift::util {

// ── Simple case folding ────────────────────────────────────────────────

// Contiguous blocks whose members map to their counterpart by a fixed delta.
struct FoldBlock { uint32_t lo, hi; int32_t delta; };

static constexpr FoldBlock FOLD_TABLE[] = {
    {0x0041, 0x005A, +32}, {0x0061, 0x007A, -32},   // ASCII
    {0x00C0, 0x00D6, +32}, {0x00D8, 0x00DE, +32},   // Latin-1 upper
    {0x00E0, 0x00F6, -32}, {0x00F8, 0x00FE, -32},   // Latin-1 lower
    {0x0391, 0x03A1, +32}, {0x03A3, 0x03AB, +32},   // Greek upper
    {0x03B1, 0x03C1, -32}, {0x03C3, 0x03CB, -32},   // Greek lower
    {0x0400, 0x040F, +80}, {0x0410, 0x042F, +32},   // Cyrillic upper
    {0x0430, 0x044F, -32}, {0x0450, 0x045F, -80},   // Cyrillic lower
};

std::optional<uint32_t> simple_fold(uint32_t cp) {
    for (const auto& b : FOLD_TABLE) {
        if (cp >= b.lo && cp <= b.hi)
            return static_cast<uint32_t>(static_cast<int32_t>(cp) + b.delta);
    }
    return std::nullopt;
}

// ── Construction ───────────────────────────────────────────────────────

CharClass::CharClass(std::initializer_list<CpRange> ranges) : ranges_(ranges) {
    canonicalize();
}

CharClass CharClass::single(uint32_t cp) { return CharClass{{cp, cp}}; }

CharClass CharClass::any() { return CharClass{{0, MAX_CODEPOINT}}; }

CharClass CharClass::any_except_newline() {
    return CharClass{{0, '\n' - 1}, {'\n' + 1, MAX_CODEPOINT}};
}

CharClass CharClass::digit() { return CharClass{{'0', '9'}}; }

CharClass CharClass::word() {
    return CharClass{{'0', '9'}, {'A', 'Z'}, {'_', '_'}, {'a', 'z'}};
}

CharClass CharClass::space() {
    return CharClass{{'\t', '\r'}, {' ', ' '}};
}

// ── Mutators ───────────────────────────────────────────────────────────

void CharClass::canonicalize() {
    std::sort(ranges_.begin(), ranges_.end(),
              [](const CpRange& a, const CpRange& b) { return a.lo < b.lo; });
    std::vector<CpRange> merged;
    merged.reserve(ranges_.size());
    for (const auto& r : ranges_) {
        // Merge overlapping and adjacent ranges
        if (!merged.empty() && r.lo <= merged.back().hi + 1)
            merged.back().hi = std::max(merged.back().hi, r.hi);
        else
            merged.push_back(r);
    }
    ranges_ = std::move(merged);
}

void CharClass::add(uint32_t lo, uint32_t hi) {
    if (lo > hi) std::swap(lo, hi);
    ranges_.push_back({lo, std::min(hi, MAX_CODEPOINT)});
    canonicalize();
}

void CharClass::union_with(const CharClass& other) {
    ranges_.insert(ranges_.end(), other.ranges_.begin(), other.ranges_.end());
    canonicalize();
}

void CharClass::negate() {
    std::vector<CpRange> result;
    uint32_t cursor = 0;
    for (const auto& r : ranges_) {
        if (r.lo > cursor)
            result.push_back({cursor, r.lo - 1});
        cursor = r.hi + 1;
    }
    if (cursor <= MAX_CODEPOINT)
        result.push_back({cursor, MAX_CODEPOINT});
    ranges_ = std::move(result);
}

void CharClass::case_fold() {
    const auto original = ranges_;
    for (const auto& r : original) {
        for (const auto& b : FOLD_TABLE) {
            uint32_t lo = std::max(r.lo, b.lo);
            uint32_t hi = std::min(r.hi, b.hi);
            if (lo > hi) continue;
            ranges_.push_back({static_cast<uint32_t>(static_cast<int32_t>(lo) + b.delta),
                               static_cast<uint32_t>(static_cast<int32_t>(hi) + b.delta)});
        }
    }
    canonicalize();
}

// ── Queries ────────────────────────────────────────────────────────────

bool CharClass::contains(uint32_t cp) const {
    // Most classes are short and most input is ASCII: probe the first few
    // ranges linearly before falling back to binary search.
    const size_t probe = std::min<size_t>(ranges_.size(), 4);
    for (size_t i = 0; i < probe; ++i) {
        if (cp < ranges_[i].lo) return false;
        if (cp <= ranges_[i].hi) return true;
    }
    if (probe == ranges_.size()) return false;
    auto it = std::upper_bound(ranges_.begin() + probe, ranges_.end(), cp,
                               [](uint32_t c, const CpRange& r) { return c < r.lo; });
    if (it == ranges_.begin() + probe) return false;
    --it;
    return cp <= it->hi;
}

size_t CharClass::count() const {
    size_t n = 0;
    for (const auto& r : ranges_) n += static_cast<size_t>(r.hi - r.lo) + 1;
    return n;
}

std::optional<uint32_t> CharClass::single_codepoint() const {
    if (ranges_.size() == 1 && ranges_[0].lo == ranges_[0].hi) return ranges_[0].lo;
    return std::nullopt;
}

} // namespace sift::util
