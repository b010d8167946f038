#pragma once

#include "model/Match.hpp"
#include "model/Options.hpp"
#include "util/BoyerMoore.hpp"
#include "util/CharClass.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sift::engine {

struct Program;

// Literal prefixes that every match of a program must start with.
// Used to skip input where no match can begin: a single prefix is found with
// Boyer-Moore-Horspool, several with a first-code-point set scan.
class Prefixes {
public:
    static constexpr size_t NPOS = static_cast<size_t>(-1);
    // Alternation and class expansion stop past this many alternatives.
    static constexpr size_t MAX_ALTERNATIVES = 30;
    // Prefixes stop growing past this many code points.
    static constexpr size_t MAX_LENGTH = 15;

    Prefixes() = default;
    // `lits` in match priority order. `complete` means matching any literal
    // is a match of the whole program.
    Prefixes(std::vector<std::u32string> lits, bool complete);

    [[nodiscard]] bool empty() const { return lits_.empty(); }
    [[nodiscard]] size_t size() const { return lits_.size(); }
    [[nodiscard]] bool complete() const { return complete_; }
    [[nodiscard]] const std::vector<std::u32string>& literals() const { return lits_; }

    // Smallest offset >= start at which some prefix occurs, or NPOS.
    // With no prefixes every offset is a candidate and `start` is returned.
    [[nodiscard]] size_t find(std::u32string_view text, size_t start) const;

    // Leftmost literal occurrence at or after start, choosing among literals
    // that occur at the same offset by priority (leftmost-first) or length
    // (leftmost-longest). Only meaningful when complete().
    [[nodiscard]] std::optional<model::Span> find_match(std::u32string_view text, size_t start,
                                                        model::MatchMode mode) const;

private:
    std::vector<std::u32string> lits_;
    bool complete_{false};
    std::optional<util::BoyerMooreSearch> single_;
    util::CharClass first_;   // first code point of every literal

    [[nodiscard]] bool literal_at(std::u32string_view text, size_t at, size_t i) const;
};

// Derives the prefix set of a compiled program (empty when none is usable).
[[nodiscard]] Prefixes extract_prefixes(const Program& prog);

} // namespace sift::engine
