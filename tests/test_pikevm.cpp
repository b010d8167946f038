#include "minitest.hpp"
#include "engine/Compiler.hpp"
#include "engine/PikeVM.hpp"
#include "syntax/Parser.hpp"
#include <chrono>
#include <string>

using namespace sift;
using model::Slots;
using model::Span;

static engine::Program compile_ok(std::string_view pattern, model::Options opts = {}) {
    model::Error err;
    auto tree = syntax::parse(pattern, opts, err);
    if (!tree) throw mini::AssertionError("parse failed: " + err.message);
    auto prog = engine::compile(*tree, opts, err);
    if (!prog) throw mini::AssertionError("compile failed: " + err.message);
    return std::move(*prog);
}

// Group spans of the first match at or after start, or empty when none.
static Slots pike(std::string_view pattern, std::u32string_view text, size_t start = 0,
                  model::Options opts = {}) {
    auto prog = compile_ok(pattern, opts);
    Slots slots;
    if (!engine::PikeVM(prog).exec(text, start, slots, opts.use_prefixes)) return {};
    return slots;
}

static std::optional<size_t> at(size_t v) { return v; }

TEST(pike_simple_find) {
    ASSERT_TRUE(pike("a+", U"baaa") == (Slots{at(1), at(4)}));
    ASSERT_TRUE(pike("xyz", U"abc").empty());
}

TEST(pike_greedy_star_stops_at_mismatch) {
    ASSERT_TRUE(pike("a*", U"aaab") == (Slots{at(0), at(3)}));
}

TEST(pike_lazy_quantifiers) {
    ASSERT_TRUE(pike("a+?", U"aaa") == (Slots{at(0), at(1)}));
    ASSERT_TRUE(pike("a*?b", U"aab") == (Slots{at(0), at(3)}));
}

TEST(pike_unset_group_reports_none) {
    ASSERT_TRUE(pike("(a)(b)?", U"a") == (Slots{at(0), at(1), at(0), at(1), std::nullopt, std::nullopt}));
}

TEST(pike_leftmost_first_alternation) {
    ASSERT_TRUE(pike("a|ab", U"ab") == (Slots{at(0), at(1)}));
    ASSERT_TRUE(pike("ab|a", U"ab") == (Slots{at(0), at(2)}));
}

TEST(pike_leftmost_longest_alternation) {
    model::Options ll;
    ll.mode = model::MatchMode::LeftmostLongest;
    ASSERT_TRUE(pike("a|ab", U"ab", 0, ll) == (Slots{at(0), at(2)}));
    ASSERT_TRUE(pike("a+?", U"aaa", 0, ll) == (Slots{at(0), at(3)}));
    // Leftmost start wins over length
    ASSERT_TRUE(pike("bcd|abc", U"xabcd", 0, ll) == (Slots{at(1), at(4)}));
}

TEST(pike_longest_keeps_first_thread_captures) {
    model::Options ll;
    ll.mode = model::MatchMode::LeftmostLongest;
    auto s = pike("(a|ab)(c|bcd)(d*)", U"abcd", 0, ll);
    ASSERT_TRUE(s == (Slots{at(0), at(4), at(0), at(1), at(1), at(4), at(4), at(4)}));
}

TEST(pike_class_search) {
    ASSERT_TRUE(pike("[0-9]+", U"x123y") == (Slots{at(1), at(4)}));
}

TEST(pike_start_offset) {
    ASSERT_TRUE(pike("a", U"aba", 1) == (Slots{at(2), at(3)}));
    ASSERT_TRUE(pike("$", U"ab", 2) == (Slots{at(2), at(2)}));
    ASSERT_TRUE(pike("a", U"ab", 3).empty());
}

TEST(pike_text_anchors) {
    ASSERT_TRUE(pike("^a", U"ba").empty());
    ASSERT_TRUE(pike("^a", U"ab") == (Slots{at(0), at(1)}));
    ASSERT_TRUE(pike("b$", U"bab") == (Slots{at(2), at(3)}));
    // An anchored program never matches past offset 0
    ASSERT_TRUE(pike("^a", U"aa", 1).empty());
}

TEST(pike_line_anchors) {
    model::Options ml;
    ml.multi_line = true;
    ASSERT_TRUE(pike("^b", U"a\nb", 0, ml) == (Slots{at(2), at(3)}));
    ASSERT_TRUE(pike("a$", U"a\nb", 0, ml) == (Slots{at(0), at(1)}));
}

TEST(pike_word_boundaries) {
    ASSERT_TRUE(pike("\\bfoo\\b", U"a foo b") == (Slots{at(2), at(5)}));
    ASSERT_TRUE(pike("\\bfoo\\b", U"afoo").empty());
    ASSERT_TRUE(pike("\\Boo", U"foo") == (Slots{at(1), at(3)}));
}

TEST(pike_empty_pattern_and_text) {
    ASSERT_TRUE(pike("", U"") == (Slots{at(0), at(0)}));
    ASSERT_TRUE(pike("x*", U"abc") == (Slots{at(0), at(0)}));
}

TEST(pike_case_insensitive) {
    model::Options ci;
    ci.case_insensitive = true;
    ASSERT_TRUE(pike("hello", U"say HeLLo", 0, ci) == (Slots{at(4), at(9)}));
    ASSERT_TRUE(pike("[a-c]+", U"xABCa", 0, ci) == (Slots{at(1), at(5)}));
}

TEST(pike_prefix_skip_same_result) {
    model::Options off;
    off.use_prefixes = false;
    std::u32string text = U"zzzz needle zz needle";
    ASSERT_TRUE(pike("needle", text) == pike("needle", text, 0, off));
    ASSERT_TRUE(pike("need(le|ed)", text, 6) == pike("need(le|ed)", text, 6, off));
}

TEST(pike_pathological_nested_optional) {
    std::string pattern;
    for (int i = 0; i < 50; ++i) pattern += "(a?)";
    pattern += std::string(50, 'a');
    std::u32string text(50, U'a');

    auto t0 = std::chrono::steady_clock::now();
    auto s = pike(pattern, text);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    ASSERT_EQ(s[0], at(0));
    ASSERT_EQ(s[1], at(50));
    // Every optional group matched empty so the literal run could take all 50
    ASSERT_EQ(s[2], at(0));
    ASSERT_EQ(s[3], at(0));
    ASSERT_TRUE(ms < 2000);
}

TEST(pike_repeated_group_captures_last_iteration) {
    ASSERT_TRUE(pike("(ab)+", U"ababx") == (Slots{at(0), at(4), at(2), at(4)}));
}
