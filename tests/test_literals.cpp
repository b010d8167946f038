#include "minitest.hpp"
#include "engine/Compiler.hpp"
#include "engine/Literals.hpp"
#include "syntax/Parser.hpp"
#include <string>
#include <vector>

using namespace sift;
using engine::Prefixes;

static engine::Program compile_ok(std::string_view pattern, model::Options opts = {}) {
    model::Error err;
    auto tree = syntax::parse(pattern, opts, err);
    if (!tree) throw mini::AssertionError("parse failed: " + err.message);
    auto prog = engine::compile(*tree, opts, err);
    if (!prog) throw mini::AssertionError("compile failed: " + err.message);
    return std::move(*prog);
}

static const std::vector<std::u32string>& lits(const engine::Program& p) {
    return p.prefixes.literals();
}

// ============================================================================
// EXTRACTION
// ============================================================================

TEST(prefix_single_literal_complete) {
    auto p = compile_ok("abc");
    ASSERT_EQ(lits(p).size(), 1u);
    ASSERT_TRUE(lits(p)[0] == U"abc");
    ASSERT_TRUE(p.prefixes.complete());
}

TEST(prefix_alternation_in_priority_order) {
    auto p = compile_ok("abc|xyz|q");
    ASSERT_EQ(lits(p).size(), 3u);
    ASSERT_TRUE(lits(p)[0] == U"abc");
    ASSERT_TRUE(lits(p)[1] == U"xyz");
    ASSERT_TRUE(lits(p)[2] == U"q");
    ASSERT_TRUE(p.prefixes.complete());
}

TEST(prefix_small_class_expands) {
    auto p = compile_ok("a[bc]d");
    ASSERT_EQ(lits(p).size(), 2u);
    ASSERT_TRUE(lits(p)[0] == U"abd");
    ASSERT_TRUE(lits(p)[1] == U"acd");
    ASSERT_TRUE(p.prefixes.complete());
}

TEST(prefix_case_insensitive_expands) {
    model::Options ci;
    ci.case_insensitive = true;
    auto p = compile_ok("ab", ci);
    ASSERT_EQ(lits(p).size(), 4u);
    ASSERT_TRUE(p.prefixes.complete());
}

TEST(prefix_incomplete_when_followed_by_loop) {
    auto p = compile_ok("ab*");
    ASSERT_EQ(lits(p).size(), 1u);
    ASSERT_TRUE(lits(p)[0] == U"a");
    ASSERT_FALSE(p.prefixes.complete());
}

TEST(prefix_none_for_anchors_and_optional_arms) {
    ASSERT_TRUE(compile_ok("^abc").prefixes.empty());
    ASSERT_TRUE(compile_ok("a|b*").prefixes.empty());
    ASSERT_TRUE(compile_ok("a*").prefixes.empty());
    ASSERT_TRUE(compile_ok("").prefixes.empty());
}

TEST(prefix_class_product_limit) {
    auto ok = compile_ok("[a-z]x");
    ASSERT_EQ(lits(ok).size(), 26u);
    ASSERT_TRUE(compile_ok("[a-z0-9]x").prefixes.empty());
    // The product is checked against what was already collected
    auto partial = compile_ok("a[0-9][0-9]");
    ASSERT_EQ(lits(partial).size(), 10u);
    ASSERT_FALSE(partial.prefixes.complete());
}

TEST(prefix_length_limit) {
    std::string exact(Prefixes::MAX_LENGTH, 'k');
    auto p = compile_ok(exact);
    ASSERT_EQ(lits(p)[0].size(), Prefixes::MAX_LENGTH);
    ASSERT_TRUE(p.prefixes.complete());

    auto q = compile_ok(exact + "zz");
    ASSERT_EQ(lits(q)[0].size(), Prefixes::MAX_LENGTH);
    ASSERT_FALSE(q.prefixes.complete());
}

TEST(prefix_reordered_arms_are_not_complete) {
    // The inner alternation is collected after the outer secondary arm
    auto p = compile_ok("(?:a|ab)|abc");
    ASSERT_FALSE(p.prefixes.complete());
}

TEST(prefix_empty_class_stops_extraction) {
    using model::Node;
    model::SyntaxTree tree;
    tree.root = Node::concat({Node::klass(util::CharClass{}), Node::lit('a')});
    model::Error err;
    auto prog = engine::compile(tree, {}, err);
    ASSERT_TRUE(prog.has_value());
    ASSERT_TRUE(prog->prefixes.empty());
}

// ============================================================================
// SCANNING
// ============================================================================

TEST(prefix_find_single) {
    Prefixes p({U"needle"}, true);
    ASSERT_EQ(p.find(U"haystack with needle", 0), 14u);
    ASSERT_EQ(p.find(U"haystack with needle", 15), Prefixes::NPOS);
}

TEST(prefix_find_several) {
    Prefixes p({U"foo", U"bar"}, true);
    ASSERT_EQ(p.find(U"xxbarfoo", 0), 2u);
    ASSERT_EQ(p.find(U"xxbarfoo", 3), 5u);
    ASSERT_EQ(p.find(U"fxbxoo", 0), Prefixes::NPOS);
}

TEST(prefix_find_without_prefixes_returns_start) {
    Prefixes none;
    ASSERT_EQ(none.find(U"abc", 2), 2u);
    ASSERT_EQ(none.find(U"abc", 3), 3u);
    ASSERT_EQ(none.find(U"abc", 4), Prefixes::NPOS);
}

TEST(prefix_find_match_modes) {
    Prefixes p({U"a", U"ab"}, true);
    auto first = p.find_match(U"xab", 0, model::MatchMode::LeftmostFirst);
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(*first, (model::Span{1, 2}));
    auto longest = p.find_match(U"xab", 0, model::MatchMode::LeftmostLongest);
    ASSERT_TRUE(longest.has_value());
    ASSERT_EQ(*longest, (model::Span{1, 3}));
    ASSERT_FALSE(p.find_match(U"xyz", 0, model::MatchMode::LeftmostFirst).has_value());
}
