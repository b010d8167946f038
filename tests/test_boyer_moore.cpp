#include "minitest.hpp"
#include "util/BoyerMoore.hpp"

using sift::util::BoyerMooreSearch;

TEST(bm_finds_first_occurrence) {
    BoyerMooreSearch bm(U"needle");
    ASSERT_EQ(bm.search(U"haystack with needle and needle"), 14u);
    ASSERT_EQ(bm.search(U"haystack with needle and needle", 15), 25u);
}

TEST(bm_not_found) {
    BoyerMooreSearch bm(U"xyz");
    ASSERT_EQ(bm.search(U"xyxyxy"), BoyerMooreSearch::NPOS);
    ASSERT_EQ(bm.search(U"xy"), BoyerMooreSearch::NPOS);
    ASSERT_EQ(bm.search(U"xyz", 4), BoyerMooreSearch::NPOS);
}

TEST(bm_match_at_edges) {
    BoyerMooreSearch bm(U"ab");
    ASSERT_EQ(bm.search(U"abxx"), 0u);
    ASSERT_EQ(bm.search(U"xxab"), 2u);
    ASSERT_EQ(bm.search(U"ab", 0), 0u);
}

TEST(bm_empty_pattern_matches_at_from) {
    BoyerMooreSearch bm(U"");
    ASSERT_EQ(bm.search(U"abc", 2), 2u);
    ASSERT_EQ(bm.search(U"abc", 3), 3u);
}

TEST(bm_shared_bucket_code_points) {
    // U+0161 and 'a' share the low byte 0x61
    BoyerMooreSearch bm(U"šab");
    ASSERT_EQ(bm.search(U"aabšašab"), 5u);
    ASSERT_EQ(bm.search(U"šašaab"), BoyerMooreSearch::NPOS);
}

TEST(bm_overlapping_candidates) {
    BoyerMooreSearch bm(U"aab");
    ASSERT_EQ(bm.search(U"aaaaab"), 3u);
}
