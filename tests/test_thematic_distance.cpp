#include <gtest/gtest.h>
#include <string>

#include "common/thematic_distance.hpp"

using namespace FootprintDistance;

TEST(LevenshteinTest, ClassicExamples) {
    EXPECT_EQ(levenshtein("kitten", "sitting"), 3u);
    EXPECT_EQ(levenshtein("flaw", "lawn"), 2u);
}

TEST(LevenshteinTest, EmptyStrings) {
    EXPECT_EQ(levenshtein("", "abc"), 3u);
    EXPECT_EQ(levenshtein("abc", ""), 3u);
    EXPECT_EQ(levenshtein("", ""), 0u);
}

TEST(LevenshteinTest, IdenticalStrings) {
    EXPECT_EQ(levenshtein("abc", "abc"), 0u);
    EXPECT_EQ(levenshtein("Hacettepe University", "Hacettepe University"), 0u);
}

TEST(LevenshteinTest, BuildingNames) {
    const std::string s1 = "Hacettepe University";
    const std::string s2 = "Hacettepe  University";
    const std::string s3 = "Hacettepe Univ.";
    const std::string s4 = "Beytepe Campus";

    EXPECT_EQ(levenshtein(s1, s2), 1u);
    EXPECT_EQ(levenshtein(s1, s3), 6u);
    EXPECT_EQ(levenshtein(s1, s4), 13u);
}

TEST(LevenshteinTest, Symmetric) {
    EXPECT_EQ(levenshtein("kitten", "sitting"), levenshtein("sitting", "kitten"));
    EXPECT_EQ(levenshtein("Beytepe Campus", "Hacettepe Univ."),
              levenshtein("Hacettepe Univ.", "Beytepe Campus"));
}

TEST(LevenshteinTest, CountsCodePointsNotBytes) {
    // "Ü" and "ğ" are two bytes each in UTF-8
    EXPECT_EQ(levenshtein("\xC3\x9Cniversite", "Universite"), 1u);
    EXPECT_EQ(levenshtein("", "Da\xC4\x9F"), 3u);
    EXPECT_EQ(decodeUtf8("Da\xC4\x9F").size(), 3u);
    EXPECT_EQ(static_cast<unsigned long>(decodeUtf8("\xE2\x82\xAC")[0]), 0x20ACul);
}

TEST(LevenshteinTest, MalformedBytesCountOnce) {
    const std::string broken = "a\xFF" "b";
    EXPECT_EQ(decodeUtf8(broken).size(), 3u);
    EXPECT_EQ(levenshtein(broken, "ab"), 1u);

    // truncated two-byte sequence at the end
    EXPECT_EQ(decodeUtf8("x\xC3").size(), 2u);
}

TEST(LevenshteinTest, MalformedByteNeverMatchesValidCodePoint) {
    // lone 0xFF against U+00FF encoded as C3 BF
    EXPECT_EQ(levenshtein("\xFF", "\xC3\xBF"), 1u);
    EXPECT_GT(static_cast<unsigned long>(decodeUtf8("\xFF")[0]), 0x10FFFFul);
    EXPECT_EQ(levenshtein("\xFF", "\xFE"), 1u);
}
