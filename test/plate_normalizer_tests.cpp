#include <gtest/gtest.h>

#include "plate_normalizer.hpp"

using parking::PlateNormalizer;

// ---------- Tests: normalization ----------
TEST(PlateNormalize, UppercasesAndStripsSeparators) {
    EXPECT_EQ(PlateNormalizer::normalize("abc 123"), "ABC123");
    EXPECT_EQ(PlateNormalizer::normalize("KA-01-AB-1234"), "KA01AB1234");
    EXPECT_EQ(PlateNormalizer::normalize("  x.y_z!9 "), "XYZ9");
}

TEST(PlateNormalize, EmptyAndSymbolOnlyInputs) {
    EXPECT_EQ(PlateNormalizer::normalize(""), "");
    EXPECT_EQ(PlateNormalizer::normalize("-- ##"), "");
}

TEST(PlateNormalize, OcrCleanupUsesSameFilter) {
    EXPECT_EQ(PlateNormalizer::clean_ocr_text("[ABC 123]\n"), "ABC123");
}

// ---------- Tests: edit distance ----------
TEST(PlateEditDistance, BasicOperations) {
    EXPECT_EQ(PlateNormalizer::edit_distance("ABC123", "ABC123"), 0u);
    EXPECT_EQ(PlateNormalizer::edit_distance("ABC123", "ABC124"), 1u); // substitute
    EXPECT_EQ(PlateNormalizer::edit_distance("ABC123", "ABC1234"), 1u); // insert
    EXPECT_EQ(PlateNormalizer::edit_distance("ABC123", "AB123"), 1u); // delete
    EXPECT_EQ(PlateNormalizer::edit_distance("ABC123", "ABD124"), 2u);
    EXPECT_EQ(PlateNormalizer::edit_distance("", "ABC"), 3u);
}

// ---------- Tests: fuzzy matching ----------
TEST(PlateFuzzy, AcceptsDistanceZeroOrOne) {
    EXPECT_TRUE(PlateNormalizer::fuzzy_equals("ABC123", "ABC123"));
    EXPECT_TRUE(PlateNormalizer::fuzzy_equals("ABC123", "ABC124"));
    EXPECT_TRUE(PlateNormalizer::fuzzy_equals("abc-123", "ABC 12"));
}

TEST(PlateFuzzy, RejectsDistanceTwoOrMore) {
    EXPECT_FALSE(PlateNormalizer::fuzzy_equals("ABC123", "ABD124"));
    EXPECT_FALSE(PlateNormalizer::fuzzy_equals("ABC123", "XYZ789"));
    EXPECT_FALSE(PlateNormalizer::fuzzy_equals("ABC123", "ABC12345"));
}

TEST(PlateFuzzy, EmptyNeverMatches) {
    EXPECT_FALSE(PlateNormalizer::fuzzy_equals("", ""));
    EXPECT_FALSE(PlateNormalizer::fuzzy_equals("A", "--"));
}
