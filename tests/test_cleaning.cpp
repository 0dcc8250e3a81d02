#include <gtest/gtest.h>

#include "pv_cleaning.h"

TEST(CleanValueTest, NullAndBlankValuesAreDropped) {
    EXPECT_FALSE(cleanValue(std::nullopt).has_value());
    EXPECT_FALSE(cleanValue(std::string()).has_value());
    EXPECT_FALSE(cleanValue(std::string("   ")).has_value());
    EXPECT_FALSE(cleanValue(std::string(" \t\r\n")).has_value());
}

TEST(CleanValueTest, TrimsAndUppercases) {
    EXPECT_EQ(cleanValue(std::string(" ahgve1276f ")), "AHGVE1276F");
    EXPECT_EQ(cleanValue(std::string("\tAbC\n")), "ABC");
    EXPECT_EQ(cleanValue(std::string("ab c")), "AB C");
}

TEST(CleanValuesTest, DeduplicatesAfterNormalization) {
    const std::vector<RawRecord> raw = { std::string("abc1234def"), std::string(" ABC1234DEF "), std::nullopt, std::string("") };

    const auto cleaned = cleanValues(raw);
    ASSERT_EQ(cleaned.size(), 1u);
    EXPECT_EQ(cleaned[0], "ABC1234DEF");

    const CleaningResult result = cleanAndClassify(raw);
    EXPECT_EQ(result.totalCount, 4u);
    EXPECT_EQ(result.excludedCount, 2u);
    EXPECT_EQ(result.duplicateCount, 1u);
    ASSERT_EQ(result.results.size(), 1u);
    EXPECT_EQ(result.results[0].panNumber, "ABC1234DEF");
    EXPECT_EQ(result.results[0].status, PanStatus::Invalid);
}

TEST(CleanValuesTest, KeepsFirstOccurrenceOrder) {
    const std::vector<RawRecord> raw = { std::string("b"), std::string("a"), std::string("B"), std::string("c") };
    EXPECT_EQ(cleanValues(raw), (std::vector<std::string>{ "B", "A", "C" }));
}

TEST(CleanValuesTest, CleaningIsIdempotent) {
    const std::vector<RawRecord> raw = { std::string(" x "), std::nullopt, std::string("AHGVE1276F"), std::string("x") };
    const auto once = cleanValues(raw);

    std::vector<RawRecord> again(once.begin(), once.end());
    EXPECT_EQ(cleanValues(again), once);
}

TEST(CleanAndClassifyTest, EndToEndExample) {
    const std::vector<RawRecord> raw = {
        std::nullopt, std::nullopt, std::string("ahgve1276f"), std::string("AHGVE1276F "), std::string("invalid"), std::string("")
    };

    const CleaningResult result = cleanAndClassify(raw);
    EXPECT_EQ(result.totalCount, 6u);
    EXPECT_EQ(result.excludedCount, 3u);
    EXPECT_EQ(result.duplicateCount, 1u);

    const std::vector<ClassificationResult> expected = {
        { "AHGVE1276F", PanStatus::Valid },
        { "INVALID", PanStatus::Invalid }
    };
    EXPECT_EQ(result.results, expected);
}

TEST(CleanAndClassifyTest, EmptyInputProducesNothing) {
    const CleaningResult result = cleanAndClassify({});
    EXPECT_TRUE(result.results.empty());
    EXPECT_EQ(result.totalCount, 0u);
    EXPECT_EQ(result.excludedCount, 0u);
}
