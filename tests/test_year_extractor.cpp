#include "vehicle/YearExtractor.hpp"

#include <gtest/gtest.h>

using vehicle::extract_year;

class YearExtractorTest : public ::testing::Test
{
};

TEST_F(YearExtractorTest, FourDigitYearAtStart)
{
    auto m = extract_year("2015 CHEVROLET IMPALA");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->year, "2015");
    EXPECT_EQ(m->rest_of_text, "CHEVROLET IMPALA");
}

TEST_F(YearExtractorTest, FourDigitYearMidLine)
{
    auto m = extract_year("LOT 44 - 1987 FORD BRONCO");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->year, "1987");
    EXPECT_EQ(m->rest_of_text, "FORD BRONCO");
}

TEST_F(YearExtractorTest, FourDigitYearWinsOverTwoDigit)
{
    auto m = extract_year("05 FORD 2007");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->year, "2007");
    EXPECT_EQ(m->rest_of_text, "");
}

TEST_F(YearExtractorTest, FourDigitYearMustBeWordBounded)
{
    // no boundary between the year and the make, and neither digit pair qualifies
    EXPECT_FALSE(extract_year("2015CHEVROLET").has_value());
}

TEST_F(YearExtractorTest, OutOfRangeFourDigitsIgnored)
{
    EXPECT_FALSE(extract_year("1850 WAGON").has_value());
    EXPECT_FALSE(extract_year("STOCK 12345 FORD").has_value());
}

TEST_F(YearExtractorTest, TwoDigitYearAfterPunctuation)
{
    auto m = extract_year(". 05CHEVROLET IMPALA");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->year, "2005");
    EXPECT_EQ(m->rest_of_text, "CHEVROLET IMPALA");
}

TEST_F(YearExtractorTest, TwoDigitYearAtLineStart)
{
    auto m = extract_year("99 FORD F150");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->year, "1999");
    EXPECT_EQ(m->rest_of_text, "FORD F150");
}

TEST_F(YearExtractorTest, TwoDigitYearNeedsLetterAfterIt)
{
    EXPECT_FALSE(extract_year("LOT 45 - 7 CARS").has_value());
    EXPECT_FALSE(extract_year("A 05ford").has_value());
}

TEST_F(YearExtractorTest, TwoDigitYearAllowsOnlyOneSpace)
{
    EXPECT_FALSE(extract_year("99  FORD").has_value());
}

TEST_F(YearExtractorTest, CenturyCutoffBoundary)
{
    auto at = extract_year("LOT 30 HONDA CIVIC");
    ASSERT_TRUE(at.has_value());
    EXPECT_EQ(at->year, "2030");

    auto after = extract_year("LOT 31 HONDA CIVIC");
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->year, "1931");
}

TEST_F(YearExtractorTest, CustomCenturyCutoff)
{
    auto m = extract_year("LOT 25 FORD", 20);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->year, "1925");
}

TEST_F(YearExtractorTest, NoYear)
{
    EXPECT_FALSE(extract_year("RANDOM JUNK LINE").has_value());
    EXPECT_FALSE(extract_year("").has_value());
}

TEST_F(YearExtractorTest, BareYear)
{
    auto m = extract_year("2015");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->year, "2015");
    EXPECT_TRUE(m->rest_of_text.empty());
}

TEST(ExpandTwoDigitYearTest, DefaultCutoff)
{
    EXPECT_EQ(vehicle::expand_two_digit_year("00"), "2000");
    EXPECT_EQ(vehicle::expand_two_digit_year("30"), "2030");
    EXPECT_EQ(vehicle::expand_two_digit_year("31"), "1931");
    EXPECT_EQ(vehicle::expand_two_digit_year("99"), "1999");
}
