#include "vehicle/TextUtil.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

class OcrFixTest : public ::testing::Test
{
};

TEST_F(OcrFixTest, UpperCasesInput)
{
    EXPECT_EQ(textutil::fix_ocr_errors("2015 chevy malibu"), "2015 CHEVY MALIBU");
}

TEST_F(OcrFixTest, JoiWordBecomes201)
{
    EXPECT_EQ(textutil::fix_ocr_errors("joi"), "201");
    EXPECT_EQ(textutil::fix_ocr_errors("LOT JOI"), "LOT 201");
}

TEST_F(OcrFixTest, JoiInsideWordIsKept)
{
    EXPECT_EQ(textutil::fix_ocr_errors("JOIN"), "JOIN");
    EXPECT_EQ(textutil::fix_ocr_errors("JOI5"), "JOI5");
}

TEST_F(OcrFixTest, SectionSignBecomesTwo)
{
    EXPECT_EQ(textutil::fix_ocr_errors("\xC2\xA7" "008 TOYOTA"), "2008 TOYOTA");
}

TEST_F(OcrFixTest, PipeBecomesOne)
{
    EXPECT_EQ(textutil::fix_ocr_errors("|999 DODGE"), "1999 DODGE");
}

TEST_F(OcrFixTest, StandaloneLetterOBecomesZero)
{
    EXPECT_EQ(textutil::fix_ocr_errors("2 O 1 5"), "2 0 1 5");
    EXPECT_EQ(textutil::fix_ocr_errors("O"), "0");
}

TEST_F(OcrFixTest, LetterOInsideWordIsKept)
{
    EXPECT_EQ(textutil::fix_ocr_errors("TOYOTA COROLLA"), "TOYOTA COROLLA");
}

TEST_F(OcrFixTest, AppliesAcrossLines)
{
    EXPECT_EQ(textutil::fix_ocr_errors("|999 ford\njoi\n"), "1999 FORD\n201\n");
}

class CleanTest : public ::testing::Test
{
};

TEST_F(CleanTest, CollapsesWhitespaceAndTrims)
{
    EXPECT_EQ(textutil::clean("  CHEVROLET \t  IMPALA  "), "CHEVROLET IMPALA");
}

TEST_F(CleanTest, RemovesPunctuation)
{
    EXPECT_EQ(textutil::clean("HONDA, CIVIC!"), "HONDA CIVIC");
    EXPECT_EQ(textutil::clean("A . B"), "A B");
}

TEST_F(CleanTest, KeepsHyphensAndUnderscores)
{
    EXPECT_EQ(textutil::clean("F-150 SUPER_DUTY"), "F-150 SUPER_DUTY");
}

TEST_F(CleanTest, PunctuationOnlyBecomesEmpty)
{
    EXPECT_EQ(textutil::clean(". , ! ?"), "");
    EXPECT_EQ(textutil::clean(""), "");
}

TEST_F(CleanTest, DropsNonAsciiBytes)
{
    EXPECT_EQ(textutil::clean("CAF\xC3\x89 RACER"), "CAF RACER");
}

TEST(TextUtilTest, SplitWordsDropsEmptyTokens)
{
    const std::vector<std::string> expected = {"TOYOTA", "CAMRY", "LE"};
    EXPECT_EQ(textutil::split_words("  TOYOTA  CAMRY\tLE \n"), expected);
    EXPECT_TRUE(textutil::split_words("   ").empty());
}

TEST(TextUtilTest, TrimHandlesAllWhitespace)
{
    EXPECT_EQ(textutil::trim(" \t\r\n"), "");
    EXPECT_EQ(textutil::trim("\tFORD \r"), "FORD");
}
