#include "ocr/ProcUtil.hpp"
#include "ocr/TesseractOcrEngine.hpp"
#include "ocr/TextFileOcrEngine.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

static const char* kTsvHeader =
    "level\tpage_num\tblock_num\tpar_num\tline_num\tword_num\tleft\ttop\twidth\theight\tconf\ttext\n";

TEST(TesseractTsvTest, RebuildsLinesFromWordRows)
{
    std::string tsv = kTsvHeader;
    tsv += "1\t1\t0\t0\t0\t0\t0\t0\t640\t480\t-1\t\n";
    tsv += "4\t1\t1\t1\t1\t0\t10\t10\t300\t20\t-1\t\n";
    tsv += "5\t1\t1\t1\t1\t1\t10\t10\t40\t20\t90.5\t2015\n";
    tsv += "5\t1\t1\t1\t1\t2\t60\t10\t120\t20\t80\tCHEVROLET\n";
    tsv += "5\t1\t1\t1\t1\t3\t190\t10\t80\t20\t70\tIMPALA\n";
    tsv += "4\t1\t1\t1\t2\t0\t10\t40\t300\t20\t-1\t\n";
    tsv += "5\t1\t1\t1\t2\t1\t10\t40\t40\t20\t60\t99\n";
    tsv += "5\t1\t1\t1\t2\t2\t60\t40\t60\t20\t50\tFORD\n";

    const ocr::OcrResult r = ocr::parse_tesseract_tsv(tsv);

    EXPECT_EQ(r.text, "2015 CHEVROLET IMPALA\n99 FORD\n");
    EXPECT_DOUBLE_EQ(r.confidence, (90.5 + 80 + 70 + 60 + 50) / 5.0);
}

TEST(TesseractTsvTest, SkipsEmptyWordsAndNegativeConfidence)
{
    std::string tsv = kTsvHeader;
    tsv += "5\t1\t1\t1\t1\t1\t0\t0\t1\t1\t95\t\n";
    tsv += "5\t1\t1\t1\t1\t2\t0\t0\t1\t1\t-1\tKIA\n";

    const ocr::OcrResult r = ocr::parse_tesseract_tsv(tsv);

    EXPECT_EQ(r.text, "KIA\n");
    EXPECT_DOUBLE_EQ(r.confidence, 0.0);
}

TEST(TesseractTsvTest, EmptyOutput)
{
    const ocr::OcrResult r = ocr::parse_tesseract_tsv("");
    EXPECT_TRUE(r.text.empty());
    EXPECT_DOUBLE_EQ(r.confidence, 0.0);
}

TEST(TesseractTsvTest, ToleratesCrlfRows)
{
    std::string tsv = "level\tpage_num\tblock_num\tpar_num\tline_num\tword_num\tleft\ttop\twidth\theight\tconf\ttext\r\n";
    tsv += "5\t1\t1\t1\t1\t1\t0\t0\t1\t1\t88\tSOUL\r\n";

    EXPECT_EQ(ocr::parse_tesseract_tsv(tsv).text, "SOUL\n");
}

TEST(TesseractEngineTest, CommandLineCarriesOptions)
{
    ocr::TesseractOcrEngine engine;
    const std::string cmd = engine.command_line("/tmp/my scan.png");

    EXPECT_NE(cmd.find("'/tmp/my scan.png'"), std::string::npos);
    EXPECT_NE(cmd.find("--psm 6"), std::string::npos);
    EXPECT_NE(cmd.find("tessedit_char_whitelist=ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789 .-"), std::string::npos);
    EXPECT_NE(cmd.find("preserve_interword_spaces=1"), std::string::npos);
    EXPECT_NE(cmd.find(" tsv"), std::string::npos);
}

TEST(TesseractEngineTest, MissingBinaryThrows)
{
    ocr::TesseractOptions opts;
    opts.binary = "yardscan-no-such-tesseract";
    ocr::TesseractOcrEngine engine(opts);

    EXPECT_THROW(engine.recognize("scan.png"), std::runtime_error);
}

TEST(ProcUtilTest, ShellQuoteEscapesSingleQuotes)
{
    EXPECT_EQ(procutil::shell_quote("a b"), "'a b'");
    EXPECT_EQ(procutil::shell_quote("it's"), "'it'\\''s'");
}

class TextFileOcrTest : public ::testing::Test
{
protected:
    TempDir tmp;
    ocr::TextFileOcrEngine engine;
};

TEST_F(TextFileOcrTest, PlainTextFile)
{
    const auto p = tmp.write("scan.txt", "2015 CHEVROLETIMPALA\n99 FORD F150\n");

    const ocr::OcrResult r = engine.recognize(p.string());
    EXPECT_EQ(r.text, "2015 CHEVROLETIMPALA\n99 FORD F150\n");
    EXPECT_DOUBLE_EQ(r.confidence, 0.0);
}

TEST_F(TextFileOcrTest, JsonResultFile)
{
    const auto p = tmp.write("scan.json", R"({"text": "2004 HONDA CIVIC", "confidence": 81.25})");

    const ocr::OcrResult r = engine.recognize(p.string());
    EXPECT_EQ(r.text, "2004 HONDA CIVIC");
    EXPECT_DOUBLE_EQ(r.confidence, 81.25);
}

TEST_F(TextFileOcrTest, JsonWithoutTextThrows)
{
    const auto p = tmp.write("scan.json", R"({"confidence": 50})");
    EXPECT_THROW(engine.recognize(p.string()), std::runtime_error);
}

TEST_F(TextFileOcrTest, JsonWithBadConfidenceThrows)
{
    const auto p = tmp.write("scan.json", R"({"text": "x", "confidence": "high"})");
    EXPECT_THROW(engine.recognize(p.string()), std::runtime_error);
}

TEST_F(TextFileOcrTest, MissingFileThrows)
{
    EXPECT_THROW(engine.recognize((tmp.path() / "missing.txt").string()), std::runtime_error);
}
