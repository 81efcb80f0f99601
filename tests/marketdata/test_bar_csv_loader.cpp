/*
TdChart — BarCsvLoader Tests
Role: Verify CSV parsing into bar series
Coverage: Price-only synthesis, OHLC rows, row skipping, ordering, header errors, timestamp parsing
*/
#include <gtest/gtest.h>
#include "marketdata/BarCsvLoader.hpp"
#include "ParseUtils.hpp"
#include <clocale>
#include <filesystem>
#include <fstream>

using namespace tdchart;

// =============================================================================
// Price-only format
// =============================================================================

TEST(BarCsvLoaderTest, SynthesizesBarsFromPrices) {
    const char* csv =
        "symbol,publisheddate,price\n"
        "ACME,2024-01-02,10\n"
        "ACME,2024-01-01,8\n"
        "BETA,2024-01-01,50\n"
        "ACME,2024-01-03,12\n";

    auto data = BarCsvLoader::parse(csv);
    EXPECT_EQ(data.symbols(), (std::vector<std::string>{"ACME", "BETA"}));
    EXPECT_EQ(data.skippedRows, 0u);

    const BarSeries* acme = data.find("ACME");
    ASSERT_NE(acme, nullptr);
    ASSERT_EQ(acme->size(), 3u);

    EXPECT_EQ((*acme)[0].timestamp_ms, 1704067200000LL);
    EXPECT_DOUBLE_EQ((*acme)[0].open, 8.0);
    EXPECT_DOUBLE_EQ((*acme)[0].high, 8.0);
    EXPECT_DOUBLE_EQ((*acme)[0].low, 8.0);

    EXPECT_DOUBLE_EQ((*acme)[1].open, 9.0);
    EXPECT_DOUBLE_EQ((*acme)[1].high, 10.0);
    EXPECT_DOUBLE_EQ((*acme)[1].low, 9.0);
    EXPECT_DOUBLE_EQ((*acme)[1].close, 10.0);

    EXPECT_DOUBLE_EQ((*acme)[2].open, 11.0);
    EXPECT_DOUBLE_EQ((*acme)[2].close, 12.0);
    EXPECT_FALSE((*acme)[2].volume.has_value());

    EXPECT_EQ(data.find("BETA")->size(), 1u);
    EXPECT_EQ(data.find("GAMMA"), nullptr);
}

TEST(BarCsvLoaderTest, FallingPriceSynthesis) {
    auto bars = BarCsvLoader::synthesizeFromCloses({{1, 10.0}, {2, 6.0}});
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_DOUBLE_EQ(bars[1].open, 8.0);
    EXPECT_DOUBLE_EQ(bars[1].high, 8.0);
    EXPECT_DOUBLE_EQ(bars[1].low, 6.0);
}

TEST(BarCsvLoaderTest, SkipsInvalidRows) {
    const char* csv =
        "Symbol,PublishedDate,Price\r\n"
        "ACME,2024-01-01,8\r\n"
        ",2024-01-02,5\r\n"
        "ACME,notadate,5\r\n"
        "ACME,2024-01-05,abc\r\n"
        "ACME,2024-01-06\r\n"
        "\r\n"
        "ACME,2024-01-07,9\r\n";

    auto data = BarCsvLoader::parse(csv);
    EXPECT_EQ(data.skippedRows, 4u);
    ASSERT_NE(data.find("ACME"), nullptr);
    EXPECT_EQ(data.find("ACME")->size(), 2u);
}

// =============================================================================
// OHLC format
// =============================================================================

TEST(BarCsvLoaderTest, ReadsOhlcRows) {
    const char* csv =
        "timestamp,open,high,low,close,volume\n"
        "1704153600000,10,12,9,11,1500\n"
        "1704067200000,9,10,8,9.5,\n";

    auto data = BarCsvLoader::parse(csv, "SPY");
    ASSERT_EQ(data.symbols(), (std::vector<std::string>{"SPY"}));

    const auto& bars = *data.find("SPY");
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[0].timestamp_ms, 1704067200000LL);
    EXPECT_DOUBLE_EQ(bars[0].close, 9.5);
    EXPECT_FALSE(bars[0].volume.has_value());

    EXPECT_DOUBLE_EQ(bars[1].open, 10.0);
    EXPECT_DOUBLE_EQ(bars[1].high, 12.0);
    EXPECT_DOUBLE_EQ(bars[1].low, 9.0);
    EXPECT_DOUBLE_EQ(bars[1].close, 11.0);
    EXPECT_EQ(bars[1].volume, 1500);
}

TEST(BarCsvLoaderTest, DuplicateTimestampKeepsLaterRow) {
    const char* csv =
        "date,open,high,low,close\n"
        "2024-01-01,1,2,0.5,1.5\n"
        "2024-01-01,1,3,0.5,2.5\n"
        "2024-01-02,2,3,1,2\n";

    auto data = BarCsvLoader::parse(csv);
    const auto& bars = *data.find(BarCsvLoader::kDefaultSymbol);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_DOUBLE_EQ(bars[0].close, 2.5);
    EXPECT_EQ(data.skippedRows, 1u);
}

TEST(BarCsvLoaderTest, InvalidOhlcValueSkipsRow) {
    const char* csv =
        "date,open,high,low,close\n"
        "2024-01-01,1,2,0.5,x\n"
        "2024-01-02,2,3,1,2\n";

    auto data = BarCsvLoader::parse(csv);
    EXPECT_EQ(data.find(BarCsvLoader::kDefaultSymbol)->size(), 1u);
    EXPECT_EQ(data.skippedRows, 1u);
}

// =============================================================================
// Errors
// =============================================================================

TEST(BarCsvLoaderTest, EmptyInputThrows) {
    EXPECT_THROW(BarCsvLoader::parse(""), BarCsvError);
    EXPECT_THROW(BarCsvLoader::parse("\n \n"), BarCsvError);
}

TEST(BarCsvLoaderTest, MissingColumnsThrow) {
    EXPECT_THROW(BarCsvLoader::parse("symbol,price\nACME,1\n"), BarCsvError);
    EXPECT_THROW(BarCsvLoader::parse("symbol,publisheddate\nACME,2024-01-01\n"), BarCsvError);
}

TEST(BarCsvLoaderTest, NoValidRowsThrows) {
    EXPECT_THROW(BarCsvLoader::parse("symbol,publisheddate,price\nACME,bad,1\n"), BarCsvError);
    EXPECT_THROW(BarCsvLoader::parse("symbol,publisheddate,price\n"), BarCsvError);
}

TEST(BarCsvLoaderTest, LoadFile) {
    const auto path = std::filesystem::temp_directory_path() / "tdchart_bar_csv_loader_test.csv";
    {
        std::ofstream out(path);
        out << "symbol,publisheddate,price\nZEUS,2024-03-01,42\n";
    }
    auto data = BarCsvLoader::loadFile(path);
    std::filesystem::remove(path);

    ASSERT_NE(data.find("ZEUS"), nullptr);
    EXPECT_DOUBLE_EQ(data.find("ZEUS")->front().close, 42.0);
    EXPECT_THROW(BarCsvLoader::loadFile("/nonexistent/tdchart/bars.csv"), BarCsvError);
}

// =============================================================================
// Timestamp parsing
// =============================================================================

TEST(ParseUtilsTest, ParsesDatesAndDateTimes) {
    using ParseUtils::parseTimestampMs;

    EXPECT_EQ(parseTimestampMs("2024-01-02"), 1704153600000LL);
    EXPECT_EQ(parseTimestampMs("2024-01-02T00:00:00Z"), 1704153600000LL);
    EXPECT_EQ(parseTimestampMs("2024-01-02 00:00:01"), 1704153601000LL);
    EXPECT_EQ(parseTimestampMs("2024-01-02T00:00:00.250Z"), 1704153600250LL);
    EXPECT_EQ(parseTimestampMs("2024-01-02T01:00:00+01:00"), 1704153600000LL);
    EXPECT_EQ(parseTimestampMs("1704153600000"), 1704153600000LL);
}

TEST(ParseUtilsTest, RejectsMalformedTimestamps) {
    using ParseUtils::parseTimestampMs;

    EXPECT_FALSE(parseTimestampMs("").has_value());
    EXPECT_FALSE(parseTimestampMs("bad").has_value());
    EXPECT_FALSE(parseTimestampMs("2024-13-01").has_value());
    EXPECT_FALSE(parseTimestampMs("2024-02-30").has_value());
    EXPECT_FALSE(parseTimestampMs("2024-01-02T25:00:00").has_value());
    EXPECT_FALSE(parseTimestampMs("2024-01-02Tgarbage").has_value());
}

TEST(ParseUtilsTest, RejectsNonDigitFields) {
    using ParseUtils::parseTimestampMs;

    EXPECT_FALSE(parseTimestampMs("2024-1--02").has_value());
    EXPECT_FALSE(parseTimestampMs("20a4-01-02").has_value());
    EXPECT_FALSE(parseTimestampMs("2024-01-0x").has_value());
    EXPECT_FALSE(parseTimestampMs("2024-01-02T10x30y00").has_value());
    EXPECT_FALSE(parseTimestampMs("2024-01-02T1:030:00").has_value());
    EXPECT_FALSE(parseTimestampMs("2024-01-02T10:30:00+0x:00").has_value());
    EXPECT_FALSE(parseTimestampMs("2024-01-02T10:30:00+01:x0").has_value());
    EXPECT_FALSE(parseTimestampMs("2024-01-02T10:30:00+24:00").has_value());
}

TEST(BarCsvLoaderTest, MalformedDateRowIsSkipped) {
    const char* csv =
        "symbol,publisheddate,price\n"
        "ACME,2024-1--02,8\n"
        "ACME,2024-01-03T10x30y00,9\n"
        "ACME,2024-01-04,10\n";

    auto data = BarCsvLoader::parse(csv);
    EXPECT_EQ(data.skippedRows, 2u);
    ASSERT_EQ(data.find("ACME")->size(), 1u);
    EXPECT_EQ(data.find("ACME")->front().timestamp_ms, 1704326400000LL);
}

TEST(ParseUtilsTest, ParsesNumbers) {
    EXPECT_EQ(ParseUtils::parseDouble(" 12.5 "), 12.5);
    EXPECT_FALSE(ParseUtils::parseDouble("12.5x").has_value());
    EXPECT_FALSE(ParseUtils::parseDouble("nan").has_value());
    EXPECT_EQ(ParseUtils::parseInt64("42"), 42);
    EXPECT_FALSE(ParseUtils::parseInt64("4.2").has_value());
    EXPECT_EQ(ParseUtils::parseDouble("+3.25"), 3.25);
    EXPECT_FALSE(ParseUtils::parseDouble("inf").has_value());
}

TEST(ParseUtilsTest, DecimalPointIgnoresProcessLocale) {
    const std::string previous = std::setlocale(LC_NUMERIC, nullptr);
    // Comma-decimal locale when the machine has one; the assertions hold either way
    if (!std::setlocale(LC_NUMERIC, "de_DE.UTF-8")) {
        std::setlocale(LC_NUMERIC, "fr_FR.UTF-8");
    }

    EXPECT_EQ(ParseUtils::parseDouble("101.5"), 101.5);
    EXPECT_FALSE(ParseUtils::parseDouble("101,5").has_value());

    std::setlocale(LC_NUMERIC, previous.c_str());
}
