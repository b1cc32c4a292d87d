#include <gtest/gtest.h>
#include "umb/data_loader.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

using namespace umb;
using namespace umb::core;

// ─── parse_csv_string ────────────────────────────────────────────────────────

TEST(DataLoader_Parse, ValidRows) {
    const std::string csv =
        "timestamp,open,high,low,close,volume\n"
        "1,1.0840,1.0852,1.0831,1.0849,1250\n"
        "2,1.0849,1.0861,1.0844,1.0858,980\n";
    const auto bars = DataLoader::parse_csv_string(csv, "EURUSD", "1-MINUTE-LAST");
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[0].instrument, "EURUSD");
    EXPECT_EQ(bars[0].bar_type, "1-MINUTE-LAST");
    EXPECT_EQ(bars[0].ts_event, 1);
    EXPECT_DOUBLE_EQ(bars[0].open, 1.0840);
    EXPECT_DOUBLE_EQ(bars[1].close, 1.0858);
    EXPECT_DOUBLE_EQ(bars[1].volume, 980.0);
}

TEST(DataLoader_Parse, HeaderOnly_Empty) {
    EXPECT_TRUE(DataLoader::parse_csv_string("timestamp,open,high,low,close,volume\n", "X").empty());
    EXPECT_TRUE(DataLoader::parse_csv_string("", "X").empty());
}

TEST(DataLoader_Parse, CommentsAndBlankLinesSkipped) {
    const std::string csv =
        "# exported from feed\n"
        "timestamp,open,high,low,close,volume\n"
        "\n"
        "# gap\n"
        "3,10,11,9,10.5,100\n";
    const auto bars = DataLoader::parse_csv_string(csv, "ES");
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_EQ(bars[0].ts_event, 3);
    EXPECT_EQ(bars[0].bar_type, "CSV");
}

TEST(DataLoader_Parse, CrLfLineEndings) {
    const std::string csv = "h\r\n1,10,11,9,10,5\r\n2,10,11,9,10,5\r\n";
    EXPECT_EQ(DataLoader::parse_csv_string(csv, "ES").size(), 2u);
}

TEST(DataLoader_Parse, BadRowsSkippedNotFatal) {
    const std::string csv =
        "timestamp,open,high,low,close,volume\n"
        "1,10,11,9,10,5\n"
        "2,10,11,9,10\n"            // too few columns
        "3,10,11,9,10,5,7\n"        // too many columns
        "4,abc,11,9,10,5\n"         // non-numeric price
        "5.5,10,11,9,10,5\n"        // fractional timestamp
        "6,10,9,11,10,5\n"          // high < low
        "7,10,11,9,12,5\n"          // close above high
        "8,10,11,9,10,-1\n"         // negative volume
        "9,nan,11,9,10,5\n"
        "10,10,11,9,10,5\n";
    const auto bars = DataLoader::parse_csv_string(csv, "ES");
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[0].ts_event, 1);
    EXPECT_EQ(bars[1].ts_event, 10);
}

TEST(DataLoader_Parse, WhitespaceAroundFieldsTolerated) {
    const auto bars = DataLoader::parse_csv_string("h\n 1 , 10 , 11 , 9 , 10 , 5 \n", "ES");
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_DOUBLE_EQ(bars[0].high, 11.0);
}

// ─── validate_bar ────────────────────────────────────────────────────────────

TEST(DataLoader_Validate, ConsistentBar) {
    bridge::MarketBar bar{.instrument = "ES", .ts_event = 1, .open = 10, .high = 11,
                          .low = 9, .close = 10.5, .volume = 0, .bar_type = "CSV"};
    EXPECT_TRUE(DataLoader::validate_bar(bar));
}

TEST(DataLoader_Validate, InfiniteVolumeRejected) {
    bridge::MarketBar bar{.instrument = "ES", .ts_event = 1, .open = 10, .high = 11,
                          .low = 9, .close = 10.5,
                          .volume = std::numeric_limits<double>::infinity(), .bar_type = ""};
    EXPECT_FALSE(DataLoader::validate_bar(bar));
}

TEST(DataLoader_Validate, OpenBelowLowRejected) {
    bridge::MarketBar bar{.instrument = "ES", .ts_event = 1, .open = 8, .high = 11,
                          .low = 9, .close = 10, .volume = 1, .bar_type = ""};
    EXPECT_FALSE(DataLoader::validate_bar(bar));
}

// ─── load_csv ────────────────────────────────────────────────────────────────

TEST(DataLoader_File, MissingFile_Nullopt) {
    EXPECT_FALSE(DataLoader::load_csv("/nonexistent/bars.csv", "ES").has_value());
}

TEST(DataLoader_File, ReadsFromDisk) {
    const auto path = (std::filesystem::temp_directory_path() / "umb_loader_bars.csv").string();
    {
        std::ofstream out(path);
        out << "timestamp,open,high,low,close,volume\n1,10,11,9,10,5\n";
    }
    const auto bars = DataLoader::load_csv(path, "GBPUSD", "5-MINUTE-LAST");
    std::filesystem::remove(path);
    ASSERT_TRUE(bars.has_value());
    ASSERT_EQ(bars->size(), 1u);
    EXPECT_EQ((*bars)[0].instrument, "GBPUSD");
    EXPECT_EQ((*bars)[0].bar_type, "5-MINUTE-LAST");
}
