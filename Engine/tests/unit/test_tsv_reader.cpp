/**
 * @file test_tsv_reader.cpp
 * @brief Unit tests for tab-delimited row reading and id parsing
 */

#include "../test_support.hpp"
#include <corpus/tsv_reader.hpp>
#include <corpus/errors.hpp>
#include <sstream>

using namespace Rosetta;

TEST(TsvReaderTest, SplitKeepsEmptyFields) {
    auto row = TsvReader::split("1\t\tx\t");
    ASSERT_EQ(row.size(), 4u);
    EXPECT_EQ(row[0], "1");
    EXPECT_EQ(row[1], "");
    EXPECT_EQ(row[2], "x");
    EXPECT_EQ(row[3], "");
}

TEST(TsvReaderTest, ReadsRowsAndSkipsBlankLines) {
    std::istringstream in("1\teng\tHello\r\n\n2\tjpn\tこんにちは\n");
    TsvReader reader(TsvSource(in, "greetings"));

    ASSERT_TRUE(reader.has_next());
    auto first = reader.read_next();
    EXPECT_EQ(first, (Row{"1", "eng", "Hello"}));
    EXPECT_EQ(reader.line_number(), 1u);

    ASSERT_TRUE(reader.has_next());
    auto second = reader.read_next();
    EXPECT_EQ(second[2], "こんにちは");
    EXPECT_EQ(reader.line_number(), 3u);

    EXPECT_FALSE(reader.has_next());
    EXPECT_EQ(reader.source_name(), "greetings");
}

TEST(TsvReaderTest, EmptyStream) {
    std::istringstream in("");
    TsvReader reader{TsvSource(in)};
    EXPECT_FALSE(reader.has_next());
    EXPECT_EQ(reader.source_name(), "<stream>");
}

TEST(TsvReaderTest, MissingFileIsInvalidFile) {
    EXPECT_THROW(TsvReader(TsvSource(data_path("does_not_exist.csv"))), InvalidFileError);
}

TEST(TsvReaderTest, ParseId) {
    EXPECT_EQ(TsvReader::parse_id("6381"), 6381);
    EXPECT_EQ(TsvReader::parse_id(" 42 "), 42);
    EXPECT_EQ(TsvReader::parse_id("+7"), 7);
    EXPECT_FALSE(TsvReader::parse_id("").has_value());
    EXPECT_FALSE(TsvReader::parse_id("eng").has_value());
    EXPECT_FALSE(TsvReader::parse_id("12a").has_value());
    EXPECT_FALSE(TsvReader::parse_id("+-5").has_value());
    EXPECT_FALSE(TsvReader::parse_id("+").has_value());
    EXPECT_FALSE(TsvReader::parse_id("99999999999999999999999").has_value());
}
