#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "csv.hpp"

using Fields = std::vector<std::string>;

TEST(ParseCsvTest, PlainRecordsWithLineNumbers) {
  auto recs = parse_csv("a,b\nc,d\n");
  ASSERT_EQ(recs.size(), 2u);
  EXPECT_EQ(recs[0].fields, (Fields{"a", "b"}));
  EXPECT_EQ(recs[0].line, 1);
  EXPECT_EQ(recs[1].fields, (Fields{"c", "d"}));
  EXPECT_EQ(recs[1].line, 2);
}

TEST(ParseCsvTest, CrLfAndMissingFinalNewline) {
  auto recs = parse_csv("a,b\r\nc,d");
  ASSERT_EQ(recs.size(), 2u);
  EXPECT_EQ(recs[0].fields, (Fields{"a", "b"}));
  EXPECT_EQ(recs[1].fields, (Fields{"c", "d"}));
}

TEST(ParseCsvTest, BlankLinesAreSkipped) {
  auto recs = parse_csv("\n\na,b\n\n");
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_EQ(recs[0].line, 3);
}

TEST(ParseCsvTest, QuotedFields) {
  auto recs = parse_csv("\"x,y\",\"he said \"\"hi\"\"\"\n\"\",z\n");
  ASSERT_EQ(recs.size(), 2u);
  EXPECT_EQ(recs[0].fields, (Fields{"x,y", "he said \"hi\""}));
  EXPECT_EQ(recs[1].fields, (Fields{"", "z"}));
}

TEST(ParseCsvTest, QuotedNewlineSpansLines) {
  auto recs = parse_csv("\"multi\nline\",z\nq,r\n");
  ASSERT_EQ(recs.size(), 2u);
  EXPECT_EQ(recs[0].fields, (Fields{"multi\nline", "z"}));
  EXPECT_EQ(recs[0].line, 1);
  EXPECT_EQ(recs[1].line, 3);
}

TEST(ParseCsvTest, TrailingCommaAndSingleField) {
  auto recs = parse_csv("a,\nsolo\n");
  ASSERT_EQ(recs.size(), 2u);
  EXPECT_EQ(recs[0].fields, (Fields{"a", ""}));
  EXPECT_EQ(recs[1].fields, (Fields{"solo"}));
}

TEST(ParseCsvTest, EmptyInput) {
  EXPECT_TRUE(parse_csv("").empty());
}

TEST(ParseCsvTest, QuoteInsideFieldIsLiteral) {
  auto recs = parse_csv("from,to\n5\" screen,5-inch screen\nfoo,bar\n");
  ASSERT_EQ(recs.size(), 3u);
  EXPECT_EQ(recs[1].fields, (Fields{"5\" screen", "5-inch screen"}));
  EXPECT_EQ(recs[1].line, 2);
  EXPECT_EQ(recs[2].fields, (Fields{"foo", "bar"}));
  EXPECT_EQ(recs[2].line, 3);
}

TEST(ParseCsvTest, TextAfterClosingQuoteIsKept) {
  auto recs = parse_csv("\"ab\"c\"d,e\n");
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_EQ(recs[0].fields, (Fields{"abc\"d", "e"}));
}
