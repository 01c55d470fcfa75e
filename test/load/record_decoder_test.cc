#include <gtest/gtest.h>
#include "../../src/load/record_decoder.h"

#include <iostream>
#include <sstream>

using namespace Ftsb;

TEST(CsvSplitFieldsTest, PlainAndQuotedFields) {
    std::vector<std::string> fields;
    std::string error;
    ASSERT_TRUE(CsvRecordDecoder::SplitFields(R"(WRITE,doc1,HSET,"a,b","say ""hi""",)", &fields, &error));
    ASSERT_EQ(fields.size(), 6u);
    EXPECT_EQ(fields[0], "WRITE");
    EXPECT_EQ(fields[3], "a,b");
    EXPECT_EQ(fields[4], "say \"hi\"");
    EXPECT_EQ(fields[5], "");
}

TEST(CsvSplitFieldsTest, BrokenQuoting) {
    std::vector<std::string> fields;
    std::string error;
    EXPECT_FALSE(CsvRecordDecoder::SplitFields(R"(WRITE,do"c,HSET)", &fields, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(CsvRecordDecoder::SplitFields(R"(WRITE,"doc"x,HSET)", &fields, &error));
    EXPECT_FALSE(CsvRecordDecoder::SplitFields(R"(WRITE,"doc,HSET)", &fields, &error));
}

TEST(CsvParseLineTest, ExtractsRecord) {
    Record record;
    std::string error;
    const std::string line = "READ,q-17,FT.SEARCH,idx1,hello world,LIMIT,0,10";
    ASSERT_TRUE(CsvRecordDecoder::ParseLine(line, &record, &error));
    EXPECT_EQ(record.category, CmdCategory::kRead);
    EXPECT_EQ(record.label, "READ");
    EXPECT_EQ(record.id, "q-17");
    EXPECT_EQ(record.command, "FT.SEARCH");
    ASSERT_EQ(record.args.size(), 5u);
    EXPECT_EQ(record.args[0], "idx1");
    EXPECT_EQ(record.args[1], "hello world");
    EXPECT_EQ(record.tx_bytes, line.size() - 4);
}

TEST(CsvParseLineTest, CommandWithoutArguments) {
    Record record;
    std::string error;
    ASSERT_TRUE(CsvRecordDecoder::ParseLine("SETUP_WRITE,1,PING", &record, &error));
    EXPECT_EQ(record.category, CmdCategory::kSetupWrite);
    EXPECT_TRUE(record.args.empty());
}

TEST(CsvParseLineTest, TooFewFields) {
    Record record;
    std::string error;
    EXPECT_FALSE(CsvRecordDecoder::ParseLine("WRITE,doc1", &record, &error));
    EXPECT_NE(error.find("minimum"), std::string::npos);
}

TEST(CsvParseLineTest, UnknownLabelKeepsLabel) {
    Record record;
    std::string error;
    ASSERT_TRUE(CsvRecordDecoder::ParseLine("AGGREGATE,a1,FT.AGGREGATE,idx1,*", &record, &error));
    EXPECT_EQ(record.category, CmdCategory::kUnknown);
    EXPECT_EQ(record.label, "AGGREGATE");
}

TEST(CsvRecordDecoderTest, SkipsMalformedAndEmptyLines) {
    std::istringstream in(
        "WRITE,1,HSET,doc:1,f,v\r\n"
        "\n"
        "garbage\n"
        "UPDATE,2,HSET,doc:1,f,w\n"
        "DELETE,3,DEL,\"doc:1\n"
        "DELETE,4,DEL,doc:1");
    CsvRecordDecoder decoder(in);

    std::vector<Record> records;
    Record record;
    while (decoder.Decode(&record)) {
        records.push_back(record);
    }

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].category, CmdCategory::kWrite);
    EXPECT_EQ(records[0].args.back(), "v");
    EXPECT_EQ(records[1].category, CmdCategory::kUpdate);
    EXPECT_EQ(records[2].id, "4");
    EXPECT_EQ(decoder.MalformedCount(), 2u);
}

TEST(CategoryTest, LabelsRoundTrip) {
    for (CmdCategory category : kAllCategories) {
        EXPECT_EQ(ParseCategory(CategoryLabel(category)), category);
    }
    EXPECT_EQ(ParseCategory("write"), CmdCategory::kUnknown);
    EXPECT_STREQ(CategoryLabel(CmdCategory::kUnknown), "UNKNOWN");
}

TEST(InputSourceDeathTest, MissingFileIsFatal) {
    EXPECT_DEATH(InputSource("/nonexistent/ftsb/input.csv"), "cannot open file");
}

TEST(InputSourceTest, StdinKeepsItsStreamBuffer) {
    // Swap a string buffer in as stdin; an installed read buffer would clobber it
    std::istringstream fake("SETUP_WRITE,doc1,HSET,doc1,f,v\nREAD,q1,FT.SEARCH,idx1,hello\n");
    std::streambuf* saved = std::cin.rdbuf(fake.rdbuf());
    {
        InputSource source("");
        EXPECT_EQ(source.name(), "<stdin>");
        EXPECT_EQ(&source.stream(), &std::cin);
        std::string line;
        ASSERT_TRUE(std::getline(source.stream(), line));
        EXPECT_EQ(line, "SETUP_WRITE,doc1,HSET,doc1,f,v");
    }
    // Still readable once the source is gone
    std::string line;
    EXPECT_TRUE(std::getline(std::cin, line));
    EXPECT_EQ(line, "READ,q1,FT.SEARCH,idx1,hello");
    std::cin.rdbuf(saved);
}
