#include <gtest/gtest.h>
#include "../../src/common/units.h"

#include <stdexcept>

using namespace Ftsb;
using namespace std::chrono_literals;

TEST(FormatByteSizeTest, BinaryUnits) {
    EXPECT_EQ(FormatByteSize(0), "0B");
    EXPECT_EQ(FormatByteSize(512), "512B");
    EXPECT_EQ(FormatByteSize(1024), "1K");
    EXPECT_EQ(FormatByteSize(1536), "1.5K");
    EXPECT_EQ(FormatByteSize(10ULL << 20), "10M");
    EXPECT_EQ(FormatByteSize(3ULL << 30), "3G");
    EXPECT_EQ(FormatByteSize(5ULL << 40), "5T");
}

TEST(ParseDurationTest, SingleUnits) {
    EXPECT_EQ(ParseDuration("1s"), 1s);
    EXPECT_EQ(ParseDuration("250ms"), 250ms);
    EXPECT_EQ(ParseDuration("10us"), 10us);
    EXPECT_EQ(ParseDuration("2m"), 2min);
    EXPECT_EQ(ParseDuration("1h"), 1h);
    EXPECT_EQ(ParseDuration("0"), 0ns);
}

TEST(ParseDurationTest, CompoundAndFractional) {
    EXPECT_EQ(ParseDuration("1m30s"), 90s);
    EXPECT_EQ(ParseDuration("1.5s"), 1500ms);
}

TEST(ParseDurationTest, RejectsMalformedInput) {
    EXPECT_THROW(ParseDuration(""), std::invalid_argument);
    EXPECT_THROW(ParseDuration("10"), std::invalid_argument);
    EXPECT_THROW(ParseDuration("5 parsecs"), std::invalid_argument);
    EXPECT_THROW(ParseDuration("s"), std::invalid_argument);
    EXPECT_THROW(ParseDuration("1.2.3s"), std::invalid_argument);
    EXPECT_THROW(ParseDuration("1..5s"), std::invalid_argument);
    EXPECT_THROW(ParseDuration(".s"), std::invalid_argument);
}

TEST(FormatDurationTest, ReadsBack) {
    EXPECT_EQ(FormatDuration(1s), "1s");
    EXPECT_EQ(FormatDuration(500ms), "500ms");
    EXPECT_EQ(FormatDuration(0ns), "0");
    EXPECT_EQ(ParseDuration(FormatDuration(1500us)), 1500us);
}
