/**
 * @file test_utils.cpp
 * @brief Unit tests for the helpers in utils.hpp
 */

#include <gtest/gtest.h>
#include "utils.hpp"
#include <set>

TEST(UtilsTest, FormatBytesUsesBinaryUnits) {
    EXPECT_EQ(formatBytes(0), "0 B");
    EXPECT_EQ(formatBytes(512), "512.0 B");
    EXPECT_EQ(formatBytes(1536), "1.5 KB");
    EXPECT_EQ(formatBytes(1073741824), "1.0 GB");
}

TEST(UtilsTest, FormatBytesStopsAtTerabytes) {
    EXPECT_EQ(formatBytes(1099511627776ULL * 2048), "2048.0 TB");
}

/**
 * @test RandomHexStringShape
 * @brief Two lowercase hex characters per byte, distinct across calls
 */
TEST(UtilsTest, RandomHexStringShape) {
    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        std::string tag = randomHexString(16);
        ASSERT_EQ(tag.size(), 32u);
        EXPECT_EQ(tag.find_first_not_of("0123456789abcdef"), std::string::npos) << tag;
        seen.insert(tag);
    }
    EXPECT_EQ(seen.size(), 64u);
    EXPECT_TRUE(randomHexString(0).empty());
    EXPECT_EQ(randomHexString(9).size(), 18u);
}
