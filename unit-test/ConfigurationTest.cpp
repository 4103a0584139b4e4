#include "gtest/gtest.h"
#include "tm/configuration.hpp"

using namespace std;
using namespace grader::tm;

static const set<char> ALPHABET = {'0', '1', 'B'};

TEST(ConfigurationTest, StrictParseTest) {
    auto config = parse_configuration("...01[q1]10...", 'B');
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->left, "01");
    EXPECT_EQ(config->state, "q1");
    EXPECT_EQ(config->right, "10");
    EXPECT_EQ(config->to_string(), "...01[q1]10...");

    auto empty = parse_configuration("...[3]...", 'B');
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(empty->left, "");
    EXPECT_EQ(empty->right, "");
}

TEST(ConfigurationTest, StrictParseStripsOuterBlanksTest) {
    auto config = parse_configuration("...BB1[2]B0BB...", 'B');
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->left, "1");
    EXPECT_EQ(config->right, "B0");
}

TEST(ConfigurationTest, StrictParseRejectsTest) {
    EXPECT_FALSE(parse_configuration("01[q1]10", 'B').has_value());
    EXPECT_FALSE(parse_configuration("...01 [q1]10...", 'B').has_value());
    EXPECT_FALSE(parse_configuration("...01[]10...", 'B').has_value());
    EXPECT_FALSE(parse_configuration("...[1][2]...", 'B').has_value());
    EXPECT_FALSE(parse_configuration("...01(1)0...", 'B').has_value());
    EXPECT_FALSE(parse_configuration("...", 'B').has_value());
}

TEST(ConfigurationTest, LenientParseTest) {
    auto config = parse_configuration_lenient("... 1 0 ( q2 ) 1 ...", ALPHABET, 'B');
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->left, "10");
    EXPECT_EQ(config->state, "2");
    EXPECT_EQ(config->right, "1");

    auto bars = parse_configuration_lenient("10|3|1", ALPHABET, 'B');
    ASSERT_TRUE(bars.has_value());
    EXPECT_EQ(bars->to_string(), "...10[3]1...");

    auto braces = parse_configuration_lenient("B1{q0}0B", ALPHABET, 'B');
    ASSERT_TRUE(braces.has_value());
    EXPECT_EQ(braces->to_string(), "...1[0]0...");
}

TEST(ConfigurationTest, LenientParseRejectsTest) {
    EXPECT_FALSE(parse_configuration_lenient("10 x [1] 0", ALPHABET, 'B').has_value());
    EXPECT_FALSE(parse_configuration_lenient("101", ALPHABET, 'B').has_value());
    EXPECT_FALSE(parse_configuration_lenient("1[2", ALPHABET, 'B').has_value());
    EXPECT_FALSE(parse_configuration_lenient("1[]0", ALPHABET, 'B').has_value());
    EXPECT_FALSE(parse_configuration_lenient("1[2]0]", ALPHABET, 'B').has_value());
}

TEST(ConfigurationTest, EqualityTest) {
    EXPECT_EQ((configuration{"1", "q3", "0"}), (configuration{"1", "3", "0"}));
    EXPECT_NE((configuration{"1", "3", "0"}), (configuration{"1", "3", "00"}));
    EXPECT_NE((configuration{"1", "qa", "0"}), (configuration{"1", "a", "0"}));
    EXPECT_EQ(canonical_state("q12"), "12");
    EXPECT_EQ(canonical_state("q"), "q");
    EXPECT_EQ(canonical_state("accept"), "accept");
}

TEST(ConfigurationTest, MakeConfigurationTest) {
    configuration config = make_configuration("BB1", "s", "0BB", 'B');
    EXPECT_EQ(config.left, "1");
    EXPECT_EQ(config.right, "0");
    EXPECT_EQ(make_configuration("BBB", "s", "BB", 'B').to_string(), "...[s]...");
}
