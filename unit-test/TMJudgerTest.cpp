#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "judge/tm_judger.hpp"
#include "test/temp_directory.hpp"

using namespace std;
using namespace grader;
namespace fs = std::filesystem;

static const char *COPY_TM = R"(# leaves the input untouched
states: 1, 2, 3
input: 0, 1
start: 1
accept: 3
1, 0 -> 1, 0, R
1, 1 -> 1, 1, R
1, B -> 2, B, L
2, 0 -> 2, 0, L
2, 1 -> 2, 1, L
2, B -> 3, B, R
)";

class TMJudgerTest : public ::testing::Test {
protected:
    temp_directory submissions;
    assignment config;
    tm::tm_limits limits;

    void SetUp() override {
        config.tm_dir = AUTOGRADER_TM_DIR;
        config.tests = {{"invert", "0101", nullopt, nullopt}, {"invert", "01", "accept", "10"}};
        limits.step_limit = 1000;
    }

    submission_group group(const map<string, string> &files) {
        submission_group g;
        g.number = 3;
        g.name = "group3";
        g.root = submissions.path / "group3";
        fs::create_directories(g.root);
        for (auto &[name, content] : files) {
            submissions.write(fs::path("group3") / name, content);
            g.files.push_back(name);
        }
        return g;
    }

    vector<verdict> judge(const submission_group &g) {
        tm_judger judger(config, limits);
        return judger.judge(g);
    }

    static string reference(const string &name) {
        return read_file_content(fs::path(AUTOGRADER_TM_DIR) / (name + ".TM"));
    }
};

TEST_F(TMJudgerTest, PassTest) {
    auto verdicts = judge(group({{"INVERT.tm", reference("invert")}}));
    ASSERT_EQ(verdicts.size(), 2u);
    EXPECT_EQ(verdicts[0].kind, verdict_kind::PASS);
    EXPECT_EQ(verdicts[0].test, "invert 0101");
    EXPECT_EQ(verdicts[0].message, "accept 1010 after 10 steps");
    EXPECT_EQ(verdicts[1].kind, verdict_kind::PASS);
    EXPECT_EQ(verdicts[1].message, "accept 10 after 6 steps");
}

TEST_F(TMJudgerTest, ExpectedOutcomeOnlyTest) {
    config.tests = {{"equal", "101#101", "accept", nullopt}, {"equal", "11000#001", "reject", nullopt}};
    auto verdicts = judge(group({{"tms/equal.TM", reference("equal")}}));
    ASSERT_EQ(verdicts.size(), 2u);
    EXPECT_EQ(verdicts[0].kind, verdict_kind::PASS);
    EXPECT_EQ(verdicts[0].message, "accept after 44 steps");
    EXPECT_EQ(verdicts[1].kind, verdict_kind::PASS);
    EXPECT_EQ(verdicts[1].message, "reject 001 after 6 steps");
}

TEST_F(TMJudgerTest, WrongOutputTest) {
    auto verdicts = judge(group({{"invert.TM", COPY_TM}}));
    ASSERT_EQ(verdicts.size(), 2u);
    EXPECT_EQ(verdicts[0].kind, verdict_kind::FORMAT_MISMATCH);
    EXPECT_EQ(verdicts[0].message, "expected 'accept 1010', got 'accept 0101'");
    EXPECT_NE(verdicts[0].detail.find("final configuration: ...[3]0101..."), string::npos);
    EXPECT_EQ(verdicts[1].kind, verdict_kind::FORMAT_MISMATCH);
}

TEST_F(TMJudgerTest, WrongOutcomeTest) {
    config.tests = {{"invert", "01", "reject", nullopt}};
    auto verdicts = judge(group({{"invert.TM", reference("invert")}}));
    ASSERT_EQ(verdicts.size(), 1u);
    EXPECT_EQ(verdicts[0].kind, verdict_kind::FORMAT_MISMATCH);
    EXPECT_EQ(verdicts[0].message, "expected 'reject 10', got 'accept 10'");
}

TEST_F(TMJudgerTest, ParseErrorsTest) {
    const string header = "states: a, acc\ninput: 0\nstart: a\naccept: acc\n";
    config.tests = {{"ambiguous", "0", "accept", ""}, {"undeclared", "0", "accept", ""}, {"broken", "0", "accept", ""}};
    auto verdicts = judge(group({{"ambiguous.TM", header + "a, 0 -> acc, 0, R\na, 0 -> a, 0, R\n"},
                                 {"undeclared.TM", header + "a, X -> acc, 0, R\n"},
                                 {"broken.TM", "this is not a Turing machine\n"}}));
    ASSERT_EQ(verdicts.size(), 3u);

    EXPECT_EQ(verdicts[0].kind, verdict_kind::TM_AMBIGUOUS_TRANSITION);
    EXPECT_EQ(verdicts[0].test, "ambiguous 0");
    EXPECT_EQ(verdicts[0].message, "ambiguous.TM: Ambiguous Transition");
    EXPECT_NE(verdicts[0].detail.find("line 6"), string::npos);

    EXPECT_EQ(verdicts[1].kind, verdict_kind::TM_UNDECLARED_SYMBOL);
    EXPECT_EQ(verdicts[1].test, "undeclared 0");

    EXPECT_EQ(verdicts[2].kind, verdict_kind::TM_PARSE_ERROR);
    EXPECT_EQ(verdicts[2].test, "broken 0");
}

TEST_F(TMJudgerTest, ParseErrorReportedForEveryTestTest) {
    auto verdicts = judge(group({{"invert.TM", "garbage\n"}}));
    ASSERT_EQ(verdicts.size(), 2u);
    EXPECT_EQ(verdicts[0].kind, verdict_kind::TM_PARSE_ERROR);
    EXPECT_EQ(verdicts[1].kind, verdict_kind::TM_PARSE_ERROR);
    EXPECT_EQ(verdicts[0].message, verdicts[1].message);
    EXPECT_NE(verdicts[0].test, verdicts[1].test);
}

TEST_F(TMJudgerTest, MissingFileTest) {
    auto verdicts = judge(group({{"incr.TM", reference("incr")}}));
    ASSERT_EQ(verdicts.size(), 2u);
    EXPECT_EQ(verdicts[0].kind, verdict_kind::DISCOVERY_FAILURE);
    EXPECT_EQ(verdicts[0].message, "no file named invert.TM");
    EXPECT_EQ(verdicts[1].test, "invert 01");
}

TEST_F(TMJudgerTest, DuplicateFilesTest) {
    auto verdicts = judge(group({{"invert.TM", reference("invert")}, {"old/invert.tm", COPY_TM}}));
    ASSERT_EQ(verdicts.size(), 2u);
    EXPECT_EQ(verdicts[0].kind, verdict_kind::AMBIGUOUS_ENTRYPOINT);
    EXPECT_EQ(verdicts[0].message, "2 files are named invert.TM");
    EXPECT_EQ(verdicts[0].candidates, (vector<string>{"invert.TM", "old/invert.tm"}));
}

TEST_F(TMJudgerTest, StepLimitTest) {
    limits.step_limit = 50;
    config.tests = {{"runner", "0", "accept", ""}};
    auto verdicts = judge(group({{"runner.TM", "states: a, acc\ninput: 0\nstart: a\naccept: acc\n"
                                               "a, 0 -> a, 0, R\na, B -> a, B, R\n"}}));
    ASSERT_EQ(verdicts.size(), 1u);
    EXPECT_EQ(verdicts[0].kind, verdict_kind::STEP_LIMIT_EXCEEDED);
    EXPECT_EQ(verdicts[0].message, "did not halt within 50 steps");
    EXPECT_FALSE(verdicts[0].detail.empty());
}

TEST_F(TMJudgerTest, CycleTest) {
    config.tests = {{"bounce", "0", "accept", ""}};
    auto verdicts = judge(group({{"bounce.TM", "states: q0, q1, done\ninput: 0\nstart: q0\naccept: done\n"
                                               "q0, 0 -> q1, 0, R\nq1, B -> q0, B, L\n"}}));
    ASSERT_EQ(verdicts.size(), 1u);
    EXPECT_EQ(verdicts[0].kind, verdict_kind::CYCLE_DETECTED);
    EXPECT_EQ(verdicts[0].message, "configuration repeated after 2 steps");
    EXPECT_EQ(verdicts[0].detail, "...[q0]0...");
}

TEST_F(TMJudgerTest, MissingReferenceTest) {
    config.tests = {{"nonexistent", "0", nullopt, nullopt}};
    EXPECT_THROW({ tm_judger judger(config, limits); }, configuration_error);
}

TEST_F(TMJudgerTest, TypeTest) {
    tm_judger judger(config, limits);
    EXPECT_EQ(judger.type(), "tms");
}
