#include <sstream>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "judge/judger.hpp"
#include "judge/report.hpp"
#include "test/temp_directory.hpp"

using namespace std;
using namespace grader;
using namespace nlohmann;

static group_result sample(const string &name, optional<int> number, vector<verdict> verdicts) {
    group_result result;
    result.group.name = name;
    result.group.number = number;
    result.group.root = "/submissions/" + name;
    result.verdicts = move(verdicts);
    return result;
}

TEST(ReportTest, FormatVerdictTest) {
    verdict pass = make_verdict(verdict_kind::PASS, "invert 0101", "correct");
    pass.time = 0.25;
    EXPECT_EQ(format_verdict("group1", pass), "[group1] invert 0101: Pass - correct (0.25s)\n");

    verdict mismatch = make_verdict(verdict_kind::FORMAT_MISMATCH, "incr 111", "incorrect configurations",
                                    "- ...[1]111...\n+ ...[1]110...\n");
    EXPECT_EQ(format_verdict("group2", mismatch),
              "[group2] incr 111: Format Mismatch - incorrect configurations\n"
              "    - ...[1]111...\n"
              "    + ...[1]110...\n");
}

TEST(ReportTest, FormatGroupVerdictTest) {
    verdict v = make_verdict(verdict_kind::AMBIGUOUS_ENTRYPOINT, "", "cannot decide");
    v.candidates = {"a.c", "b.c"};
    EXPECT_EQ(format_verdict("group7", v),
              "[group7] Ambiguous Entrypoint - cannot decide\n"
              "    * a.c\n"
              "    * b.c\n");
}

TEST(ReportTest, PrintSummaryTest) {
    vector<group_result> results = {
        sample("group1", 1, {make_verdict(verdict_kind::PASS, "t1", ""), make_verdict(verdict_kind::PASS, "t2", "")}),
        sample("group2", 2, {make_verdict(verdict_kind::PASS, "t1", ""), make_verdict(verdict_kind::TIMEOUT, "t2", "")}),
        sample("late", nullopt, {make_verdict(verdict_kind::BUILD_FAILURE, "", "")})};

    ostringstream out;
    print_summary(out, results);
    EXPECT_EQ(out.str(),
              "3 groups graded, 1 passed every test; 3/5 verdicts passed\n"
              "    Build Failure: 1\n"
              "    Timeout: 1\n");
}

TEST(ReportTest, ExportResultsTest) {
    temp_directory dir;
    verdict v = make_verdict(verdict_kind::RUNTIME_FAILURE, "equal #", "exited with code 1", "trace");
    export_results(dir.path / "results.json", {sample("group4", 4, {v}), sample("extra", nullopt, {})});

    json j = json::parse(read_file_content(dir.path / "results.json"));
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["group"].get<string>(), "group4");
    EXPECT_EQ(j[0]["number"], 4);
    EXPECT_EQ(j[0]["verdicts"][0]["verdict"].get<string>(), "Runtime Failure");
    EXPECT_EQ(j[0]["verdicts"][0]["test"].get<string>(), "equal #");
    EXPECT_EQ(j[0]["verdicts"][0]["detail"].get<string>(), "trace");
    EXPECT_TRUE(j[1]["number"].is_null());
    EXPECT_TRUE(j[1]["verdicts"].empty());
}

TEST(ReportTest, ExportToMissingDirectoryTest) {
    temp_directory dir;
    EXPECT_THROW(export_results(dir.path / "missing" / "results.json", {}), configuration_error);
}
