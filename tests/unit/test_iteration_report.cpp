#include <gtest/gtest.h>
#include "core/errors.h"
#include "report/generation_report.h"
#include "report/iteration_report.h"
#include "support/temp_project.h"
#include <algorithm>
#include <sstream>

using namespace testforge;
using testforge::fakes::TempProject;

namespace {

FixRecord make_record(const std::string& name, FailureKind kind, bool fixed,
                      const std::string& reason = "r") {
    FixRecord record;
    record.node_id = "tests/test_a.py::" + name;
    record.test_file = "tests/test_a.py";
    record.test_name = name;
    record.classification.kind = kind;
    record.classification.reason = reason;
    record.fix_attempted = kind == FailureKind::TestMistake;
    record.fix_successful = fixed;
    record.outcome = fixed ? "fixed" : "fix_failed";
    return record;
}

bool has_line(const std::vector<std::string>& lines, const std::string& text) {
    return std::find(lines.begin(), lines.end(), text) != lines.end();
}

}  // namespace

TEST(IterationReportTest, test_round_counts_successes) {
    IterationReport report;
    EXPECT_EQ(report.begin_round(), 1);
    report.record(make_record("test_a", FailureKind::TestMistake, true));
    report.record(make_record("test_b", FailureKind::CodeDefect, false));
    EXPECT_EQ(report.finish_round(), 1u);

    EXPECT_EQ(report.begin_round(), 2);
    report.record(make_record("test_b", FailureKind::CodeDefect, false));
    EXPECT_EQ(report.finish_round(), 0u);

    EXPECT_EQ(report.iterations(), 2);
    EXPECT_EQ(report.fix_history().size(), 3u);
    EXPECT_EQ(report.fix_history()[2].iteration, 2);
}

TEST(IterationReportTest, test_counts_use_latest_record_per_test) {
    IterationReport report;
    report.begin_round();
    report.record(make_record("test_a", FailureKind::TestMistake, false));
    report.record(make_record("test_b", FailureKind::Unknown, false));
    report.finish_round();
    report.begin_round();
    report.record(make_record("test_a", FailureKind::TestMistake, true));
    report.finish_round();

    EXPECT_EQ(report.total_failures(), 2u);
    EXPECT_EQ(report.test_mistakes(), 1u);
    EXPECT_EQ(report.undetermined(), 1u);
    EXPECT_EQ(report.code_defects(), 0u);
    EXPECT_EQ(report.successful_fixes(), 1u);
    EXPECT_EQ(report.failed_fixes(), 0u);
}

TEST(IterationReportTest, test_json_fields) {
    IterationReport report;
    report.begin_round();
    auto record = make_record("test_a", FailureKind::TestMistake, true);
    PatchOutcome patch;
    patch.target = "test_a";
    patch.file = "tests/test_a.py";
    patch.applied = patch.validated = true;
    record.patches.push_back(patch);
    record.attempts = 1;
    report.record(record);
    report.record(make_record("test_b", FailureKind::CodeDefect, false, "wrong total"));
    report.finish_round();

    Json::Value json = report.to_json();
    EXPECT_EQ(json["iterations"].asInt(), 1);
    EXPECT_EQ(json["total_failures"].asUInt64(), 2u);
    EXPECT_EQ(json["successful_fixes"].asUInt64(), 1u);
    EXPECT_TRUE(json["aborted_reason"].isNull());
    ASSERT_EQ(json["fix_history"].size(), 2u);
    EXPECT_EQ(json["fix_history"][0]["classification"].asString(), "test_mistake");
    EXPECT_TRUE(json["fix_history"][0]["patches"][0]["validated"].asBool());
    ASSERT_EQ(json["code_defects_list"].size(), 1u);
    EXPECT_EQ(json["code_defects_list"][0]["reason"].asString(), "wrong total");
    EXPECT_EQ(json["undetermined_list"].size(), 0u);
}

TEST(IterationReportTest, test_write_and_reread) {
    TempProject project("report_write");
    IterationReport report;
    report.begin_round();
    report.set_aborted("no tests collected");
    report.write(project.path("out/report.json"));

    Json::CharReaderBuilder builder;
    Json::Value value;
    std::string errors;
    std::istringstream in(project.read("out/report.json"));
    ASSERT_TRUE(Json::parseFromStream(builder, in, &value, &errors)) << errors;
    EXPECT_EQ(value["aborted_reason"].asString(), "no tests collected");
}

TEST(IterationReportTest, test_write_failure_throws_report_error) {
    TempProject project("report_fail");
    project.write("blocker", "a file, not a directory\n");
    IterationReport report;
    EXPECT_THROW(report.write(project.path("blocker/report.json")), ReportError);
}

TEST(IterationReportTest, test_summary_lists_categories_separately) {
    IterationReport report;
    report.begin_round();
    report.record(make_record("test_a", FailureKind::TestMistake, true));
    report.record(make_record("test_b", FailureKind::CodeDefect, false, "wrong total"));
    report.record(make_record("test_c", FailureKind::Unknown, false, "no rule matched"));
    report.record(make_record("test_d", FailureKind::TestMistake, false, "Undefined name in test"));
    report.finish_round();

    auto lines = report.summary_lines();
    EXPECT_TRUE(has_line(lines, "Fixed automatically: 1"));
    EXPECT_TRUE(has_line(lines, "  tests/test_a.py::test_a"));
    EXPECT_TRUE(has_line(lines, "Left as code defect (needs human review): 1"));
    EXPECT_TRUE(has_line(lines, "  tests/test_a.py::test_b - wrong total"));
    EXPECT_TRUE(has_line(lines, "Could not determine: 1"));
    EXPECT_TRUE(has_line(lines, "Test mistakes left unfixed: 1"));
    EXPECT_FALSE(has_line(lines, "Aborted: "));
}

TEST(GenerationReportTest, test_json_lists_generated_files) {
    GenerationReport report;
    report.initial_coverage = 60.0;
    report.final_coverage = 80.0;
    report.stopped_reason = "coverage target reached";
    GenerationIteration pass;
    pass.iteration = 1;
    pass.coverage_before = 60.0;
    pass.gap_count = 3;
    pass.target_count = 2;
    pass.files.push_back({GenerationKind::Unit, 0, "tests/generated/test_unit_a_00.py", 2});
    report.iterations.push_back(pass);

    EXPECT_EQ(report.generated_files(), (std::vector<std::string>{"tests/generated/test_unit_a_00.py"}));
    Json::Value json = report.to_json();
    EXPECT_DOUBLE_EQ(json["final_coverage"].asDouble(), 80.0);
    EXPECT_EQ(json["iterations"][0]["files"][0]["kind"].asString(), "unit");
    EXPECT_EQ(json["generated_files"].size(), 1u);
}
