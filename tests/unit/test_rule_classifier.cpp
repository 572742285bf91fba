#include <gtest/gtest.h>
#include "classify/rule_classifier.h"

using namespace testforge;

namespace {

TestFailure make(const std::string& kind, const std::string& message, const std::string& trace = "",
                 const std::string& file = "tests/test_app.py") {
    TestFailure f;
    f.node_id = file + "::test_case";
    f.test_file = file;
    f.test_name = "test_case";
    f.exception_kind = kind;
    f.message = message;
    f.raw_trace = trace;
    return f;
}

}  // namespace

TEST(RuleClassifierTest, test_name_error_is_test_mistake) {
    RuleClassifier rules;
    auto result = rules.classify(make("NameError", "name 'User' is not defined"));
    EXPECT_EQ(result.kind, FailureKind::TestMistake);
    EXPECT_EQ(result.reason, "Undefined name in test");
    EXPECT_DOUBLE_EQ(result.confidence, RuleClassifier::kRuleConfidence);
    EXPECT_EQ(result.stage, Stage::Rule);
    EXPECT_FALSE(result.suggested_fix.has_value());
}

TEST(RuleClassifierTest, test_import_errors) {
    RuleClassifier rules;
    EXPECT_EQ(rules.classify(make("ModuleNotFoundError", "No module named 'app.x'")).kind,
              FailureKind::TestMistake);
    EXPECT_EQ(rules.classify(make("Unknown", "", "E   ImportError: cannot import name 'Foo'")).kind,
              FailureKind::TestMistake);
}

TEST(RuleClassifierTest, test_missing_fixture) {
    RuleClassifier rules;
    auto result = rules.classify(make("Unknown", "fixture 'db_session' not found"));
    EXPECT_EQ(result.kind, FailureKind::TestMistake);
    EXPECT_EQ(result.reason, "Missing or misspelled fixture");
}

TEST(RuleClassifierTest, test_mock_misuse) {
    RuleClassifier rules;
    auto result = rules.classify(make("AttributeError", "Mock object has no attribute 'sendd'"));
    EXPECT_EQ(result.kind, FailureKind::TestMistake);
    EXPECT_EQ(result.reason, "Incorrect mock usage");
}

TEST(RuleClassifierTest, test_signature_mismatch) {
    RuleClassifier rules;
    EXPECT_EQ(rules.classify(make("TypeError", "create() missing 1 required positional argument: 'name'")).reason,
              "Missing arguments in test");
    EXPECT_EQ(rules.classify(make("TypeError", "f() got an unexpected keyword argument 'x'")).reason,
              "Wrong keyword argument in test");
    EXPECT_EQ(rules.classify(make("TypeError", "f() takes 2 positional arguments but 3 were given")).reason,
              "Wrong number of arguments in test");
}

TEST(RuleClassifierTest, test_case_insensitive) {
    RuleClassifier rules;
    EXPECT_EQ(rules.classify(make("Unknown", "", "syntaxerror: invalid syntax")).kind,
              FailureKind::TestMistake);
}

TEST(RuleClassifierTest, test_code_defect_hint_stays_unknown) {
    RuleClassifier rules;
    auto result = rules.classify(make("ZeroDivisionError", "division by zero",
                                      "app/calc.py:10: ZeroDivisionError"));
    EXPECT_EQ(result.kind, FailureKind::Unknown);
    EXPECT_EQ(result.reason, "Possible program defect: division by zero");
}

TEST(RuleClassifierTest, test_test_side_error_in_test_file) {
    RuleClassifier rules;
    auto result = rules.classify(make("AttributeError", "'Cart' object has no attribute 'totl'",
                                      ">   cart.totl()\ntests/test_app.py:14: AttributeError"));
    EXPECT_EQ(result.kind, FailureKind::TestMistake);
    EXPECT_DOUBLE_EQ(result.confidence, RuleClassifier::kHeuristicConfidence);
}

TEST(RuleClassifierTest, test_test_file_outside_trace_tail_ignored) {
    RuleClassifier rules;
    std::string trace = "tests/test_app.py:3: in test_case\n";
    for (int i = 0; i < 12; ++i) trace += "app/core.py:" + std::to_string(40 + i) + ": in step\n";
    auto result = rules.classify(make("AttributeError", "'Cart' object has no attribute 'totl'", trace));
    EXPECT_EQ(result.kind, FailureKind::Unknown);
}

TEST(RuleClassifierTest, test_plain_assertion_unmatched) {
    RuleClassifier rules;
    auto result = rules.classify(make("AssertionError", "assert 3 == 4", "app/calc.py:7"));
    EXPECT_EQ(result.kind, FailureKind::Unknown);
    EXPECT_EQ(result.reason, "no rule matched");
}

TEST(RuleClassifierTest, test_first_matching_rule_wins) {
    RuleClassifier rules({{"alpha", "first"}, {"alpha|beta", "second"}}, {});
    EXPECT_EQ(rules.classify(make("Unknown", "beta then alpha")).reason, "first");
    EXPECT_EQ(rules.classify(make("Unknown", "only beta")).reason, "second");
}

TEST(RuleClassifierTest, test_classification_is_deterministic) {
    RuleClassifier rules;
    auto failure = make("TypeError", "f() got an unexpected keyword argument 'x'", "trace\nlines");
    auto first = rules.classify(failure);
    for (int i = 0; i < 5; ++i) {
        auto again = rules.classify(failure);
        EXPECT_EQ(again.kind, first.kind);
        EXPECT_EQ(again.reason, first.reason);
        EXPECT_DOUBLE_EQ(again.confidence, first.confidence);
    }
}

TEST(RuleClassifierTest, test_long_trace_lines_do_not_break_matching) {
    RuleClassifier rules;
    std::string trace(20000, 'x');
    trace += "\nE   NameError: name 'thing' is not defined\n";
    auto result = rules.classify(make("Unknown", "", trace));
    EXPECT_EQ(result.kind, FailureKind::TestMistake);
}

TEST(RuleClassifierTest, test_huge_exception_message_is_bounded) {
    RuleClassifier rules;
    std::string message = "name 'thing' is not defined " + std::string(100000, 'x');
    auto result = rules.classify(make("NameError", message, "E   NameError: " + message));
    EXPECT_EQ(result.kind, FailureKind::TestMistake);
    EXPECT_EQ(result.reason, "Undefined name in test");

    auto unmatched = rules.classify(make("ValueError", std::string(100000, 'z')));
    EXPECT_EQ(unmatched.kind, FailureKind::Unknown);
}
