#include <gtest/gtest.h>
#include "classify/failure_classifier.h"
#include "classify/model_classifier.h"
#include "classify/rule_classifier.h"
#include "fix/fix_requester.h"
#include "support/fakes.h"

using namespace testforge;
using testforge::fakes::ScriptedModelClient;

namespace {

TestFailure assertion_failure() {
    TestFailure f;
    f.node_id = "tests/test_cart.py::test_total";
    f.test_file = "tests/test_cart.py";
    f.test_name = "test_total";
    f.exception_kind = "AssertionError";
    f.message = "assert 30 == 35";
    f.raw_trace = "E   assert 30 == 35\ntests/test_cart.py:9: AssertionError";
    return f;
}

const char* kTestCode = "def test_total():\n    assert total([10, 20]) == 35\n";

}  // namespace

TEST(ModelClassifierTest, test_prompt_carries_failure_test_and_context) {
    ScriptedModelClient client;
    ModelClassifier classifier(client, 10000);
    ContextBundle context;
    context.files["app/cart.py"] = "def total(items):\n    return sum(items)\n";
    context.unresolved.push_back("app.pricing");

    std::string prompt = classifier.build_prompt(assertion_failure(), kTestCode, context);
    EXPECT_NE(prompt.find("tests/test_cart.py::test_total"), std::string::npos);
    EXPECT_NE(prompt.find("assert total([10, 20]) == 35"), std::string::npos);
    EXPECT_NE(prompt.find("# FILE: app/cart.py"), std::string::npos);
    EXPECT_NE(prompt.find("- app.pricing"), std::string::npos);
}

TEST(ModelClassifierTest, test_code_defect_verdict) {
    ScriptedModelClient client;
    client.reply(R"({"classification": "code_defect", "reason": "total ignores tax", "confidence": 0.85})");
    ModelClassifier classifier(client, 10000);

    auto result = classifier.classify(assertion_failure(), kTestCode, ContextBundle{});
    EXPECT_EQ(result.kind, FailureKind::CodeDefect);
    EXPECT_EQ(result.stage, Stage::Model);
    EXPECT_DOUBLE_EQ(result.confidence, 0.85);
    ASSERT_EQ(client.prompts.size(), 1u);
    EXPECT_EQ(client.prompts[0].first, ModelClassifier::system_prompt());
}

TEST(ModelClassifierTest, test_model_failure_is_unknown) {
    ScriptedModelClient client;
    client.fail("connection refused");
    ModelClassifier classifier(client, 10000);

    auto result = classifier.classify(assertion_failure(), kTestCode, ContextBundle{});
    EXPECT_EQ(result.kind, FailureKind::Unknown);
    EXPECT_EQ(result.stage, Stage::Model);
    EXPECT_NE(result.reason.find("connection refused"), std::string::npos);
}

TEST(ModelClassifierTest, test_unparsable_reply_is_unknown) {
    ScriptedModelClient client;
    client.reply("I am not sure what happened here.");
    ModelClassifier classifier(client, 10000);
    EXPECT_EQ(classifier.classify(assertion_failure(), kTestCode, ContextBundle{}).kind,
              FailureKind::Unknown);
}

TEST(FailureClassifierTest, test_rule_match_skips_model) {
    ScriptedModelClient client;
    RuleClassifier rules;
    ModelClassifier model(client, 10000);
    FailureClassifier classifier(rules, &model);

    TestFailure f = assertion_failure();
    f.exception_kind = "NameError";
    f.message = "name 'total' is not defined";
    auto result = classifier.classify(f, kTestCode, ContextBundle{});
    EXPECT_EQ(result.kind, FailureKind::TestMistake);
    EXPECT_EQ(result.stage, Stage::Rule);
    EXPECT_TRUE(client.prompts.empty());
}

TEST(FailureClassifierTest, test_unmatched_failure_goes_to_model) {
    ScriptedModelClient client;
    client.reply("```json\n{\"classification\": \"test_mistake\", \"reason\": \"wrong expectation\","
                 " \"fixed_code\": \"def test_total():\\n    assert total([10, 20]) == 30\\n\"}\n```");
    RuleClassifier rules;
    ModelClassifier model(client, 10000);
    FailureClassifier classifier(rules, &model);

    auto result = classifier.classify(assertion_failure(), kTestCode, ContextBundle{});
    EXPECT_EQ(result.kind, FailureKind::TestMistake);
    EXPECT_EQ(result.stage, Stage::Model);
    ASSERT_TRUE(result.suggested_fix.has_value());
    EXPECT_NE(result.suggested_fix->find("== 30"), std::string::npos);
}

TEST(FailureClassifierTest, test_model_unknown_keeps_rule_reason) {
    ScriptedModelClient client;
    client.fail("timeout");
    RuleClassifier rules;
    ModelClassifier model(client, 10000);
    FailureClassifier classifier(rules, &model);

    auto result = classifier.classify(assertion_failure(), kTestCode, ContextBundle{});
    EXPECT_EQ(result.kind, FailureKind::Unknown);
    EXPECT_EQ(result.reason.rfind("no rule matched; ", 0), 0u);
}

TEST(FailureClassifierTest, test_without_model_stage) {
    RuleClassifier rules;
    FailureClassifier classifier(rules, nullptr);
    auto result = classifier.classify(assertion_failure(), kTestCode, ContextBundle{});
    EXPECT_EQ(result.kind, FailureKind::Unknown);
    EXPECT_EQ(result.reason, "no rule matched (model stage disabled)");
}

TEST(FixRequesterTest, test_returns_code_block) {
    ScriptedModelClient client;
    client.reply("Sure:\n```python\ndef test_total():\n    assert total([10, 20]) == 30\n```\n");
    FixRequester fixer(client, 10000);

    auto fix = fixer.request_fix(assertion_failure(), kTestCode, ContextBundle{});
    ASSERT_TRUE(fix.has_value());
    EXPECT_EQ(*fix, "def test_total():\n    assert total([10, 20]) == 30\n");
    EXPECT_EQ(client.prompts[0].first, FixRequester::system_prompt());
}

TEST(FixRequesterTest, test_previous_attempt_fed_back) {
    ScriptedModelClient client;
    client.reply("```python\ndef test_total():\n    pass\n```");
    FixRequester fixer(client, 10000);

    FixAttempt previous{"def test_total():\n    assert False\n", "test still fails: assert False"};
    auto fix = fixer.request_fix(assertion_failure(), kTestCode, ContextBundle{}, previous);
    ASSERT_TRUE(fix.has_value());
    const std::string& prompt = client.prompts[0].second;
    EXPECT_NE(prompt.find("Previous attempt"), std::string::npos);
    EXPECT_NE(prompt.find("Rejected because: test still fails: assert False"), std::string::npos);
}

TEST(FixRequesterTest, test_no_function_in_reply) {
    ScriptedModelClient client;
    client.reply("I cannot fix this test.");
    client.fail("server error");
    FixRequester fixer(client, 10000);

    EXPECT_FALSE(fixer.request_fix(assertion_failure(), kTestCode, ContextBundle{}).has_value());
    EXPECT_FALSE(fixer.request_fix(assertion_failure(), kTestCode, ContextBundle{}).has_value());
}
