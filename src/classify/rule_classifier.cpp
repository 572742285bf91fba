#include "classify/rule_classifier.h"
#include <spdlog/spdlog.h>
#include <set>
#include <sstream>

namespace testforge {

namespace {

constexpr size_t kMaxLineLength = 400;
constexpr size_t kTraceTailLines = 10;

// Kind and message first, then the trace, one line at a time
std::vector<std::string> evidence_lines(const TestFailure& failure) {
    std::vector<std::string> lines;
    std::string summary = failure.exception_kind + ": " + failure.message;
    if (summary.size() > kMaxLineLength) summary.resize(kMaxLineLength);
    lines.push_back(std::move(summary));
    std::istringstream in(failure.raw_trace);
    std::string line;
    while (std::getline(in, line)) {
        if (line.size() > kMaxLineLength) line.resize(kMaxLineLength);
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

const std::vector<RuleSignature>& RuleClassifier::default_test_mistakes() {
    static const std::vector<RuleSignature> rules = {
        {R"(ModuleNotFoundError|ImportError)", "Missing import in test"},
        {R"(cannot import name)", "Wrong import in test"},
        {R"(fixture '?[\w.]+'? not found|fixture .* doesn't exist)", "Missing or misspelled fixture"},
        {R"(AttributeError.*\b(Magic)?Mock\b|Mock object has no attribute)", "Incorrect mock usage"},
        {R"(\bassert None\b|Expected '[^']+' to (have been|be) called|expected call not found)",
         "Assertion on an unconfigured mock"},
        {R"(IndentationError|SyntaxError)", "Syntax or indentation error in test"},
        {R"(cannot be called from a running event loop|event loop is already running|was never awaited)",
         "Async handling mismatch in test"},
        {R"(NameError.*name .* is not defined)", "Undefined name in test"},
        {R"(TypeError.*takes \d+ positional arguments? but)", "Wrong number of arguments in test"},
        {R"(TypeError.*missing \d+ required (positional|keyword-only) arguments?)", "Missing arguments in test"},
        {R"(TypeError.*got an unexpected keyword argument)", "Wrong keyword argument in test"},
        {R"((Database|Operational|Programming)Error.*no such table)", "Database not set up in test"},
        {R"(FileNotFoundError)", "Missing test data file"},
        {R"(JSONDecodeError)", "Invalid JSON in test data"},
        {R"(No route matches|404.*Not Found)", "Wrong route in test request"},
    };
    return rules;
}

const std::vector<RuleSignature>& RuleClassifier::default_code_defects() {
    static const std::vector<RuleSignature> rules = {
        {R"(ZeroDivisionError)", "Possible program defect: division by zero"},
        {R"(ValueError.*invalid literal)", "Possible program defect: invalid value"},
        {R"(IndexError.*out of range)", "Possible program defect: index out of range"},
        {R"(RecursionError)", "Possible program defect: unbounded recursion"},
    };
    return rules;
}

RuleClassifier::RuleClassifier()
    : RuleClassifier(default_test_mistakes(), default_code_defects()) {}

RuleClassifier::RuleClassifier(const std::vector<RuleSignature>& test_mistakes,
                               const std::vector<RuleSignature>& code_defects)
    : test_mistakes_(compile(test_mistakes)), code_defects_(compile(code_defects)) {}

std::vector<RuleClassifier::CompiledRule> RuleClassifier::compile(const std::vector<RuleSignature>& rules) {
    std::vector<CompiledRule> compiled;
    compiled.reserve(rules.size());
    for (const auto& rule : rules) {
        compiled.push_back({std::regex(rule.pattern, std::regex::ECMAScript | std::regex::icase),
                            rule.description});
    }
    return compiled;
}

bool RuleClassifier::raised_in_test_file(const TestFailure& failure) const {
    if (failure.test_file.empty()) return false;
    std::vector<std::string> lines;
    std::istringstream in(failure.raw_trace);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    size_t from = lines.size() > kTraceTailLines ? lines.size() - kTraceTailLines : 0;
    for (size_t i = from; i < lines.size(); ++i) {
        if (lines[i].find(failure.test_file) != std::string::npos) return true;
    }
    return false;
}

ClassificationResult RuleClassifier::classify(const TestFailure& failure) const {
    const auto lines = evidence_lines(failure);
    auto first_match = [&lines](const std::vector<CompiledRule>& rules) -> const CompiledRule* {
        for (const auto& rule : rules) {
            for (const auto& line : lines) {
                if (std::regex_search(line, rule.pattern)) return &rule;
            }
        }
        return nullptr;
    };

    ClassificationResult result;
    result.stage = Stage::Rule;

    if (const CompiledRule* rule = first_match(test_mistakes_)) {
        result.kind = FailureKind::TestMistake;
        result.reason = rule->description;
        result.confidence = kRuleConfidence;
        return result;
    }
    if (const CompiledRule* rule = first_match(code_defects_)) {
        result.reason = rule->description;
        return result;
    }

    static const std::set<std::string> kTestSideKinds = {
        "AttributeError", "TypeError", "NameError", "ImportError",
    };
    if (kTestSideKinds.count(failure.exception_kind) && raised_in_test_file(failure)) {
        result.kind = FailureKind::TestMistake;
        result.reason = failure.exception_kind + " raised inside the test file";
        result.confidence = kHeuristicConfidence;
        return result;
    }

    result.reason = "no rule matched";
    spdlog::debug("No rule matched {}", failure.node_id);
    return result;
}

}  // namespace testforge
