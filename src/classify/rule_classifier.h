#pragma once
#ifndef TESTFORGE_RULE_CLASSIFIER_H
#define TESTFORGE_RULE_CLASSIFIER_H

#include <regex>
#include <string>
#include <vector>
#include "classify/classification.h"
#include "runner/test_report.h"

namespace testforge {

struct RuleSignature {
    std::string pattern;        // case-insensitive, matched per line
    std::string description;
};

// Deterministic first stage: ordered signature table, first match wins
class RuleClassifier {
public:
    RuleClassifier();
    RuleClassifier(const std::vector<RuleSignature>& test_mistakes,
                   const std::vector<RuleSignature>& code_defects);

    ClassificationResult classify(const TestFailure& failure) const;

    static const std::vector<RuleSignature>& default_test_mistakes();
    static const std::vector<RuleSignature>& default_code_defects();

    static constexpr double kRuleConfidence = 0.9;
    static constexpr double kHeuristicConfidence = 0.6;

private:
    struct CompiledRule {
        std::regex pattern;
        std::string description;
    };

    static std::vector<CompiledRule> compile(const std::vector<RuleSignature>& rules);
    bool raised_in_test_file(const TestFailure& failure) const;

    std::vector<CompiledRule> test_mistakes_;
    std::vector<CompiledRule> code_defects_;
};

}  // namespace testforge

#endif  // TESTFORGE_RULE_CLASSIFIER_H
