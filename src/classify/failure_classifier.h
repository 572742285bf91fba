#pragma once
#ifndef TESTFORGE_FAILURE_CLASSIFIER_H
#define TESTFORGE_FAILURE_CLASSIFIER_H

#include <string>
#include "classify/model_classifier.h"
#include "classify/rule_classifier.h"

namespace testforge {

// received -> rule-checked -> (done | model-checked) -> done
class FailureClassifier {
public:
    // `model` may be null, which leaves rule-stage unknowns unknown
    FailureClassifier(const RuleClassifier& rules, const ModelClassifier* model);

    ClassificationResult classify(const TestFailure& failure, const std::string& test_code,
                                  const ContextBundle& context) const;

private:
    const RuleClassifier& rules_;
    const ModelClassifier* model_;
};

}  // namespace testforge

#endif  // TESTFORGE_FAILURE_CLASSIFIER_H
