#pragma once
#ifndef TESTFORGE_MODEL_CLASSIFIER_H
#define TESTFORGE_MODEL_CLASSIFIER_H

#include <string>
#include "classify/classification.h"
#include "context/context_bundle.h"
#include "model/model_client.h"
#include "runner/test_report.h"

namespace testforge {

// Second stage: asks the model for {classification, reason, fixed_code?, confidence}
class ModelClassifier {
public:
    ModelClassifier(ModelClient& client, size_t max_context_bytes);

    // Transport errors and malformed responses come back as Unknown
    ClassificationResult classify(const TestFailure& failure, const std::string& test_code,
                                  const ContextBundle& context) const;

    std::string build_prompt(const TestFailure& failure, const std::string& test_code,
                             const ContextBundle& context) const;

    static const char* system_prompt();

private:
    ModelClient& client_;
    size_t max_context_bytes_;
};

}  // namespace testforge

#endif  // TESTFORGE_MODEL_CLASSIFIER_H
