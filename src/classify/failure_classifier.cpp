#include "classify/failure_classifier.h"
#include <spdlog/spdlog.h>

namespace testforge {

FailureClassifier::FailureClassifier(const RuleClassifier& rules, const ModelClassifier* model)
    : rules_(rules), model_(model) {}

ClassificationResult FailureClassifier::classify(const TestFailure& failure, const std::string& test_code,
                                                 const ContextBundle& context) const {
    ClassificationResult result = rules_.classify(failure);
    if (result.kind != FailureKind::Unknown) {
        spdlog::info("Rule stage: {} is a {} ({})", failure.node_id, to_string(result.kind), result.reason);
        return result;
    }
    if (!model_) {
        result.reason += " (model stage disabled)";
        return result;
    }

    ClassificationResult model_result = model_->classify(failure, test_code, context);
    if (model_result.kind == FailureKind::Unknown && !result.reason.empty()) {
        model_result.reason = result.reason + "; " + model_result.reason;
    }
    return model_result;
}

}  // namespace testforge
