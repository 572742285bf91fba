#include "classify/model_classifier.h"
#include "core/errors.h"
#include <spdlog/spdlog.h>

namespace testforge {

const char* ModelClassifier::system_prompt() {
    return
        "You analyse failing Python tests and decide whether the failure is a\n"
        "test_mistake (wrong import, bad fixture, misconfigured mock, stale assertion,\n"
        "wrong call signature in the test) or a code_defect (the program under test\n"
        "behaves wrongly).\n"
        "Answer with one JSON object and nothing else:\n"
        "{\"classification\": \"test_mistake\" | \"code_defect\",\n"
        " \"reason\": \"<one sentence>\",\n"
        " \"fixed_code\": \"<complete corrected test function with its decorators, only for test_mistake>\",\n"
        " \"confidence\": <number between 0 and 1>}\n"
        "When unsure, answer code_defect so that no test is changed.";
}

ModelClassifier::ModelClassifier(ModelClient& client, size_t max_context_bytes)
    : client_(client), max_context_bytes_(max_context_bytes) {}

std::string ModelClassifier::build_prompt(const TestFailure& failure, const std::string& test_code,
                                          const ContextBundle& context) const {
    std::string prompt = "## Failure\n" + format_failure(failure);
    prompt += "\n## Failing test\n```python\n" + test_code;
    if (!test_code.empty() && test_code.back() != '\n') prompt += "\n";
    prompt += "```\n";
    if (!context.empty()) {
        prompt += "\n## Source under test\n" + context.render(max_context_bytes_);
    }
    if (!context.unresolved.empty()) {
        prompt += "\n## Imports with no source available\n";
        for (const auto& module : context.unresolved) {
            prompt += "- " + module + "\n";
        }
    }
    return prompt;
}

ClassificationResult ModelClassifier::classify(const TestFailure& failure, const std::string& test_code,
                                               const ContextBundle& context) const {
    std::string response;
    try {
        response = client_.complete(system_prompt(), build_prompt(failure, test_code, context));
    } catch (const ModelError& e) {
        spdlog::warn("Model classification of {} failed: {}", failure.node_id, e.what());
        ClassificationResult result;
        result.stage = Stage::Model;
        result.reason = std::string("model call failed: ") + e.what();
        return result;
    }

    ClassificationResult result = to_result(parse_verdict(response), Stage::Model);
    spdlog::info("Model classified {} as {} ({:.2f}): {}", failure.node_id, to_string(result.kind),
                 result.confidence, result.reason);
    return result;
}

}  // namespace testforge
