#include "fix/fix_requester.h"
#include "core/errors.h"
#include "model/response_parser.h"
#include <spdlog/spdlog.h>

namespace testforge {

const char* FixRequester::system_prompt() {
    return
        "You repair failing Python tests. The program under test is correct; only the\n"
        "test may change. Return the complete corrected test function, including its\n"
        "decorators and any import lines it needs inside its body, in one ```python\n"
        "block. Do not return other functions and do not change what the test checks.";
}

FixRequester::FixRequester(ModelClient& client, size_t max_context_bytes)
    : client_(client), max_context_bytes_(max_context_bytes) {}

std::string FixRequester::build_prompt(const TestFailure& failure, const std::string& test_code,
                                       const ContextBundle& context,
                                       const std::optional<FixAttempt>& previous) const {
    std::string prompt = "## Failure\n" + format_failure(failure);
    prompt += "\n## Failing test\n```python\n" + test_code;
    if (!test_code.empty() && test_code.back() != '\n') prompt += "\n";
    prompt += "```\n";
    if (!context.empty()) {
        prompt += "\n## Source under test\n" + context.render(max_context_bytes_);
    }
    if (previous) {
        prompt += "\n## Previous attempt (rejected)\n```python\n" + previous->code;
        if (!previous->code.empty() && previous->code.back() != '\n') prompt += "\n";
        prompt += "```\nRejected because: " + previous->feedback + "\n";
    }
    return prompt;
}

std::optional<std::string> FixRequester::request_fix(const TestFailure& failure, const std::string& test_code,
                                                     const ContextBundle& context,
                                                     const std::optional<FixAttempt>& previous) const {
    std::string response;
    try {
        response = client_.complete(system_prompt(), build_prompt(failure, test_code, context, previous));
    } catch (const ModelError& e) {
        spdlog::warn("Fix request for {} failed: {}", failure.node_id, e.what());
        return std::nullopt;
    }

    std::string code = extract_code_block(response);
    if (code.find("def ") == std::string::npos) {
        spdlog::warn("Fix response for {} holds no function definition", failure.node_id);
        return std::nullopt;
    }
    return code;
}

}  // namespace testforge
