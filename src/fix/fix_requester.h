#pragma once
#ifndef TESTFORGE_FIX_REQUESTER_H
#define TESTFORGE_FIX_REQUESTER_H

#include <optional>
#include <string>
#include "context/context_bundle.h"
#include "model/model_client.h"
#include "runner/test_report.h"

namespace testforge {

// A rejected replacement and why it was rejected
struct FixAttempt {
    std::string code;
    std::string feedback;
};

// Asks the model for a complete replacement of one failing test
class FixRequester {
public:
    FixRequester(ModelClient& client, size_t max_context_bytes);

    // nullopt when the model fails or returns no usable code
    std::optional<std::string> request_fix(const TestFailure& failure, const std::string& test_code,
                                           const ContextBundle& context,
                                           const std::optional<FixAttempt>& previous = std::nullopt) const;

    std::string build_prompt(const TestFailure& failure, const std::string& test_code,
                             const ContextBundle& context,
                             const std::optional<FixAttempt>& previous) const;

    static const char* system_prompt();

private:
    ModelClient& client_;
    size_t max_context_bytes_;
};

}  // namespace testforge

#endif  // TESTFORGE_FIX_REQUESTER_H
