#pragma once
#ifndef TESTFORGE_CLASSIFICATION_H
#define TESTFORGE_CLASSIFICATION_H

#include <optional>
#include <string>
#include <variant>

namespace testforge {

enum class FailureKind {
    TestMistake,
    CodeDefect,
    Unknown,
};

enum class Stage {
    Rule,
    Model,
};

std::string to_string(FailureKind kind);
std::string to_string(Stage stage);

struct ClassificationResult {
    FailureKind kind = FailureKind::Unknown;
    std::string reason;
    double confidence = 0.0;        // [0, 1]
    std::optional<std::string> suggested_fix;
    Stage stage = Stage::Rule;
};

// Model verdicts, validated as soon as the response arrives
struct TestMistakeVerdict {
    std::string reason;
    std::optional<std::string> fix;
    double confidence = 0.0;
};

struct CodeDefectVerdict {
    std::string reason;
    double confidence = 0.0;
};

struct UnknownVerdict {
    std::string reason;
};

using Verdict = std::variant<TestMistakeVerdict, CodeDefectVerdict, UnknownVerdict>;

// Never throws: anything short of a well-formed verdict becomes UnknownVerdict
Verdict parse_verdict(const std::string& response);

ClassificationResult to_result(const Verdict& verdict, Stage stage);

}  // namespace testforge

#endif  // TESTFORGE_CLASSIFICATION_H
