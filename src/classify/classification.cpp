#include "classify/classification.h"
#include "model/response_parser.h"
#include <algorithm>
#include <cctype>

namespace testforge {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

double read_confidence(const Json::Value& value) {
    if (!value.isNumeric()) return 0.5;
    return std::clamp(value.asDouble(), 0.0, 1.0);
}

}  // namespace

std::string to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::TestMistake: return "test_mistake";
        case FailureKind::CodeDefect: return "code_defect";
        case FailureKind::Unknown: return "unknown";
    }
    return "unknown";
}

std::string to_string(Stage stage) {
    return stage == Stage::Rule ? "rule" : "model";
}

Verdict parse_verdict(const std::string& response) {
    auto json = extract_json_object(response);
    if (!json) {
        return UnknownVerdict{"model response contained no JSON object"};
    }

    const Json::Value& classification = (*json)["classification"];
    const Json::Value& reason = (*json)["reason"];
    if (!classification.isString()) {
        return UnknownVerdict{"model verdict has no classification"};
    }
    if (!reason.isString() || reason.asString().empty()) {
        return UnknownVerdict{"model verdict has no reason"};
    }

    std::string kind = lower(classification.asString());
    double confidence = read_confidence((*json)["confidence"]);

    if (kind == "test_mistake") {
        TestMistakeVerdict verdict{reason.asString(), std::nullopt, confidence};
        const Json::Value& fixed = (*json)["fixed_code"];
        if (fixed.isString() && !fixed.asString().empty()) {
            std::string code = fixed.asString();
            verdict.fix = code.find("```") != std::string::npos ? extract_code_block(code) : code;
        }
        return verdict;
    }
    if (kind == "code_defect" || kind == "code_bug") {
        return CodeDefectVerdict{reason.asString(), confidence};
    }
    if (kind == "unknown") {
        return UnknownVerdict{reason.asString()};
    }
    return UnknownVerdict{"unrecognised classification '" + classification.asString() + "'"};
}

ClassificationResult to_result(const Verdict& verdict, Stage stage) {
    ClassificationResult result;
    result.stage = stage;
    std::visit(overloaded{
        [&](const TestMistakeVerdict& v) {
            result.kind = FailureKind::TestMistake;
            result.reason = v.reason;
            result.confidence = v.confidence;
            result.suggested_fix = v.fix;
        },
        [&](const CodeDefectVerdict& v) {
            result.kind = FailureKind::CodeDefect;
            result.reason = v.reason;
            result.confidence = v.confidence;
        },
        [&](const UnknownVerdict& v) {
            result.kind = FailureKind::Unknown;
            result.reason = v.reason;
        },
    }, verdict);
    return result;
}

}  // namespace testforge
