#include "report/iteration_report.h"
#include "core/errors.h"
#include "core/text_file.h"
#include <spdlog/spdlog.h>
#include <map>

namespace testforge {

namespace {

Json::Value patch_json(const PatchOutcome& patch) {
    Json::Value value;
    value["target"] = patch.target;
    value["file"] = patch.file;
    value["applied"] = patch.applied;
    value["validated"] = patch.validated;
    value["reason"] = patch.reason;
    return value;
}

Json::Value test_ref(const FixRecord& record) {
    Json::Value value;
    value["test_file"] = record.test_file;
    value["test_name"] = record.test_name;
    value["reason"] = record.classification.reason;
    return value;
}

}  // namespace

int IterationReport::begin_round() {
    round_start_ = history_.size();
    return ++iterations_;
}

void IterationReport::record(FixRecord record) {
    record.iteration = iterations_;
    history_.push_back(std::move(record));
}

size_t IterationReport::finish_round() {
    size_t fixed = 0;
    for (size_t i = round_start_; i < history_.size(); ++i) {
        if (history_[i].fix_successful) ++fixed;
    }
    spdlog::info("Round {} done: {} failures handled, {} fixed", iterations_,
                 history_.size() - round_start_, fixed);
    return fixed;
}

std::vector<const FixRecord*> IterationReport::latest_per_test() const {
    std::map<std::pair<std::string, std::string>, size_t> latest;
    std::vector<std::pair<std::string, std::string>> order;
    for (size_t i = 0; i < history_.size(); ++i) {
        auto key = std::make_pair(history_[i].test_file, history_[i].test_name);
        if (latest.count(key) == 0) order.push_back(key);
        latest[key] = i;
    }
    std::vector<const FixRecord*> result;
    for (const auto& key : order) {
        result.push_back(&history_[latest[key]]);
    }
    return result;
}

size_t IterationReport::total_failures() const {
    return latest_per_test().size();
}

size_t IterationReport::test_mistakes() const {
    size_t n = 0;
    for (const auto* r : latest_per_test()) {
        if (r->classification.kind == FailureKind::TestMistake) ++n;
    }
    return n;
}

size_t IterationReport::code_defects() const {
    size_t n = 0;
    for (const auto* r : latest_per_test()) {
        if (r->classification.kind == FailureKind::CodeDefect) ++n;
    }
    return n;
}

size_t IterationReport::undetermined() const {
    size_t n = 0;
    for (const auto* r : latest_per_test()) {
        if (r->classification.kind == FailureKind::Unknown) ++n;
    }
    return n;
}

size_t IterationReport::successful_fixes() const {
    size_t n = 0;
    for (const auto* r : latest_per_test()) {
        if (r->fix_successful) ++n;
    }
    return n;
}

size_t IterationReport::failed_fixes() const {
    size_t n = 0;
    for (const auto* r : latest_per_test()) {
        if (r->fix_attempted && !r->fix_successful) ++n;
    }
    return n;
}

Json::Value IterationReport::to_json() const {
    Json::Value root;
    root["iterations"] = iterations_;
    root["total_failures"] = static_cast<Json::UInt64>(total_failures());
    root["test_mistakes"] = static_cast<Json::UInt64>(test_mistakes());
    root["code_defects"] = static_cast<Json::UInt64>(code_defects());
    root["undetermined"] = static_cast<Json::UInt64>(undetermined());
    root["successful_fixes"] = static_cast<Json::UInt64>(successful_fixes());
    root["failed_fixes"] = static_cast<Json::UInt64>(failed_fixes());
    root["aborted_reason"] = aborted_reason_.empty() ? Json::Value() : Json::Value(aborted_reason_);

    Json::Value history(Json::arrayValue);
    for (const auto& record : history_) {
        Json::Value entry;
        entry["iteration"] = record.iteration;
        entry["node_id"] = record.node_id;
        entry["test_file"] = record.test_file;
        entry["test_name"] = record.test_name;
        entry["classification"] = to_string(record.classification.kind);
        entry["stage"] = to_string(record.classification.stage);
        entry["reason"] = record.classification.reason;
        entry["confidence"] = record.classification.confidence;
        entry["fix_attempted"] = record.fix_attempted;
        entry["fix_successful"] = record.fix_successful;
        entry["attempts"] = record.attempts;
        entry["outcome"] = record.outcome;
        Json::Value patches(Json::arrayValue);
        for (const auto& patch : record.patches) {
            patches.append(patch_json(patch));
        }
        entry["patches"] = patches;
        history.append(entry);
    }
    root["fix_history"] = history;

    Json::Value defects(Json::arrayValue);
    Json::Value unknown(Json::arrayValue);
    for (const auto* r : latest_per_test()) {
        if (r->classification.kind == FailureKind::CodeDefect) defects.append(test_ref(*r));
        if (r->classification.kind == FailureKind::Unknown) unknown.append(test_ref(*r));
    }
    root["code_defects_list"] = defects;
    root["undetermined_list"] = unknown;
    return root;
}

void IterationReport::write(const std::filesystem::path& path) const {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    try {
        write_text_file(path, Json::writeString(writer, to_json()) + "\n");
    } catch (const Error& e) {
        throw ReportError(std::string("cannot write report: ") + e.what());
    }
    spdlog::info("Report written to {}", path.string());
}

std::vector<std::string> IterationReport::summary_lines() const {
    std::vector<std::string> fixed;
    std::vector<std::string> defects;
    std::vector<std::string> unknown;
    std::vector<std::string> unfixed;
    for (const auto* r : latest_per_test()) {
        std::string name = r->test_file + "::" + r->test_name;
        if (r->fix_successful) {
            fixed.push_back("  " + name);
        } else if (r->classification.kind == FailureKind::CodeDefect) {
            defects.push_back("  " + name + " - " + r->classification.reason);
        } else if (r->classification.kind == FailureKind::Unknown) {
            unknown.push_back("  " + name + " - " + r->classification.reason);
        } else {
            unfixed.push_back("  " + name + " - " + r->classification.reason);
        }
    }

    std::vector<std::string> lines;
    lines.push_back("Iterations: " + std::to_string(iterations_) + ", failures: " +
                    std::to_string(total_failures()) + ", failed fixes: " + std::to_string(failed_fixes()));
    if (!aborted_reason_.empty()) {
        lines.push_back("Aborted: " + aborted_reason_);
    }
    lines.push_back("Fixed automatically: " + std::to_string(fixed.size()));
    lines.insert(lines.end(), fixed.begin(), fixed.end());
    lines.push_back("Left as code defect (needs human review): " + std::to_string(defects.size()));
    lines.insert(lines.end(), defects.begin(), defects.end());
    lines.push_back("Could not determine: " + std::to_string(unknown.size()));
    lines.insert(lines.end(), unknown.begin(), unknown.end());
    if (!unfixed.empty()) {
        lines.push_back("Test mistakes left unfixed: " + std::to_string(unfixed.size()));
        lines.insert(lines.end(), unfixed.begin(), unfixed.end());
    }
    return lines;
}

}  // namespace testforge
