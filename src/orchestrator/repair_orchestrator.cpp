#include "orchestrator/repair_orchestrator.h"
#include "core/errors.h"
#include <spdlog/spdlog.h>

namespace testforge {

RepairOrchestrator::RepairOrchestrator(const Config& config, TestRunner& runner,
                                       const ContextExtractor& extractor,
                                       const FailureClassifier& classifier, const FixRequester* fixer,
                                       const PatchEngine& patcher)
    : root_(config.project_root),
      report_path_(std::filesystem::path(config.project_root) / config.report_path),
      max_iterations_(config.max_iterations),
      fix_attempts_(config.fix_attempts),
      verify_fixes_(config.verify_fixes),
      runner_(runner),
      extractor_(extractor),
      classifier_(classifier),
      fixer_(fixer),
      patcher_(patcher) {
}

IterationReport RepairOrchestrator::run() {
    IterationReport report;

    while (report.iterations() < max_iterations_) {
        int round = report.begin_round();
        spdlog::info("Repair round {}/{}", round, max_iterations_);

        TestRunReport run;
        try {
            run = runner_.run({});
        } catch (const ReportError& e) {
            spdlog::error("Test run failed: {}", e.what());
            report.set_aborted(e.what());
            break;
        }

        RunAssessment assessment = assess_run(run);
        if (!assessment.fixable) {
            spdlog::error("Test run cannot be repaired: {}", assessment.reason);
            report.set_aborted(assessment.reason);
            break;
        }

        auto failures = extract_failures(run);
        if (failures.empty()) {
            spdlog::info("All tests pass");
            report.finish_round();
            break;
        }

        for (const auto& failure : failures) {
            report.record(handle_failure(failure));
        }
        if (report.finish_round() == 0) {
            spdlog::info("Round {} fixed nothing, stopping", round);
            break;
        }
    }

    try {
        report.write(report_path_);
    } catch (const ReportError& e) {
        spdlog::error("{}", e.what());
    }
    return report;
}

FixRecord RepairOrchestrator::handle_failure(const TestFailure& failure) {
    FixRecord record;
    record.node_id = failure.node_id;
    record.test_file = failure.test_file;
    record.test_name = failure.test_name;

    ContextBundle context = extractor_.for_failure(failure);
    std::string test_code = extractor_.test_source(failure).value_or("");
    record.classification = classifier_.classify(failure, test_code, context);

    switch (record.classification.kind) {
        case FailureKind::CodeDefect:
            record.outcome = "code_defect";
            return record;
        case FailureKind::Unknown:
            record.outcome = "undetermined";
            return record;
        case FailureKind::TestMistake:
            break;
    }

    if (test_code.empty()) {
        spdlog::warn("Cannot locate {} in {}, not fixing", failure.qualified_name(), failure.test_file);
        record.outcome = "fix_failed";
        return record;
    }
    attempt_fixes(failure, test_code, context, record);
    record.outcome = record.fix_successful ? "fixed" : "fix_failed";
    return record;
}

void RepairOrchestrator::attempt_fixes(const TestFailure& failure, const std::string& test_code,
                                       const ContextBundle& context, FixRecord& record) {
    record.fix_attempted = true;
    auto path = root_ / failure.test_file;
    std::optional<std::string> candidate = record.classification.suggested_fix;
    std::optional<FixAttempt> previous;

    for (int attempt = 1; attempt <= fix_attempts_; ++attempt) {
        if (!candidate && fixer_) {
            candidate = fixer_->request_fix(failure, test_code, context, previous);
        }
        if (!candidate) {
            if (!fixer_) break;
            continue;
        }
        record.attempts = attempt;

        FileSnapshot before;
        PatchOutcome outcome;
        try {
            before = patcher_.snapshot(path);
            outcome = patcher_.replace_definition(path, failure.qualified_name(), *candidate);
        } catch (const Error& e) {
            spdlog::error("Patching {} failed: {}", failure.node_id, e.what());
            outcome.target = failure.qualified_name();
            outcome.file = path.string();
            outcome.reason = e.what();
        }

        if (outcome.succeeded() && verify_fixes_) {
            std::string problem = verify(failure);
            if (!problem.empty()) {
                outcome.validated = false;
                try {
                    patcher_.restore(before);
                } catch (const PatchError& e) {
                    spdlog::error("Rolling back {} failed: {}", path.string(), e.what());
                    outcome.reason = "test still fails after patch; rollback failed: " + std::string(e.what());
                    record.patches.push_back(outcome);
                    return;
                }
                outcome.reason = "test still fails after patch; rolled back: " + problem;
                spdlog::info("Attempt {} for {} rolled back", attempt, failure.node_id);
            }
        }
        record.patches.push_back(outcome);

        if (outcome.succeeded()) {
            record.fix_successful = true;
            spdlog::info("Fixed {} on attempt {}", failure.node_id, attempt);
            return;
        }
        previous = FixAttempt{*candidate, outcome.reason};
        candidate.reset();
    }
    spdlog::warn("Could not fix {} after {} attempts", failure.node_id, record.attempts);
}

std::string RepairOrchestrator::verify(const TestFailure& failure) {
    TestRunReport rerun;
    try {
        rerun = runner_.run({failure.node_id});
    } catch (const ReportError& e) {
        return e.what();
    }
    RunAssessment assessment = assess_run(rerun);
    if (!assessment.fixable) return assessment.reason;

    auto failures = extract_failures(rerun);
    if (!failures.empty()) {
        const auto& f = failures.front();
        return f.exception_kind + ": " + f.message;
    }
    if (rerun.count(Outcome::Passed) == 0) {
        return "test was not run after patching";
    }
    return {};
}

}  // namespace testforge
