#pragma once
#ifndef TESTFORGE_REPAIR_ORCHESTRATOR_H
#define TESTFORGE_REPAIR_ORCHESTRATOR_H

#include <filesystem>
#include "classify/failure_classifier.h"
#include "config/config.h"
#include "context/context_extractor.h"
#include "fix/fix_requester.h"
#include "patch/patch_engine.h"
#include "report/iteration_report.h"
#include "runner/test_runner.h"

namespace testforge {

// run -> classify -> fix -> patch -> re-run, bounded by max_iterations and by progress
class RepairOrchestrator {
public:
    // `fixer` may be null; then only fixes proposed by the classifier are tried
    RepairOrchestrator(const Config& config, TestRunner& runner, const ContextExtractor& extractor,
                       const FailureClassifier& classifier, const FixRequester* fixer,
                       const PatchEngine& patcher);

    IterationReport run();

private:
    FixRecord handle_failure(const TestFailure& failure);
    void attempt_fixes(const TestFailure& failure, const std::string& test_code,
                       const ContextBundle& context, FixRecord& record);
    // Empty when the patched test passes on its own
    std::string verify(const TestFailure& failure);

    std::filesystem::path root_;
    std::filesystem::path report_path_;
    int max_iterations_;
    int fix_attempts_;
    bool verify_fixes_;
    TestRunner& runner_;
    const ContextExtractor& extractor_;
    const FailureClassifier& classifier_;
    const FixRequester* fixer_;
    const PatchEngine& patcher_;
};

}  // namespace testforge

#endif  // TESTFORGE_REPAIR_ORCHESTRATOR_H
