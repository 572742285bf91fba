#pragma once
#ifndef TESTFORGE_GENERATION_ORCHESTRATOR_H
#define TESTFORGE_GENERATION_ORCHESTRATOR_H

#include <filesystem>
#include <map>
#include <optional>
#include "config/config.h"
#include "coverage/gap_mapper.h"
#include "generation/change_state.h"
#include "generation/test_generator.h"
#include "index/symbol_indexer.h"
#include "report/generation_report.h"
#include "runner/test_runner.h"

namespace testforge {

// Written next to the repair report: testforge_report.json -> testforge_report_generation.json
std::filesystem::path generation_report_path(const Config& config);

class GenerationOrchestrator {
public:
    GenerationOrchestrator(const Config& config, TestRunner& runner, const SymbolIndexer& indexer,
                           const TestGenerator& generator);

    // measure -> index -> map gaps -> generate, until the target is met,
    // coverage stalls or max_iterations passes have run. In incremental mode only
    // sources changed since the last run are targeted.
    GenerationReport run();

private:
    // Empty optional when the run or the coverage file is unusable; reason is set
    std::optional<CoverageMap> measure(std::string& reason);
    std::vector<Symbol> candidates_for(GenerationKind kind, const SymbolIndex& index) const;
    void write_report(const GenerationReport& report) const;
    // Deletes tests generated earlier for changed or deleted sources
    std::vector<std::string> remove_stale_tests(ChangeState& state, const ChangeSet& changes) const;
    // Stores the new hashes and which generated files cover each changed source
    void record_generation(ChangeState& state, const std::map<std::string, std::string>& hashes,
                           const ChangeSet& changes, const GenerationReport& report) const;

    const Config& config_;
    std::filesystem::path root_;
    TestRunner& runner_;
    const SymbolIndexer& indexer_;
    const TestGenerator& generator_;
};

}  // namespace testforge

#endif  // TESTFORGE_GENERATION_ORCHESTRATOR_H
