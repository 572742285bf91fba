#pragma once
#ifndef TESTFORGE_ITERATION_REPORT_H
#define TESTFORGE_ITERATION_REPORT_H

#include <filesystem>
#include <string>
#include <vector>
#include <json/json.h>
#include "classify/classification.h"
#include "patch/patch_engine.h"

namespace testforge {

// What happened to one failure in one round
struct FixRecord {
    int iteration = 0;
    std::string node_id;
    std::string test_file;
    std::string test_name;
    ClassificationResult classification;
    bool fix_attempted = false;
    bool fix_successful = false;
    int attempts = 0;
    std::vector<PatchOutcome> patches;
    std::string outcome;            // fixed, code_defect, undetermined, fix_failed
};

// Append-only record of a repair run, written once at the end
class IterationReport {
public:
    int begin_round();
    void record(FixRecord record);
    // Successful fixes recorded since begin_round()
    size_t finish_round();
    void set_aborted(const std::string& reason) { aborted_reason_ = reason; }

    int iterations() const { return iterations_; }
    const std::string& aborted_reason() const { return aborted_reason_; }
    const std::vector<FixRecord>& fix_history() const { return history_; }

    // Counts over distinct tests, using each test's latest record
    size_t total_failures() const;
    size_t test_mistakes() const;
    size_t code_defects() const;
    size_t undetermined() const;
    size_t successful_fixes() const;
    size_t failed_fixes() const;

    Json::Value to_json() const;
    // Throws ReportError
    void write(const std::filesystem::path& path) const;

    // Fixed, left as code defect, and could not determine, listed separately
    std::vector<std::string> summary_lines() const;

private:
    std::vector<const FixRecord*> latest_per_test() const;

    int iterations_ = 0;
    size_t round_start_ = 0;
    std::string aborted_reason_;
    std::vector<FixRecord> history_;
};

}  // namespace testforge

#endif  // TESTFORGE_ITERATION_REPORT_H
