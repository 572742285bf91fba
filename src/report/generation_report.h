#pragma once
#ifndef TESTFORGE_GENERATION_REPORT_H
#define TESTFORGE_GENERATION_REPORT_H

#include <filesystem>
#include <string>
#include <vector>
#include <json/json.h>
#include "generation/test_generator.h"

namespace testforge {

struct GenerationIteration {
    int iteration = 0;
    double coverage_before = 0.0;   // percent
    size_t gap_count = 0;
    size_t target_count = 0;
    std::vector<GeneratedFile> files;
};

struct GenerationReport {
    std::vector<GenerationIteration> iterations;
    double initial_coverage = 0.0;
    double final_coverage = 0.0;
    std::string stopped_reason;
    std::vector<std::string> removed_files;     // stale generated tests deleted before generating

    std::vector<std::string> generated_files() const;
    Json::Value to_json() const;
    // Throws ReportError
    void write(const std::filesystem::path& path) const;
};

}  // namespace testforge

#endif  // TESTFORGE_GENERATION_REPORT_H
