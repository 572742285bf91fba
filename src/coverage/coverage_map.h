#pragma once
#ifndef TESTFORGE_COVERAGE_MAP_H
#define TESTFORGE_COVERAGE_MAP_H

#include <filesystem>
#include <istream>
#include <map>
#include <set>
#include <string>

namespace testforge {

// Executable lines of one file, split by whether any test hit them
struct FileCoverage {
    std::set<int> covered;
    std::set<int> uncovered;
    double line_rate = 0.0;
};

class CoverageMap {
public:
    void set_file(const std::string& file, FileCoverage coverage);

    // Exact path first, then a unique path-suffix match in either direction.
    // Several suffix matches yield nullptr.
    const FileCoverage* find(const std::string& file) const;

    const std::map<std::string, FileCoverage>& files() const { return files_; }

    double line_rate() const { return line_rate_; }
    void set_line_rate(double rate) { line_rate_ = rate; }
    double percent() const { return line_rate_ * 100.0; }

private:
    std::map<std::string, FileCoverage> files_;
    double line_rate_ = 0.0;
};

// Cobertura XML as written by coverage.py; throws CoverageError
CoverageMap parse_cobertura(std::istream& in);
CoverageMap load_cobertura(const std::filesystem::path& path);

}  // namespace testforge

#endif  // TESTFORGE_COVERAGE_MAP_H
