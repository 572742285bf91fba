#pragma once
#ifndef TESTFORGE_GAP_MAPPER_H
#define TESTFORGE_GAP_MAPPER_H

#include <map>
#include <set>
#include <string>
#include <vector>
#include "core/types.h"
#include "coverage/coverage_map.h"
#include "index/symbol_index.h"

namespace testforge {

// A symbol with at least one uncovered line inside its range
struct GapRecord {
    Symbol symbol;
    std::set<int> uncovered_lines;
};

struct GapSummary {
    double overall_percent = 0.0;
    size_t gap_count = 0;
    std::map<std::string, size_t> missing_lines_per_file;
};

// Nested symbols are evaluated on their own; overlapping lines are counted for each
std::vector<GapRecord> map_gaps(const SymbolIndex& index, const CoverageMap& coverage);

// Candidates that have a gap themselves or enclose a gapped symbol, in candidate order
std::vector<Symbol> gapped_targets(const std::vector<Symbol>& candidates,
                                   const std::vector<GapRecord>& gaps);

GapSummary summarize_gaps(const std::vector<GapRecord>& gaps, const CoverageMap& coverage);

// {14, 15, 16, 20} -> "14-16, 20"
std::string format_line_ranges(const std::set<int>& lines);

}  // namespace testforge

#endif  // TESTFORGE_GAP_MAPPER_H
