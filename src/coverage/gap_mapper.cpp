#include "coverage/gap_mapper.h"
#include <spdlog/spdlog.h>

namespace testforge {

std::vector<GapRecord> map_gaps(const SymbolIndex& index, const CoverageMap& coverage) {
    std::vector<GapRecord> gaps;
    for (const auto& sym : index.symbols()) {
        const FileCoverage* cov = coverage.find(sym.file);
        if (!cov) {
            spdlog::debug("No coverage data for {}", sym.file);
            continue;
        }
        std::set<int> uncovered = sym.range.intersect(cov->uncovered);
        if (!uncovered.empty()) {
            gaps.push_back({sym, std::move(uncovered)});
        }
    }
    return gaps;
}

std::vector<Symbol> gapped_targets(const std::vector<Symbol>& candidates,
                                   const std::vector<GapRecord>& gaps) {
    std::vector<Symbol> result;
    for (const auto& candidate : candidates) {
        for (const auto& gap : gaps) {
            if (gap.symbol.file != candidate.file) continue;
            if (gap.symbol.key() == candidate.key() || candidate.range.contains(gap.symbol.range)) {
                result.push_back(candidate);
                break;
            }
        }
    }
    return result;
}

GapSummary summarize_gaps(const std::vector<GapRecord>& gaps, const CoverageMap& coverage) {
    GapSummary summary;
    summary.overall_percent = coverage.percent();
    summary.gap_count = gaps.size();
    for (const auto& [file, cov] : coverage.files()) {
        if (!cov.uncovered.empty()) {
            summary.missing_lines_per_file[file] = cov.uncovered.size();
        }
    }
    return summary;
}

std::string format_line_ranges(const std::set<int>& lines) {
    std::string out;
    auto it = lines.begin();
    while (it != lines.end()) {
        int first = *it;
        int last = first;
        ++it;
        while (it != lines.end() && *it == last + 1) {
            last = *it;
            ++it;
        }
        if (!out.empty()) out += ", ";
        out += first == last ? std::to_string(first)
                             : std::to_string(first) + "-" + std::to_string(last);
    }
    return out;
}

}  // namespace testforge
