#include <gtest/gtest.h>
#include "coverage/gap_mapper.h"

using namespace testforge;

namespace {

Symbol make_symbol(const std::string& file, const std::string& qualified, int first, int last,
                   int depth = 0) {
    Symbol s;
    s.file = file;
    s.qualified_name = qualified;
    s.name = qualified.substr(qualified.rfind('.') + 1);
    s.range = LineRange::from_inclusive(first, last);
    s.outer_range = s.range;
    s.depth = depth;
    return s;
}

}  // namespace

// A 20-line function starting at line 1 with lines 14-16 never executed
TEST(GapMapperTest, test_uncovered_lines_inside_function) {
    SymbolIndex index;
    index.add_file("app/calc.py", {make_symbol("app/calc.py", "compute", 1, 20)}, {});

    CoverageMap coverage;
    FileCoverage fc;
    for (int line = 1; line <= 20; ++line) {
        if (line >= 14 && line <= 16) {
            fc.uncovered.insert(line);
        } else {
            fc.covered.insert(line);
        }
    }
    fc.uncovered.insert(25);
    coverage.set_file("app/calc.py", fc);

    auto gaps = map_gaps(index, coverage);
    ASSERT_EQ(gaps.size(), 1u);
    EXPECT_EQ(gaps[0].symbol.qualified_name, "compute");
    EXPECT_EQ(gaps[0].uncovered_lines, (std::set<int>{14, 15, 16}));
    EXPECT_EQ(format_line_ranges(gaps[0].uncovered_lines), "14-16");
}

TEST(GapMapperTest, test_fully_covered_symbol_has_no_gap) {
    SymbolIndex index;
    index.add_file("a.py", {make_symbol("a.py", "ok", 1, 5)}, {});
    CoverageMap coverage;
    FileCoverage fc;
    fc.covered = {1, 2, 3, 4, 5};
    coverage.set_file("a.py", fc);
    EXPECT_TRUE(map_gaps(index, coverage).empty());
}

TEST(GapMapperTest, test_nested_symbols_counted_independently) {
    SymbolIndex index;
    index.add_file("a.py",
                   {make_symbol("a.py", "Outer", 1, 10),
                    make_symbol("a.py", "Outer.inner", 3, 6, 1),
                    make_symbol("a.py", "Outer.other", 7, 10, 1)},
                   {});
    CoverageMap coverage;
    FileCoverage fc;
    fc.uncovered = {4};
    coverage.set_file("a.py", fc);

    auto gaps = map_gaps(index, coverage);
    ASSERT_EQ(gaps.size(), 2u);
    EXPECT_EQ(gaps[0].symbol.qualified_name, "Outer");
    EXPECT_EQ(gaps[1].symbol.qualified_name, "Outer.inner");
}

TEST(GapMapperTest, test_file_without_coverage_data_is_ignored) {
    SymbolIndex index;
    index.add_file("a.py", {make_symbol("a.py", "f", 1, 3)}, {});
    CoverageMap coverage;
    EXPECT_TRUE(map_gaps(index, coverage).empty());
}

TEST(GapMapperTest, test_gapped_targets_keep_enclosing_candidates) {
    auto outer = make_symbol("a.py", "Service", 1, 20);
    auto untouched = make_symbol("a.py", "helper", 22, 30);
    auto method = make_symbol("a.py", "Service.run", 5, 9, 1);

    std::vector<GapRecord> gaps = {{method, {6}}};
    auto targets = gapped_targets({outer, untouched}, gaps);
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0].qualified_name, "Service");
}

TEST(GapMapperTest, test_gapped_targets_ignore_other_files) {
    auto a = make_symbol("a.py", "f", 1, 10);
    auto b = make_symbol("b.py", "f", 1, 10);
    std::vector<GapRecord> gaps = {{b, {2}}};
    auto targets = gapped_targets({a, b}, gaps);
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0].file, "b.py");
}

TEST(GapMapperTest, test_summary_counts_missing_lines) {
    CoverageMap coverage;
    FileCoverage fc;
    fc.uncovered = {1, 2, 3};
    coverage.set_file("a.py", fc);
    coverage.set_file("b.py", FileCoverage{{1}, {}, 1.0});
    coverage.set_line_rate(0.4);

    GapSummary summary = summarize_gaps({}, coverage);
    EXPECT_DOUBLE_EQ(summary.overall_percent, 40.0);
    EXPECT_EQ(summary.gap_count, 0u);
    ASSERT_EQ(summary.missing_lines_per_file.size(), 1u);
    EXPECT_EQ(summary.missing_lines_per_file.at("a.py"), 3u);
}

TEST(GapMapperTest, test_format_line_ranges) {
    EXPECT_EQ(format_line_ranges({}), "");
    EXPECT_EQ(format_line_ranges({7}), "7");
    EXPECT_EQ(format_line_ranges({14, 15, 16, 20}), "14-16, 20");
    EXPECT_EQ(format_line_ranges({1, 3, 4, 9, 10, 11}), "1, 3-4, 9-11");
}
