#pragma once
#ifndef TESTFORGE_LINE_RANGE_H
#define TESTFORGE_LINE_RANGE_H

#include <set>
#include <string>

namespace testforge {

// Half-open interval of 1-based source lines: [begin, end)
struct LineRange {
    int begin = 0;
    int end = 0;

    LineRange() = default;
    LineRange(int b, int e);

    // Builds [first, last + 1) from an inclusive pair of line numbers
    static LineRange from_inclusive(int first, int last);

    bool empty() const { return end <= begin; }
    int length() const { return empty() ? 0 : end - begin; }
    int first_line() const { return begin; }
    int last_line() const { return end - 1; }

    bool contains(int line) const { return line >= begin && line < end; }
    bool contains(const LineRange& other) const;
    bool overlaps(const LineRange& other) const;

    // Lines of `lines` that fall inside this range
    std::set<int> intersect(const std::set<int>& lines) const;

    std::string to_string() const;

    bool operator==(const LineRange& other) const {
        return begin == other.begin && end == other.end;
    }
    bool operator!=(const LineRange& other) const { return !(*this == other); }
};

}  // namespace testforge

#endif  // TESTFORGE_LINE_RANGE_H
