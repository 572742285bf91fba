#include "core/line_range.h"
#include <stdexcept>

namespace testforge {

LineRange::LineRange(int b, int e) : begin(b), end(e) {
    if (end < begin) {
        throw std::invalid_argument("line range end precedes begin: [" +
                                    std::to_string(b) + ", " + std::to_string(e) + ")");
    }
}

LineRange LineRange::from_inclusive(int first, int last) {
    return LineRange(first, last + 1);
}

bool LineRange::contains(const LineRange& other) const {
    if (other.empty()) return contains(other.begin) || other.begin == end;
    return other.begin >= begin && other.end <= end;
}

bool LineRange::overlaps(const LineRange& other) const {
    if (empty() || other.empty()) return false;
    return begin < other.end && other.begin < end;
}

std::set<int> LineRange::intersect(const std::set<int>& lines) const {
    std::set<int> result;
    if (empty()) return result;
    for (auto it = lines.lower_bound(begin); it != lines.end() && *it < end; ++it) {
        result.insert(*it);
    }
    return result;
}

std::string LineRange::to_string() const {
    if (empty()) return "[]";
    if (length() == 1) return std::to_string(begin);
    return std::to_string(begin) + "-" + std::to_string(last_line());
}

}  // namespace testforge
