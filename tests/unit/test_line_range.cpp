#include <gtest/gtest.h>
#include "core/line_range.h"
#include <stdexcept>

using namespace testforge;

TEST(LineRangeTest, test_half_open_contains) {
    LineRange r(10, 15);
    EXPECT_TRUE(r.contains(10));
    EXPECT_TRUE(r.contains(14));
    EXPECT_FALSE(r.contains(15));
    EXPECT_FALSE(r.contains(9));
    EXPECT_EQ(r.length(), 5);
}

TEST(LineRangeTest, test_from_inclusive) {
    auto r = LineRange::from_inclusive(3, 7);
    EXPECT_EQ(r.begin, 3);
    EXPECT_EQ(r.end, 8);
    EXPECT_EQ(r.first_line(), 3);
    EXPECT_EQ(r.last_line(), 7);
}

TEST(LineRangeTest, test_single_line_range) {
    auto r = LineRange::from_inclusive(4, 4);
    EXPECT_EQ(r.length(), 1);
    EXPECT_EQ(r.to_string(), "4");
}

TEST(LineRangeTest, test_end_before_begin_throws) {
    EXPECT_THROW(LineRange(5, 4), std::invalid_argument);
}

TEST(LineRangeTest, test_empty_range) {
    LineRange r(6, 6);
    EXPECT_TRUE(r.empty());
    EXPECT_FALSE(r.contains(6));
    EXPECT_EQ(r.length(), 0);
    EXPECT_TRUE(r.intersect({5, 6, 7}).empty());
}

TEST(LineRangeTest, test_nested_containment) {
    LineRange outer(1, 21);
    LineRange inner(5, 9);
    EXPECT_TRUE(outer.contains(inner));
    EXPECT_FALSE(inner.contains(outer));
    EXPECT_TRUE(outer.overlaps(inner));
}

TEST(LineRangeTest, test_adjacent_ranges_do_not_overlap) {
    EXPECT_FALSE(LineRange(1, 5).overlaps(LineRange(5, 9)));
    EXPECT_TRUE(LineRange(1, 6).overlaps(LineRange(5, 9)));
}

TEST(LineRangeTest, test_intersect_selects_lines_inside) {
    LineRange r(10, 20);
    auto lines = r.intersect({2, 10, 14, 15, 16, 19, 20, 40});
    EXPECT_EQ(lines, (std::set<int>{10, 14, 15, 16, 19}));
}

TEST(LineRangeTest, test_to_string_multi_line) {
    EXPECT_EQ(LineRange(14, 17).to_string(), "14-16");
}
