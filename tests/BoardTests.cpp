#include <gtest/gtest.h>

#include "board.hpp"
#include "calendar.hpp"

TEST(Board, ParsesCalendarLayout) {
    Board<8> b{ CALENDAR_LAYOUT };
    EXPECT_EQ(b.rows, 7u);
    EXPECT_EQ(b.cols, 7u);
    EXPECT_EQ(b.base.size(), 43u);
    EXPECT_EQ(b.open().size(), 43u);
    EXPECT_EQ(b.region_size('m'), 12u);
    EXPECT_EQ(b.region_size('d'), 31u);
    EXPECT_EQ(b.region_size('x'), 0u);
    for (auto pos : { coords_t{ 0, 6 }, coords_t{ 1, 6 }, coords_t{ 6, 3 },
                      coords_t{ 6, 4 }, coords_t{ 6, 5 }, coords_t{ 6, 6 } })
        EXPECT_TRUE(b.blocked(pos));
    EXPECT_FALSE(b.blocked({ 2, 0 }));
    EXPECT_TRUE(b.blocked({ 7, 0 }));
    EXPECT_TRUE(b.blocked({ 0, -1 }));
}

TEST(Board, RegionCellsAreRowMajor) {
    Board<8> b{ CALENDAR_LAYOUT };
    EXPECT_EQ(b.region_cell('m', 1), (coords_t{ 0, 0 }));
    EXPECT_EQ(b.region_cell('m', 7), (coords_t{ 1, 0 }));
    EXPECT_EQ(b.region_cell('m', 12), (coords_t{ 1, 5 }));
    EXPECT_EQ(b.region_cell('d', 1), (coords_t{ 2, 0 }));
    EXPECT_EQ(b.region_cell('d', 28), (coords_t{ 5, 6 }));
    EXPECT_EQ(b.region_cell('d', 31), (coords_t{ 6, 2 }));
    EXPECT_THROW((void)b.region_cell('m', 0), std::out_of_range);
    EXPECT_THROW((void)b.region_cell('m', 13), std::out_of_range);
    EXPECT_THROW((void)b.region_cell('z', 1), std::out_of_range);
}

TEST(Board, Expose) {
    Board<8> b{ CALENDAR_LAYOUT };
    auto e = b.expose({ 0, 0 }).expose({ 2, 0 });
    EXPECT_EQ(e.open().size(), 41u);
    EXPECT_TRUE(e.exposed.test(0, 0));
    EXPECT_FALSE(e.blocked({ 0, 0 }));
    EXPECT_EQ(b.open().size(), 43u);
    EXPECT_THROW((void)b.expose({ 0, 6 }), std::invalid_argument);
    EXPECT_THROW((void)b.expose({ 9, 9 }), std::invalid_argument);
    EXPECT_THROW((void)e.expose({ 0, 0 }), std::invalid_argument);
}

TEST(Board, ShortRowsArePadded) {
    Board<8> b{ "...\n.\n" };
    EXPECT_EQ(b.rows, 2u);
    EXPECT_EQ(b.cols, 3u);
    EXPECT_EQ(b.base.size(), 4u);
    EXPECT_TRUE(b.blocked({ 1, 1 }));
    EXPECT_FALSE(b.blocked({ 1, 0 }));
}

TEST(Board, RejectsBadInput) {
    EXPECT_THROW(Board<8>{ "..?" }, std::invalid_argument);
    EXPECT_THROW(Board<8>{ "........." }, std::invalid_argument);
    EXPECT_THROW(Board<8>{ ".\n.\n.\n.\n.\n.\n.\n.\n.\n" }, std::invalid_argument);
}

TEST(Board, Empty) {
    Board<8> b{ "" };
    EXPECT_EQ(b.rows, 0u);
    EXPECT_EQ(b.cols, 0u);
    EXPECT_FALSE(b.base);
}
