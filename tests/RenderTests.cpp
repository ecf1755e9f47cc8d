#include <gtest/gtest.h>

#include <sstream>

#include "calendar.hpp"
#include "render.hpp"

static std::vector<std::string> lines(const std::string &txt) {
    std::vector<std::string> out;
    std::istringstream is{ txt };
    for (std::string line; std::getline(is, line);)
        out.push_back(line);
    return out;
}

TEST(Render, CompactJune28) {
    auto sol = solve_date(6, 28);
    ASSERT_TRUE(sol);
    EXPECT_EQ(format_compact(*sol),
            "AAABB #\n"
            "AEEBCF#\n"
            "AEBBCFF\n"
            "DEECCFF\n"
            "DDDDCGG\n"
            "HHHGGG \n"
            "HHH####");
}

TEST(Render, CompactJanuary1) {
    auto sol = solve_date(1, 1);
    ASSERT_TRUE(sol);
    EXPECT_EQ(lines(format_compact(*sol)), (std::vector<std::string>{
            " AAABB#",
            "EECADB#",
            " ECADBB",
            "EECCDHH",
            "FFCDDHH",
            "FFGGGHH",
            "FGG####",
    }));
}

TEST(Render, CalendarJune28) {
    auto sol = solve_date(6, 28);
    ASSERT_TRUE(sol);
    EXPECT_EQ(lines(format_calendar(*sol, 6, 28)), (std::vector<std::string>{
            "Solution for Jun 28:",
            "",
            "  A     A     A     B     B   [ Jun]",
            "  A     E     E     B     C     F",
            "  A     E     B     B     C     F     F",
            "  D     E     E     C     C     F     F",
            "  D     D     D     D     C     G     G",
            "  H     H     H     G     G     G   [ 28 ]",
            "  H     H     H",
    }));
}

TEST(Render, CalendarMarksSingleDigitDays) {
    auto sol = solve_date(1, 1);
    ASSERT_TRUE(sol);
    auto txt = lines(format_calendar(*sol, 1, 1));
    ASSERT_EQ(txt.size(), 9u);
    EXPECT_EQ(txt[0], "Solution for Jan 1:");
    EXPECT_EQ(txt[2].substr(0, 6), "[ Jan]");
    EXPECT_EQ(txt[4].substr(0, 6), "[  1 ]");
}
