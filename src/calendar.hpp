#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "board.hpp"
#include "Piece.hpp"
#include "solver.hpp"

// 7x7 calendar: two rows of months, five rows of days, six blocked cells
//   Jan Feb Mar Apr May Jun  #
//   Jul Aug Sep Oct Nov Dec  #
//    1   2   3   4   5   6   7
//   ...
//   29  30  31   #   #   #   #
inline constexpr std::string_view CALENDAR_LAYOUT = R"(
mmmmmm#
mmmmmm#
ddddddd
ddddddd
ddddddd
ddddddd
ddd####
)";

inline constexpr std::array<std::string_view, 12> MONTH_NAMES{
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec",
};

[[nodiscard]] const Board<8> &calendar_board();

// seven pentominoes and the 2x3 hexomino, named A to H
[[nodiscard]] const std::vector<Piece<8>> &calendar_pieces();

// throw std::out_of_range outside 1..12 and 1..31
[[nodiscard]] coords_t month_cell(int month);
[[nodiscard]] coords_t day_cell(int day);
[[nodiscard]] std::string_view month_name(int month);

// the calendar board with month and day exposed
[[nodiscard]] Board<8> calendar_board(int month, int day);

[[nodiscard]] std::optional<Solution<8>> solve_date(int month, int day);

struct DateResult {
    int month, day;
    bool solved;
    uint64_t placements;
    double seconds;
};

// every month/day pair, solved on a thread pool of the given size
// (0 = pool default); results ordered by month then day
[[nodiscard]] std::vector<DateResult> solve_year(unsigned threads = 0);
