#pragma once

#include <string>

#include "solver.hpp"

// one line per row, one label per cell
[[nodiscard]] std::string format_compact(const Solution<8> &sol);

// calendar table, six columns per cell:
// "[ Jun]" / "[ 28 ]" for the exposed month and day, "  X   " for piece X
[[nodiscard]] std::string format_calendar(const Solution<8> &sol, int month, int day);
