#include "render.hpp"

#include <fmt/format.h>

#include "calendar.hpp"

std::string format_compact(const Solution<8> &sol) {
    std::string txt;
    for (auto &line : sol.map) {
        if (!txt.empty())
            txt.push_back('\n');
        txt += line;
    }
    return txt;
}

std::string format_calendar(const Solution<8> &sol, int month, int day) {
    auto &board = calendar_board();
    auto &months = board.regions.at('m');
    auto &days = board.regions.at('d');

    // [row][col] -> 1-based position within its region, 0 if none
    std::vector<std::vector<int>> index(board.rows, std::vector<int>(board.cols, 0));
    for (auto *region : { &months, &days }) {
        auto i = 1;
        for (auto [row, col] : *region)
            index[row][col] = i++;
    }

    auto txt = fmt::format("Solution for {} {}:\n", month_name(month), day);
    for (auto row = 0zu; row < board.rows; row++) {
        std::string line;
        for (auto col = 0zu; col < board.cols; col++) {
            auto label = sol.at(row, col);
            auto id = index[row][col];
            if (!id) {
                line += "      ";
            } else if (label != LABEL_EXPOSED) {
                line += fmt::format("  {}   ", label);
            } else if (months.test(row, col)) {
                line += fmt::format("[{:>4}]", month_name(id));
            } else {
                line += fmt::format("[{:>3} ]", id);
            }
        }
        while (!line.empty() && line.back() == ' ')
            line.pop_back();
        txt += '\n';
        txt += line;
    }
    return txt;
}
