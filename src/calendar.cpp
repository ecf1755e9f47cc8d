#include "calendar.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#define BOOST_THREAD_VERSION 5
#include <boost/thread/executors/basic_thread_pool.hpp>

const Board<8> &calendar_board() {
    static const Board<8> board{ CALENDAR_LAYOUT };
    return board;
}

const std::vector<Piece<8>> &calendar_pieces() {
    static const std::vector<Piece<8>> pieces{
        { 'A', { { 0, 0 }, { 1, 0 }, { 2, 0 }, { 2, 1 }, { 2, 2 } } },           // V
        { 'B', { { 0, 0 }, { 1, 0 }, { 1, 1 }, { 1, 2 }, { 2, 2 } } },           // Z
        { 'C', { { 0, 0 }, { 0, 1 }, { 0, 2 }, { 0, 3 }, { 1, 2 } } },           // Y
        { 'D', { { 0, 0 }, { 1, 0 }, { 2, 0 }, { 3, 0 }, { 3, 1 } } },           // L
        { 'E', { { 0, 0 }, { 0, 1 }, { 1, 0 }, { 2, 0 }, { 2, 1 } } },           // U
        { 'F', { { 0, 0 }, { 0, 1 }, { 1, 0 }, { 1, 1 }, { 1, 2 } } },           // P
        { 'G', { { 0, 1 }, { 0, 2 }, { 0, 3 }, { 1, 0 }, { 1, 1 } } },           // N
        { 'H', { { 0, 0 }, { 0, 1 }, { 1, 0 }, { 1, 1 }, { 2, 0 }, { 2, 1 } } }, // rect
    };
    return pieces;
}

coords_t month_cell(int month) {
    if (month < 1 || month > 12)
        throw std::out_of_range{ fmt::format("month {} not in 1..12", month) };
    return calendar_board().region_cell('m', month);
}

coords_t day_cell(int day) {
    if (day < 1 || day > 31)
        throw std::out_of_range{ fmt::format("day {} not in 1..31", day) };
    return calendar_board().region_cell('d', day);
}

std::string_view month_name(int month) {
    if (month < 1 || month > 12)
        throw std::out_of_range{ fmt::format("month {} not in 1..12", month) };
    return MONTH_NAMES[month - 1];
}

Board<8> calendar_board(int month, int day) {
    return calendar_board().expose(month_cell(month)).expose(day_cell(day));
}

std::optional<Solution<8>> solve_date(int month, int day) {
    return solve(calendar_pieces(), calendar_board(month, day));
}

std::vector<DateResult> solve_year(unsigned threads) {
    std::vector<DateResult> results;
    for (auto month = 1; month <= 12; month++)
        for (auto day = 1; day <= 31; day++)
            results.push_back(DateResult{ month, day, false, 0, 0.0 });

    // the pieces are shared read-only; each task owns its Solver
    auto &lib = calendar_pieces();
    auto pool = threads
        ? std::make_unique<boost::basic_thread_pool>(threads)
        : std::make_unique<boost::basic_thread_pool>();
    for (auto &r : results) {
        pool->submit([&lib, &r] {
            auto t1 = std::chrono::steady_clock::now();
            Solver<8> solver{ lib, calendar_board(r.month, r.day) };
            r.solved = solver.run().has_value();
            auto t2 = std::chrono::steady_clock::now();
            r.placements = solver.placements();
            r.seconds = std::chrono::duration<double>(t2 - t1).count();
        });
    }
    pool->close();
    pool->join();
    return results;
}
