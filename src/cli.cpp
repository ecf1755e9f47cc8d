#include "cli.hpp"

#include <chrono>
#include <ctime>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "calendar.hpp"
#include "render.hpp"
#include "util.hpp"

static void usage(std::string_view prog, std::FILE *err) {
    fmt::print(err, "Usage: {} [month day]\n", prog);
    fmt::print(err, "       {} --all\n", prog);
    fmt::print(err, "  month: 1-12\n");
    fmt::print(err, "  day: 1-31\n");
}

// whole-string base-10 integer
static bool parse_int(const char *str, int &v) {
    try {
        size_t pos;
        v = std::stoi(str, &pos);
        return str[pos] == '\0';
    } catch (const std::invalid_argument &) {
        return false;
    } catch (const std::out_of_range &) {
        return false;
    }
}

static void today(int &month, int &day) {
    auto now = std::time(nullptr);
    std::tm tm{};
    if (!::localtime_r(&now, &tm))
        throw std::runtime_error{ "cannot determine the current date" };
    month = tm.tm_mon + 1;
    day = tm.tm_mday;
}

static int run_year(std::FILE *out, std::FILE *err, bool quiet) {
    auto threads = 0u;
    if (auto env = ::getenv("CALENDAR_THREADS"); env && *env)
        threads = static_cast<unsigned>(std::stoul(env));

    auto t1 = std::chrono::steady_clock::now();
    auto results = solve_year(threads);
    auto t2 = std::chrono::steady_clock::now();

    auto solved = 0zu;
    for (auto &r : results) {
        if (r.solved)
            solved++;
        fmt::print(out, "{:02}/{:02} => {}\n", r.month, r.day, r.solved ? "solved" : "no solution");
        if (!quiet)
            fmt::print(err, "  {} {}: {} placements in {}\n",
                    month_name(r.month), r.day, r.placements, display(r.seconds));
    }
    fmt::print(out, "{} of {} dates solved\n", solved, results.size());
    if (!quiet)
        fmt::print(err, "completed in {}\n",
                display(std::chrono::duration<double>(t2 - t1).count()));
    return 0;
}

int run_cli(int argc, const char *const argv[], std::FILE *out, std::FILE *err) {
    std::string_view prog = argc > 0 ? argv[0] : "calendar";
    auto quiet = env_flag("CALENDAR_QUIET");

    if (argc == 2 && std::string_view{ argv[1] } == "--all")
        return run_year(out, err, quiet);

    int month, day;
    if (argc == 3) {
        if (!parse_int(argv[1], month)) {
            fmt::print(err, "Invalid month: {}\n", argv[1]);
            return 1;
        }
        if (!parse_int(argv[2], day)) {
            fmt::print(err, "Invalid day: {}\n", argv[2]);
            return 1;
        }
    } else if (argc == 1) {
        today(month, day);
    } else {
        usage(prog, err);
        return 1;
    }

    if (month < 1 || month > 12) {
        fmt::print(err, "Invalid month: {}\n", month);
        return 1;
    }
    if (day < 1 || day > 31) {
        fmt::print(err, "Invalid day: {}\n", day);
        return 1;
    }

    fmt::print(out, "Solving for {} {}...\n", month_name(month), day);
    auto t1 = std::chrono::steady_clock::now();
    Solver<8> solver{ calendar_pieces(), calendar_board(month, day) };
    auto sol = solver.run();
    auto t2 = std::chrono::steady_clock::now();
    if (!quiet)
        fmt::print(err, "{} {} {} in {} ({} placements)\n",
                sol ? "solved" : "exhausted", month_name(month), day,
                display(std::chrono::duration<double>(t2 - t1).count()), solver.placements());

    if (!sol) {
        fmt::print(out, "No solution found!\n");
        return 0;
    }
    fmt::print(out, "\n{}\n\n{}\n", format_compact(*sol), format_calendar(*sol, month, day));
    return 0;
}
