#include <cstdio>
#include <exception>

#include <fmt/format.h>

#include "cli.hpp"

int main(int argc, char *argv[]) {
    try {
        return run_cli(argc, argv, stdout, stderr);
    } catch (const std::exception &e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
}
