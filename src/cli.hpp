#pragma once

#include <cstdio>

// calendar            solve today's date
// calendar MONTH DAY  solve the given date
// calendar --all      solve every date
//
// results go to out, usage, input errors and timing to err
// returns the process exit code
int run_cli(int argc, const char *const argv[], std::FILE *out, std::FILE *err);
