#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>

#include <fmt/format.h>

inline std::string display(double s) {
    if (s == 0.0)
        return "0s";
    if (s < 0.0)
        return "-" + display(-s);
    if (s < 1e-9)
        return "<1ns";
    if (s < 1e-6)
        return fmt::format("{:.1f}ns", s / 1e-9);
    if (s < 1e-3)
        return fmt::format("{:.1f}us", s / 1e-6);
    if (s < 1.0)
        return fmt::format("{:.1f}ms", s / 1e-3);
    if (s < 100.0)
        return fmt::format("{:.2f}s", s);
    if (s < 600.0)
        return fmt::format("{}m{}s", (uint64_t)(s) / 60, (uint64_t)(s) % 60);
    if (s < 3600.0)
        return fmt::format("{:.1f}m", s / 60);
    if (s < 100 * 3600.0)
        return fmt::format("{}h{}m", (uint64_t)(s) / 3600, (uint64_t)(s) / 60 % 60);
    if (s < 100 * 86400.0)
        return fmt::format("{}d{}h", (uint64_t)(s) / 86400, (uint64_t)(s) / 3600 % 24);
    return fmt::format("{}d", (uint64_t)(s) / 86400);
}

// true iff the variable is set and non-empty
inline bool env_flag(const char *name) {
    auto v = ::getenv(name);
    return v && *v;
}
