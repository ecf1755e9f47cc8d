#pragma once

#include <bit>
#include <cstdint>
#include <cstddef>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>

// subgroups of D4, one bit per transform that leaves a shape unchanged
// bit order follows Shape::transforms():
// identity, flip X, flip Y, rot180, flip primary, rot90 CW, rot90 CCW, flip secondary
enum class SymmetryGroup : uint16_t {
  C1    = 0b00000001u,
  C2    = 0b00001001u,
  C4    = 0b01101001u,
  D1_X  = 0b00000011u,
  D1_Y  = 0b00000101u,
  D1_P  = 0b00010001u,
  D1_S  = 0b10000001u,
  D2_XY = 0b00001111u,
  D2_PS = 0b10011001u,
  D4    = 0b11111111u,
};

// lhs >= rhs iff rhs is a subgroup of lhs
constexpr inline bool operator>=(SymmetryGroup lhs, SymmetryGroup rhs) {
    auto l = static_cast<std::underlying_type_t<SymmetryGroup>>(lhs);
    auto r = static_cast<std::underlying_type_t<SymmetryGroup>>(rhs);
    return (l & r) == r;
}

// number of distinct orientations of a shape whose stabilizer is v
constexpr inline size_t order(SymmetryGroup v) {
    auto s = static_cast<std::underlying_type_t<SymmetryGroup>>(v);
    return 8 / std::popcount(s);
}

// false if the mask is not one of the ten subgroups
constexpr inline bool is_group(unsigned mask) {
    switch (mask) {
        case 0b00000001u: case 0b00001001u: case 0b01101001u:
        case 0b00000011u: case 0b00000101u: case 0b00010001u:
        case 0b10000001u: case 0b00001111u: case 0b10011001u:
        case 0b11111111u:
            return true;
        default:
            return false;
    }
}

std::string_view group_name(SymmetryGroup g);

template <>
struct fmt::formatter<SymmetryGroup> : fmt::formatter<fmt::string_view> {
    auto format(SymmetryGroup c, fmt::format_context &ctx) const
        -> fmt::format_context::iterator;
};
