#include "Group.hpp"

static_assert(SymmetryGroup::D4 >= SymmetryGroup::D2_XY);
static_assert(SymmetryGroup::D4 >= SymmetryGroup::D2_PS);
static_assert(SymmetryGroup::D2_XY >= SymmetryGroup::D1_X);
static_assert(SymmetryGroup::D2_XY >= SymmetryGroup::D1_Y);
static_assert(SymmetryGroup::D2_PS >= SymmetryGroup::D1_P);
static_assert(SymmetryGroup::D2_PS >= SymmetryGroup::D1_S);
static_assert(SymmetryGroup::D4 >= SymmetryGroup::C4);
static_assert(SymmetryGroup::C4 >= SymmetryGroup::C2);
static_assert(SymmetryGroup::C2 >= SymmetryGroup::C1);
static_assert(!(SymmetryGroup::D1_X >= SymmetryGroup::C2));

static_assert(order(SymmetryGroup::C1) == 8);
static_assert(order(SymmetryGroup::D1_P) == 4);
static_assert(order(SymmetryGroup::C2) == 4);
static_assert(order(SymmetryGroup::D2_XY) == 2);
static_assert(order(SymmetryGroup::C4) == 2);
static_assert(order(SymmetryGroup::D4) == 1);

static_assert(is_group(0b00001111u));
static_assert(!is_group(0b00000111u));

std::string_view group_name(SymmetryGroup g) {
    switch (g) {
        case SymmetryGroup::C1: return "C1";
        case SymmetryGroup::C2: return "C2";
        case SymmetryGroup::C4: return "C4";
        case SymmetryGroup::D1_X: return "D1_X";
        case SymmetryGroup::D1_Y: return "D1_Y";
        case SymmetryGroup::D1_P: return "D1_P";
        case SymmetryGroup::D1_S: return "D1_S";
        case SymmetryGroup::D2_XY: return "D2_XY";
        case SymmetryGroup::D2_PS: return "D2_PS";
        case SymmetryGroup::D4: return "D4";
    }
    return "unknown";
}

auto fmt::formatter<SymmetryGroup>::format(SymmetryGroup c, fmt::format_context &ctx) const
    -> fmt::format_context::iterator {
    auto sv = group_name(c);
    return fmt::formatter<fmt::string_view>::format(fmt::string_view{ sv.data(), sv.size() }, ctx);
}
