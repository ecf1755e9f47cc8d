#include "Orientation.hpp"

#include <algorithm>
#include <stdexcept>

cells_t rotate_90(const cells_t &cells) {
    cells_t out;
    for (auto [r, c] : cells)
        out.emplace_back(c, -r);
    return out;
}

cells_t reflect(const cells_t &cells) {
    cells_t out;
    for (auto [r, c] : cells)
        out.emplace_back(-r, c);
    return out;
}

cells_t normalize(const cells_t &cells) {
    if (cells.empty())
        return {};
    auto [min_r, min_c] = cells.front();
    for (auto [r, c] : cells)
        min_r = std::min(min_r, r), min_c = std::min(min_c, c);
    cells_t out;
    for (auto [r, c] : cells)
        out.emplace_back(r - min_r, c - min_c);
    std::sort(out.begin(), out.end());
    return out;
}

orientations_t orientations_of(const cells_t &base) {
    if (base.empty())
        throw std::invalid_argument{ "a piece needs at least one cell" };
    orientations_t set;
    auto current = base;
    for (auto i = 0; i < 4; i++) {
        set.insert(normalize(current));
        set.insert(normalize(reflect(current)));
        current = rotate_90(current);
    }
    return set;
}

template <size_t L>
Shape<L> to_shape(const cells_t &cells) {
    auto sh = Shape<L>{ 0u };
    for (auto [r, c] : cells) {
        if (r < 0 || c < 0 || r >= static_cast<int>(L) || c >= static_cast<int>(L))
            throw std::invalid_argument{ fmt::format("cell ({}, {}) outside a {}x{} grid", r, c, L, L) };
        sh = sh.set(r, c);
    }
    return sh;
}

template <size_t L>
cells_t to_cells(Shape<L> sh) {
    cells_t out;
    for (auto pos : sh)
        out.push_back(pos);
    return out;
}

template Shape<8> to_shape<8>(const cells_t &cells);
template cells_t to_cells<8>(Shape<8> sh);
