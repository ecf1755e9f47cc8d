#pragma once

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string_view>

#include <fmt/format.h>

#include "Shape.hpp"

// per-cell labels of a solved board; pieces use their own name
inline constexpr char LABEL_BLOCKED = '#';
inline constexpr char LABEL_EXPOSED = ' ';
inline constexpr char LABEL_EMPTY = '.';

// Board geometry, one text line per row:
//   '#'          blocked, never covered
//   '.'          open
//   [0-9A-Za-z]  open, and part of the region named by that character
// Short rows are padded with blocked cells.
// Cells of a region are numbered in row-major order.
template <size_t L>
struct Board {
    size_t rows, cols;
    Shape<L> base;    // every non-blocked cell
    Shape<L> exposed; // open cells that must stay uncovered
    std::map<char, Shape<L>> regions;

    explicit Board(std::string_view sv) : rows{}, cols{}, base{ 0u }, exposed{ 0u } {
        auto region = [](char ch) {
            return (ch >= '0' && ch <= '9')
                || (ch >= 'A' && ch <= 'Z')
                || (ch >= 'a' && ch <= 'z');
        };
        if (!sv.empty() && sv.front() == '\n')
            sv.remove_prefix(1);
        while (!sv.empty() && sv.back() == '\n')
            sv.remove_suffix(1);
        auto row = 0zu, col = 0zu;
        for (auto ch : sv) {
            if (ch == '\n') {
                row++, col = 0;
                continue;
            }
            if (row >= L || col >= L)
                throw std::invalid_argument{ fmt::format("board does not fit in {}x{}", L, L) };
            if (ch == '.' || region(ch)) {
                base = base.set(row, col);
                if (region(ch)) {
                    auto [it, _] = regions.try_emplace(ch, Shape<L>{ 0u });
                    it->second = it->second.set(row, col);
                }
            } else if (ch != '#') {
                throw std::invalid_argument{ fmt::format("unexpected board character '{}'", ch) };
            }
            col++;
            cols = std::max(cols, col);
        }
        rows = sv.empty() ? 0 : row + 1;
    }

    [[nodiscard]] bool contains(coords_t pos) const {
        return pos.first >= 0 && pos.second >= 0
            && static_cast<size_t>(pos.first) < rows && static_cast<size_t>(pos.second) < cols;
    }

    [[nodiscard]] bool blocked(coords_t pos) const {
        return !contains(pos) || !base.test(pos);
    }

    // cells a solver has to cover
    [[nodiscard]] Shape<L> open() const {
        return base - exposed;
    }

    // copy of the board with one more cell left uncovered
    [[nodiscard]] Board expose(coords_t pos) const {
        if (blocked(pos))
            throw std::invalid_argument{ fmt::format("cannot expose blocked cell ({}, {})", pos.first, pos.second) };
        if (exposed.test(pos))
            throw std::invalid_argument{ fmt::format("cell ({}, {}) is already exposed", pos.first, pos.second) };
        auto b = *this;
        b.exposed = exposed.set(pos);
        return b;
    }

    [[nodiscard]] size_t region_size(char name) const {
        auto it = regions.find(name);
        return it == regions.end() ? 0 : it->second.size();
    }

    // index is 1-based: the first cell of a region is 1
    [[nodiscard]] coords_t region_cell(char name, size_t index) const {
        auto it = regions.find(name);
        if (it == regions.end())
            throw std::out_of_range{ fmt::format("no region '{}'", name) };
        auto i = 1zu;
        for (auto pos : it->second)
            if (i++ == index)
                return pos;
        throw std::out_of_range{ fmt::format("region '{}' has no cell #{}", name, index) };
    }
};
