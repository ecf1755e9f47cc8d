#pragma once

#include "Piece.hpp"

template <size_t L>
bool Piece<L>::cover(coords_t pos, auto &&func) const {
    auto [tgtY, tgtX] = pos;
    for (auto trs = 0zu; trs < placements.size(); trs++) {
        auto &p = placements[trs];
        auto [maxY, maxX] = p.max;
        for (auto [bitY, bitX] : p.cells) {
            if (bitX > tgtX || bitX + maxX < tgtX)
                continue;
            if (bitY > tgtY || bitY + maxY < tgtY)
                continue;
            auto x = tgtX - bitX;
            auto y = tgtY - bitY;
            if (func(p.normal.translate_unsafe(x, y), trs, coords_t{ y, x }))
                return true;
        }
    }
    return false;
}
