#pragma once

#include "Orientation.hpp"
#include "Shape.hpp"

#include <vector>

template <size_t L>
struct Piece {
    char name;

    // as given, before normalization
    cells_t base;

    Shape<L> canonical;

    struct Placement {
        cells_t cells;   // one orientation, normalized
        Shape<L> normal; // the same cells anchored at (0, 0)
        coords_t max;    // largest (y, x) translation that stays on the grid
    };

    // one per distinct orientation, in orientations_of order
    std::vector<Placement> placements;

    Piece(char nm, cells_t cells);

    [[nodiscard]] size_t size() const { return canonical.size(); }
    [[nodiscard]] SymmetryGroup classify() const { return canonical.classify(); }

    // every placement that covers pos, in orientation order then cell order
    // bool func(Shape<L> placed, size_t trs, coords_t origin) -> true to stop
    bool cover(coords_t pos, auto &&func) const;
};

extern template struct Piece<8>;
