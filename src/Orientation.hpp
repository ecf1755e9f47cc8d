#pragma once

#include <boost/container/flat_set.hpp>
#include <boost/container/small_vector.hpp>

#include "Shape.hpp"

// relative (row, col) offsets of one piece
using cells_t = boost::container::small_vector<coords_t, 8>;

// ordered by the sorted cell sequence, which fixes the iteration order
using orientations_t = boost::container::flat_set<cells_t>;

// (r, c) -> (c, -r)
[[nodiscard]] cells_t rotate_90(const cells_t &cells);

// (r, c) -> (-r, c)
[[nodiscard]] cells_t reflect(const cells_t &cells);

// shift so that min row and min col are both 0, then sort row-major
[[nodiscard]] cells_t normalize(const cells_t &cells);

// all distinct rotations and reflections of a non-empty cell set,
// each normalized; 1 to 8 entries
[[nodiscard]] orientations_t orientations_of(const cells_t &base);

// cells must be normalized and fit in the L x L grid
template <size_t L>
[[nodiscard]] Shape<L> to_shape(const cells_t &cells);

template <size_t L>
[[nodiscard]] cells_t to_cells(Shape<L> sh);

extern template Shape<8> to_shape<8>(const cells_t &cells);
extern template cells_t to_cells<8>(Shape<8> sh);
