#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/container/small_vector.hpp>

#include "board.hpp"
#include "Piece.hpp"

template <size_t L>
struct Step {
    size_t piece_id, trs_id; // index into the library, index into Piece::placements
    int x, y;                // origin of the placement
    Shape<L> shape;          // absolute cells
};

template <size_t L>
struct Solution {
    std::vector<Step<L>> steps;
    std::vector<std::string> map; // [row][col] -> label

    Solution(const Board<L> &board, const std::vector<Piece<L>> &lib, std::vector<Step<L>> st);

    [[nodiscard]] char at(size_t row, size_t col) const { return map[row][col]; }
    [[nodiscard]] size_t count(char label) const;
};

// occupancy and remaining pieces of one search
// every commit is paired with exactly one rollback, newest first
template <size_t L>
class SearchState {
    Shape<L> open_tiles;
    std::vector<char> used; // [piece_id] -> bool
    size_t remaining_area;
    boost::container::small_vector<Step<L>, 16> history;

public:
    SearchState(const Board<L> &board, const std::vector<Piece<L>> &lib);

    [[nodiscard]] Shape<L> open() const { return open_tiles; }
    [[nodiscard]] bool is_used(size_t id) const { return used[id]; }
    [[nodiscard]] size_t remaining() const { return remaining_area; }
    [[nodiscard]] size_t depth() const { return history.size(); }
    [[nodiscard]] std::vector<Step<L>> steps() const { return { history.begin(), history.end() }; }

    // st.shape must be a subset of open()
    void commit(const Piece<L> &p, const Step<L> &st);
    // undo the latest commit, which must have placed p
    void rollback(const Piece<L> &p);
};

// NOT thread-safe, one Solver per search
// lib must outlive the Solver
template <size_t L>
class Solver {
    const std::vector<Piece<L>> &lib;
    Board<L> board;
    SearchState<L> state;
    uint64_t n_placements;

    bool descend();
    [[nodiscard]] size_t min_tiles() const;

public:
    Solver(const std::vector<Piece<L>> &lb, Board<L> bd);

    // first tiling found, trying pieces in library order
    std::optional<Solution<L>> run();

    // number of placements committed so far
    [[nodiscard]] uint64_t placements() const { return n_placements; }
};

template <size_t L>
std::optional<Solution<L>> solve(const std::vector<Piece<L>> &lib, const Board<L> &board);

extern template struct Solution<8>;
extern template class SearchState<8>;
extern template class Solver<8>;
extern template std::optional<Solution<8>> solve(const std::vector<Piece<8>> &lib, const Board<8> &board);
