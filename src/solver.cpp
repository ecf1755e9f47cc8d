#include "solver.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "Piece.inl"

template <size_t L>
Solution<L>::Solution(const Board<L> &board, const std::vector<Piece<L>> &lib, std::vector<Step<L>> st)
    : steps{ std::move(st) } {
    for (auto row = 0zu; row < board.rows; row++) {
        auto &line = map.emplace_back();
        for (auto col = 0zu; col < board.cols; col++) {
            coords_t pos{ static_cast<int>(row), static_cast<int>(col) };
            if (board.blocked(pos)) {
                line.push_back(LABEL_BLOCKED);
                continue;
            }
            if (board.exposed.test(pos)) {
                line.push_back(LABEL_EXPOSED);
                continue;
            }
            auto it = std::find_if(steps.begin(), steps.end(), [=](const Step<L> &s) {
                return s.shape.test(row, col);
            });
            line.push_back(it == steps.end() ? LABEL_EMPTY : lib[it->piece_id].name);
        }
    }
}

template <size_t L>
size_t Solution<L>::count(char label) const {
    auto n = 0zu;
    for (auto &line : map)
        n += std::count(line.begin(), line.end(), label);
    return n;
}

template <size_t L>
SearchState<L>::SearchState(const Board<L> &board, const std::vector<Piece<L>> &lib)
    : open_tiles{ board.open() }, used(lib.size(), 0), remaining_area{} {
    for (auto &p : lib)
        remaining_area += p.size();
}

template <size_t L>
void SearchState<L>::commit(const Piece<L> &p, const Step<L> &st) {
    if (!(open_tiles >= st.shape))
        throw std::logic_error{ fmt::format("piece {} overlaps a covered cell", p.name) };
    open_tiles = open_tiles - st.shape;
    used[st.piece_id] = 1;
    remaining_area -= p.size();
    history.push_back(st);
}

template <size_t L>
void SearchState<L>::rollback(const Piece<L> &p) {
    if (history.empty())
        throw std::logic_error{ "rollback without a matching commit" };
    auto &st = history.back();
    open_tiles = open_tiles | st.shape;
    used[st.piece_id] = 0;
    remaining_area += p.size();
    history.pop_back();
}

template <size_t L>
Solver<L>::Solver(const std::vector<Piece<L>> &lb, Board<L> bd)
    : lib{ lb }, board{ std::move(bd) }, state{ board, lib }, n_placements{} { }

template <size_t L>
size_t Solver<L>::min_tiles() const {
    auto m = std::numeric_limits<size_t>::max();
    for (auto id = 0zu; id < lib.size(); id++)
        if (!state.is_used(id))
            m = std::min(m, lib[id].size());
    return m;
}

template <size_t L>
bool Solver<L>::descend() {
    auto open_tiles = state.open();
    if (!open_tiles)
        return true;
    if (open_tiles.size() > state.remaining())
        return false;
    if (open_tiles.size() < min_tiles())
        return false;
    auto pos = open_tiles.front();
    for (auto id = 0zu; id < lib.size(); id++) {
        if (state.is_used(id)) continue;
        auto &p = lib[id];
        if (p.cover(pos, [&](Shape<L> placed, size_t trs, coords_t origin) {
            if (!(open_tiles >= placed)) return false;
            n_placements++;
            state.commit(p, Step<L>{ id, trs, origin.second, origin.first, placed });
            if (descend())
                return true;
            state.rollback(p);
            return false;
        }))
            return true;
    }
    return false;
}

template <size_t L>
std::optional<Solution<L>> Solver<L>::run() {
    if (!descend())
        return std::nullopt;
    return Solution<L>{ board, lib, state.steps() };
}

template <size_t L>
std::optional<Solution<L>> solve(const std::vector<Piece<L>> &lib, const Board<L> &board) {
    return Solver<L>{ lib, board }.run();
}

template struct Solution<8>;
template class SearchState<8>;
template class Solver<8>;
template std::optional<Solution<8>> solve(const std::vector<Piece<8>> &lib, const Board<8> &board);
