#include "Shape.hpp"

#include <stdexcept>

template <size_t L>
template <bool Swap, bool FlipX, bool FlipY>
Shape<L> Shape<L>::transform(bool norm) const {
    Shape out{ 0u };
    for (auto [row, col] : *this) {
        auto r = static_cast<size_t>(Swap ? col : row);
        auto c = static_cast<size_t>(Swap ? row : col);
        if constexpr (FlipX) c = LEN - 1 - c;
        if constexpr (FlipY) r = LEN - 1 - r;
        out = out.set(r, c);
    }
    return norm ? out.normalize() : out;
}

template <size_t L>
std::array<Shape<L>, 8> Shape<L>::transforms(bool norm) const {
    return {
        transform<false, false, false>(norm),
        transform<false, true,  false>(norm),
        transform<false, false, true >(norm),
        transform<false, true,  true >(norm),
        transform<true,  false, false>(norm),
        transform<true,  true,  false>(norm),
        transform<true,  false, true >(norm),
        transform<true,  true,  true >(norm),
    };
}

template <size_t L>
unsigned Shape<L>::symmetry() const {
    auto self = normalize();
    auto all = transforms(true);
    auto s = 0u;
    for (auto i = 0u; i < all.size(); i++)
        if (all[i] == self)
            s |= 1u << i;
    return s;
}

template <size_t L>
SymmetryGroup Shape<L>::classify() const {
    if (!value)
        throw std::invalid_argument{ "cannot classify an empty shape" };
    auto s = symmetry();
    if (!is_group(s))
        throw std::runtime_error{ fmt::format("stabilizer 0b{:08b} is not a subgroup of D4", s) };
    return static_cast<SymmetryGroup>(s);
}

template <size_t L>
Shape<L> Shape<L>::extend1() const {
    auto up = value >> LEN;
    auto down = value << LEN;
    auto leftward = (value & ~FIRST_COL) >> 1u;
    auto rightward = (value << 1u) & ~FIRST_COL;
    return Shape{ value | up | down | leftward | rightward };
}

// flood fill from the first cell
template <size_t L>
bool Shape<L>::connected() const {
    if (!value) return false;
    auto reached = front_shape();
    for (auto grown = reached.extend1() & *this; grown != reached; grown = reached.extend1() & *this)
        reached = grown;
    return reached == *this;
}

// one line per row of the bounding box, measured from the origin
template <size_t L>
std::string Shape<L>::to_string() const {
    if (!value)
        return "(empty)\n";
    std::string txt;
    auto n_rows = top() + height(), n_cols = left() + width();
    for (auto row = 0zu; row < n_rows; row++) {
        for (auto col = 0zu; col < n_cols; col++)
            txt.push_back(test(row, col) ? '@' : '.');
        txt.push_back('\n');
    }
    return txt;
}

template class Shape<8>;

template Shape<8> Shape<8>::transform<false, false, false>(bool norm) const;
template Shape<8> Shape<8>::transform<false, true,  false>(bool norm) const;
template Shape<8> Shape<8>::transform<false, false, true >(bool norm) const;
template Shape<8> Shape<8>::transform<false, true,  true >(bool norm) const;
template Shape<8> Shape<8>::transform<true,  false, false>(bool norm) const;
template Shape<8> Shape<8>::transform<true,  true,  false>(bool norm) const;
template Shape<8> Shape<8>::transform<true,  false, true >(bool norm) const;
template Shape<8> Shape<8>::transform<true,  true,  true >(bool norm) const;
