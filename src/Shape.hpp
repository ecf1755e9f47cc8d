#pragma once

#include <array>
#include <bit>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "Group.hpp"

using coords_t = std::pair<int, int>; // Y, X

template <size_t L>
class Shape {
public:
    static constexpr size_t LEN = L;

    // [LSB] [1] [2] ... [L-1]
    // [L] ...
    // ...          [MSB]
    using shape_t = uint64_t;

private:
    static constexpr size_t BITS = sizeof(shape_t) * 8;
    static_assert(LEN * LEN <= BITS, "Shape<L> must fit in one word");

    static constexpr shape_t FULL = static_cast<shape_t>(
            LEN * LEN == BITS ? ~0ull : (1ull << (LEN * LEN % BITS)) - 1ull);
    static constexpr shape_t FIRST_ROW = static_cast<shape_t>((1ull << LEN) - 1ull);
    static constexpr shape_t FIRST_COL = [] constexpr {
        shape_t total{};
        shape_t mask{ 1 };
        for (auto i = 0zu; i < LEN; i++)
            total |= mask, mask <<= LEN;
        return total;
    }();

    shape_t value;

public:
    explicit constexpr Shape(shape_t v)
        : value{ shape_t(v & FULL) } { }

    constexpr Shape(const Shape &v) = default;
    constexpr Shape(Shape &&v) noexcept = default;
    constexpr Shape &operator=(const Shape &v) noexcept = default;
    constexpr Shape &operator=(Shape &&v) noexcept = default;

    constexpr explicit operator bool() const { return value; }
    [[nodiscard]] constexpr bool operator==(const Shape &other) const {
        return value == other.value;
    }
    // subset ordering: a <= b iff every cell of a is in b
    [[nodiscard]] constexpr auto operator<=>(const Shape &other) const {
        if (value == other.value)
            return std::partial_ordering::equivalent;
        if ((value & other.value) == value)
            return std::partial_ordering::less;
        if ((value & other.value) == other.value)
            return std::partial_ordering::greater;
        return std::partial_ordering::unordered;
    }

    [[nodiscard]] constexpr size_t size() const {
        return std::popcount(value);
    }

    // bit c set iff column c holds a cell
    [[nodiscard]] constexpr shape_t columns() const {
        shape_t m{};
        for (auto v = value; v; v >>= LEN)
            m |= v & FIRST_ROW;
        return m;
    }

    // bit r set iff row r holds a cell
    [[nodiscard]] constexpr shape_t rows() const {
        shape_t m{};
        for (auto r = 0zu; r < LEN; r++)
            if (value >> (r * LEN) & FIRST_ROW)
                m |= shape_t{ 1 } << r;
        return m;
    }

    [[nodiscard]] constexpr size_t left() const { return std::countr_zero(columns()); }
    [[nodiscard]] constexpr size_t width() const { return std::bit_width(columns()) - left(); }
    [[nodiscard]] constexpr size_t right() const { return LEN - std::bit_width(columns()); }
    [[nodiscard]] constexpr size_t top() const { return std::countr_zero(rows()); }
    [[nodiscard]] constexpr size_t height() const { return std::bit_width(rows()) - top(); }
    [[nodiscard]] constexpr size_t bottom() const { return LEN - std::bit_width(rows()); }

    [[nodiscard]] constexpr Shape operator|(Shape other) const {
        return Shape{ value | other.value };
    }

    [[nodiscard]] constexpr Shape operator&(Shape other) const {
        return Shape{ value & other.value };
    }

    [[nodiscard]] constexpr Shape operator-(Shape other) const {
        return Shape{ value & ~other.value };
    }

    // shift to the top-left corner
    [[nodiscard]] constexpr Shape normalize() const {
        if (!value)
            return *this;
        return Shape{ value >> (top() * LEN + left()) };
    }

    [[nodiscard]] constexpr bool test(size_t row, size_t col) const {
        return (value >> (row * LEN + col)) & 1u;
    }

    [[nodiscard]] constexpr bool test(coords_t pos) const {
        return test(pos.first, pos.second);
    }

    [[nodiscard]] constexpr Shape set(size_t row, size_t col) const {
        return Shape{ value | 1ull << (row * LEN + col) };
    }

    [[nodiscard]] constexpr Shape set(coords_t pos) const {
        return set(pos.first, pos.second);
    }

    [[nodiscard]] constexpr Shape clear(size_t row, size_t col) const {
        return Shape{ value & ~(1ull << (row * LEN + col)) };
    }

    [[nodiscard]] constexpr Shape clear(coords_t pos) const {
        return clear(pos.first, pos.second);
    }

    // maps (row, col) to (col, row) when Swap, then mirrors columns
    // (FlipX) and rows (FlipY) across the LEN x LEN grid
    template <bool Swap, bool FlipX, bool FlipY>
    [[nodiscard]] Shape transform(bool norm) const;

    [[nodiscard]] std::array<Shape, 8> transforms(bool norm) const;

    // caller guarantees the result stays inside the grid
    [[nodiscard]] constexpr Shape translate_unsafe(int x, int y) const {
        return Shape{ value << (LEN * y + x) };
    }

    // first set cell in row-major order
    [[nodiscard]] constexpr coords_t front() const {
        auto id = std::countr_zero(value);
        return { static_cast<int>(id / LEN), static_cast<int>(id % LEN) };
    }

    struct bits_proxy {
        shape_t v;
        constexpr bool operator==(const bits_proxy &other) const = default;
        constexpr coords_t operator*() const {
            auto id = std::countr_zero(v);
            return { static_cast<int>(id / LEN), static_cast<int>(id % LEN) };
        }
        constexpr bits_proxy &operator++() {
            v &= v - 1u;
            return *this;
        }
    };
    // iterates set cells in row-major order
    constexpr bits_proxy begin() const {
        return { value };
    }
    constexpr bits_proxy end() const {
        return { 0 };
    }

    // bit i set iff transforms()[i] leaves the shape unchanged
    [[nodiscard]] unsigned symmetry() const;

    [[nodiscard]] SymmetryGroup classify() const;

    [[nodiscard]] Shape front_shape() const {
        return Shape{ static_cast<shape_t>(value & -value) };
    }

    [[nodiscard]] Shape extend1() const;

    [[nodiscard]] bool connected() const;

    [[nodiscard]] std::string to_string() const;
};

template <size_t L>
struct fmt::formatter<Shape<L>> : fmt::formatter<fmt::string_view> {
    auto format(Shape<L> c, fmt::format_context &ctx) const
        -> fmt::format_context::iterator {
        auto txt = c.to_string();
        return fmt::formatter<fmt::string_view>::format(fmt::string_view{ txt }, ctx);
    }
};

extern template class Shape<8>;

extern template Shape<8> Shape<8>::transform<false, false, false>(bool norm) const;
extern template Shape<8> Shape<8>::transform<false, true,  false>(bool norm) const;
extern template Shape<8> Shape<8>::transform<false, false, true >(bool norm) const;
extern template Shape<8> Shape<8>::transform<false, true,  true >(bool norm) const;
extern template Shape<8> Shape<8>::transform<true,  false, false>(bool norm) const;
extern template Shape<8> Shape<8>::transform<true,  true,  false>(bool norm) const;
extern template Shape<8> Shape<8>::transform<true,  false, true >(bool norm) const;
extern template Shape<8> Shape<8>::transform<true,  true,  true >(bool norm) const;
