#include <gtest/gtest.h>

#include <algorithm>

#include "Orientation.hpp"
#include "Piece.inl"

TEST(Orientation, RotateAndReflect) {
    EXPECT_EQ(rotate_90({ { 0, 0 }, { 0, 1 } }), (cells_t{ { 0, 0 }, { 1, 0 } }));
    EXPECT_EQ(rotate_90({ { 1, 2 } }), (cells_t{ { 2, -1 } }));
    EXPECT_EQ(reflect({ { 1, 2 } }), (cells_t{ { -1, 2 } }));
}

TEST(Orientation, NormalizeShiftsAndSorts) {
    EXPECT_EQ(normalize({ { 0, 3 }, { -1, 2 } }), (cells_t{ { 0, 0 }, { 1, 1 } }));
    EXPECT_EQ(normalize({ { 5, 5 }, { 4, 6 }, { 4, 5 } }), (cells_t{ { 0, 0 }, { 0, 1 }, { 1, 0 } }));
    EXPECT_TRUE(normalize({}).empty());
}

TEST(Orientation, SymmetricShapesCollapse) {
    EXPECT_EQ(orientations_of({ { 0, 0 } }).size(), 1u);
    EXPECT_EQ(orientations_of({ { 0, 0 }, { 0, 1 }, { 1, 0 }, { 1, 1 } }).size(), 1u);
    EXPECT_EQ(orientations_of({ { 0, 1 }, { 1, 0 }, { 1, 1 }, { 1, 2 }, { 2, 1 } }).size(), 1u);
    EXPECT_EQ(orientations_of({ { 0, 0 }, { 0, 1 } }).size(), 2u);
    EXPECT_EQ(orientations_of({ { 0, 0 }, { 0, 1 }, { 1, 1 }, { 1, 2 } }).size(), 4u);
}

TEST(Orientation, AsymmetricShapeHasEight) {
    // F pentomino
    auto set = orientations_of({ { 0, 1 }, { 0, 2 }, { 1, 0 }, { 1, 1 }, { 2, 1 } });
    EXPECT_EQ(set.size(), 8u);
}

TEST(Orientation, DominoOrder) {
    auto set = orientations_of({ { 0, 0 }, { 1, 0 } });
    ASSERT_EQ(set.size(), 2u);
    EXPECT_EQ(*set.begin(), (cells_t{ { 0, 0 }, { 0, 1 } }));
    EXPECT_EQ(*std::next(set.begin()), (cells_t{ { 0, 0 }, { 1, 0 } }));
}

TEST(Orientation, IndependentOfStartingPose) {
    cells_t l{ { 0, 0 }, { 1, 0 }, { 2, 0 }, { 2, 1 } };
    auto a = orientations_of(l);
    auto b = orientations_of(rotate_90(reflect(l)));
    EXPECT_EQ(a, b);
}

TEST(Orientation, NormalFormProperties) {
    cells_t n{ { 0, 1 }, { 0, 2 }, { 0, 3 }, { 1, 0 }, { 1, 1 } };
    for (auto &o : orientations_of(n)) {
        EXPECT_EQ(o.size(), n.size());
        EXPECT_EQ(std::min_element(o.begin(), o.end(),
                    [](auto a, auto b) { return a.first < b.first; })->first, 0);
        EXPECT_EQ(std::min_element(o.begin(), o.end(),
                    [](auto a, auto b) { return a.second < b.second; })->second, 0);
        EXPECT_TRUE(std::is_sorted(o.begin(), o.end()));
        EXPECT_EQ(normalize(o), o);
    }
}

TEST(Orientation, EmptyIsRejected) {
    EXPECT_THROW((void)orientations_of({}), std::invalid_argument);
}

TEST(Orientation, ToShape) {
    EXPECT_EQ(to_shape<8>({ { 0, 0 }, { 1, 2 } }).size(), 2u);
    EXPECT_TRUE(to_shape<8>({ { 1, 2 } }).test(1, 2));
    EXPECT_THROW((void)to_shape<8>({ { 0, 8 } }), std::invalid_argument);
    EXPECT_THROW((void)to_shape<8>({ { -1, 0 } }), std::invalid_argument);
}

TEST(Piece, PlacementsFollowOrientations) {
    Piece<8> p{ 'U', { { 0, 0 }, { 0, 1 }, { 1, 0 }, { 2, 0 }, { 2, 1 } } };
    EXPECT_EQ(p.size(), 5u);
    EXPECT_EQ(p.classify(), SymmetryGroup::D1_Y);
    auto set = orientations_of(p.base);
    ASSERT_EQ(p.placements.size(), set.size());
    auto it = set.begin();
    for (auto &pl : p.placements) {
        EXPECT_EQ(pl.cells, *it++);
        EXPECT_EQ(pl.normal, to_shape<8>(pl.cells));
        EXPECT_EQ(pl.max.first, static_cast<int>(8 - pl.normal.height()));
        EXPECT_EQ(pl.max.second, static_cast<int>(8 - pl.normal.width()));
    }
}

TEST(Piece, RejectsBadShapes) {
    EXPECT_THROW((Piece<8>{ 'x', {} }), std::invalid_argument);
    EXPECT_THROW((Piece<8>{ 'x', { { 0, 0 }, { 2, 0 } } }), std::invalid_argument);
    EXPECT_THROW((Piece<8>{ 'x', { { 0, 0 }, { 0, 0 } } }), std::invalid_argument);
    EXPECT_THROW((Piece<8>{ 'x', { { 0, 0 }, { 0, 9 } } }), std::invalid_argument);
}

TEST(Piece, CoverVisitsEveryAnchor) {
    // domino, horizontal then vertical
    Piece<8> p{ 'd', { { 0, 0 }, { 0, 1 } } };
    std::vector<coords_t> origins;
    std::vector<size_t> trs;
    p.cover({ 3, 3 }, [&](Shape<8> placed, size_t t, coords_t origin) {
        EXPECT_TRUE(placed.test(3, 3));
        trs.push_back(t);
        origins.push_back(origin);
        return false;
    });
    EXPECT_EQ(trs, (std::vector<size_t>{ 0, 0, 1, 1 }));
    EXPECT_EQ(origins, (std::vector<coords_t>{ { 3, 3 }, { 3, 2 }, { 3, 3 }, { 2, 3 } }));
}

TEST(Piece, CoverStaysOnTheGrid) {
    Piece<8> p{ 'd', { { 0, 0 }, { 0, 1 } } };
    auto n = 0;
    p.cover({ 0, 0 }, [&](Shape<8>, size_t, coords_t origin) {
        EXPECT_GE(origin.first, 0);
        EXPECT_GE(origin.second, 0);
        n++;
        return false;
    });
    EXPECT_EQ(n, 2);
}

TEST(Piece, CoverStopsEarly) {
    Piece<8> p{ 'd', { { 0, 0 }, { 0, 1 } } };
    auto n = 0;
    EXPECT_TRUE(p.cover({ 3, 3 }, [&](Shape<8>, size_t, coords_t) { return ++n == 2; }));
    EXPECT_EQ(n, 2);
}
