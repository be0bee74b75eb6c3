/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE NavGridTests
#include <boost/test/unit_test.hpp>

#include "ai/pathfinding/NavGrid.hpp"
#include "collisions/AABB.hpp"
#include <cmath>
#include <stdexcept>
#include <vector>

using namespace Nightfall;

BOOST_AUTO_TEST_SUITE(NavGridConstructionTests)

BOOST_AUTO_TEST_CASE(TestDimensionsRoundUp)
{
    NavGrid grid = NavGrid::build(2000.0f, 2000.0f, 48.0f, {}, 1);
    BOOST_CHECK_EQUAL(grid.getCols(), 42); // ceil(2000 / 48)
    BOOST_CHECK_EQUAL(grid.getRows(), 42);
    BOOST_CHECK_EQUAL(grid.blockedCount(), 0u);

    NavGrid exact = NavGrid::build(100.0f, 50.0f, 10.0f, {}, 0);
    BOOST_CHECK_EQUAL(exact.getCols(), 10);
    BOOST_CHECK_EQUAL(exact.getRows(), 5);
}

BOOST_AUTO_TEST_CASE(TestInvalidArgumentsThrow)
{
    BOOST_CHECK_THROW(NavGrid::build(0.0f, 100.0f, 10.0f, {}, 1), std::invalid_argument);
    BOOST_CHECK_THROW(NavGrid::build(100.0f, -5.0f, 10.0f, {}, 1), std::invalid_argument);
    BOOST_CHECK_THROW(NavGrid::build(100.0f, 100.0f, 0.0f, {}, 1), std::invalid_argument);
    BOOST_CHECK_THROW(NavGrid::build(100.0f, 100.0f, 10.0f, {}, -1), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestSingleObstacleWithoutExpansion)
{
    // Rectangle x in [25, 35], y in [25, 35] covers cells 2..3 on both axes
    std::vector<AABB> obstacles{AABB::fromRect(25.0f, 25.0f, 10.0f, 10.0f)};
    NavGrid grid = NavGrid::build(100.0f, 100.0f, 10.0f, obstacles, 0);

    BOOST_CHECK_EQUAL(grid.blockedCount(), 4u);
    BOOST_CHECK(grid.isBlocked(GridCell{2, 2}));
    BOOST_CHECK(grid.isBlocked(GridCell{3, 3}));
    BOOST_CHECK(!grid.isBlocked(GridCell{1, 2}));
    BOOST_CHECK(!grid.isBlocked(GridCell{4, 4}));
}

BOOST_AUTO_TEST_CASE(TestExpansionGrowsEverySide)
{
    std::vector<AABB> obstacles{AABB::fromRect(25.0f, 25.0f, 10.0f, 10.0f)};
    NavGrid grid = NavGrid::build(100.0f, 100.0f, 10.0f, obstacles, 1);

    // Cells 1..4 on both axes
    BOOST_CHECK_EQUAL(grid.blockedCount(), 16u);
    for (int y = 0; y < grid.getRows(); ++y) {
        for (int x = 0; x < grid.getCols(); ++x) {
            bool expected = x >= 1 && x <= 4 && y >= 1 && y <= 4;
            BOOST_CHECK_EQUAL(grid.isBlocked(GridCell{x, y}), expected);
        }
    }
}

BOOST_AUTO_TEST_CASE(TestExpansionClampedAtEdges)
{
    std::vector<AABB> obstacles{AABB::fromRect(0.0f, 0.0f, 5.0f, 5.0f),
                                AABB::fromRect(95.0f, 95.0f, 20.0f, 20.0f)};
    NavGrid grid = NavGrid::build(100.0f, 100.0f, 10.0f, obstacles, 2);

    // Corner obstacle at (0,0) grows to 0..2; far obstacle clamps to 7..9
    BOOST_CHECK_EQUAL(grid.blockedCount(), 9u + 9u);
    BOOST_CHECK(grid.isBlocked(GridCell{2, 2}));
    BOOST_CHECK(!grid.isBlocked(GridCell{3, 3}));
    BOOST_CHECK(grid.isBlocked(GridCell{7, 7}));
    BOOST_CHECK(grid.isBlocked(GridCell{9, 9}));
    BOOST_CHECK(!grid.isBlocked(GridCell{6, 6}));
}

BOOST_AUTO_TEST_CASE(TestExpandedRegionCoversIntersectingCells)
{
    const float cell = 16.0f;
    const int expand = 1;
    std::vector<AABB> obstacles{AABB::fromRect(50.0f, 70.0f, 40.0f, 18.0f),
                                AABB::fromRect(130.0f, 20.0f, 12.0f, 60.0f)};
    NavGrid grid = NavGrid::build(200.0f, 160.0f, cell, obstacles, expand);

    for (int y = 0; y < grid.getRows(); ++y) {
        for (int x = 0; x < grid.getCols(); ++x) {
            // Cell rectangle intersects the obstacle grown by expand cells
            const float cx0 = x * cell;
            const float cy0 = y * cell;
            bool touches = false;
            for (const auto& ob : obstacles) {
                const float left = std::floor(ob.left() / cell) * cell - expand * cell;
                const float top = std::floor(ob.top() / cell) * cell - expand * cell;
                const float right = (std::floor(ob.right() / cell) + 1 + expand) * cell;
                const float bottom = (std::floor(ob.bottom() / cell) + 1 + expand) * cell;
                if (cx0 < right && cx0 + cell > left && cy0 < bottom && cy0 + cell > top) {
                    touches = true;
                }
            }
            BOOST_CHECK_EQUAL(grid.isBlocked(GridCell{x, y}), touches);
        }
    }
}

BOOST_AUTO_TEST_CASE(TestFullyBlockedGridAccepted)
{
    std::vector<AABB> obstacles{AABB::fromRect(0.0f, 0.0f, 100.0f, 100.0f)};
    NavGrid grid = NavGrid::build(100.0f, 100.0f, 10.0f, obstacles, 1);
    BOOST_CHECK_EQUAL(grid.blockedCount(), 100u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(NavGridCoordinateTests)

BOOST_AUTO_TEST_CASE(TestCellCenterRoundTrip)
{
    NavGrid grid = NavGrid::build(2000.0f, 2000.0f, 48.0f, {}, 1);
    for (int y = 0; y < grid.getRows(); y += 3) {
        for (int x = 0; x < grid.getCols(); x += 3) {
            GridCell c{x, y};
            BOOST_CHECK_EQUAL(grid.cellOf(grid.centerOf(c)), c);
        }
    }
}

BOOST_AUTO_TEST_CASE(TestCellOfFloors)
{
    BOOST_CHECK_EQUAL(NavGrid::cellOf(Vector2D(47.9f, 48.0f), 48.0f), (GridCell{0, 1}));
    BOOST_CHECK_EQUAL(NavGrid::cellOf(Vector2D(-0.5f, 10.0f), 48.0f), (GridCell{-1, 0}));
    BOOST_CHECK_EQUAL(NavGrid::centerOf(GridCell{2, 0}, 48.0f), Vector2D(120.0f, 24.0f));
}

BOOST_AUTO_TEST_CASE(TestBoundsAndClamp)
{
    NavGrid grid = NavGrid::build(100.0f, 50.0f, 10.0f, {}, 0);
    BOOST_CHECK(grid.inBounds(GridCell{9, 4}));
    BOOST_CHECK(!grid.inBounds(GridCell{10, 4}));
    BOOST_CHECK(!grid.inBounds(GridCell{0, -1}));

    // Out of bounds counts as blocked
    BOOST_CHECK(grid.isBlocked(GridCell{-1, 0}));
    BOOST_CHECK(grid.isBlocked(GridCell{0, 5}));

    BOOST_CHECK_EQUAL(grid.clampCell(GridCell{-3, 12}), (GridCell{0, 4}));
    BOOST_CHECK_EQUAL(grid.clampCell(GridCell{15, 2}), (GridCell{9, 2}));
}

BOOST_AUTO_TEST_SUITE_END()
