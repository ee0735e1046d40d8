#include <catch2/catch_test_macros.hpp>

#include <osmnet/geo/location.h>

#include <util/geo/Grid.h>

#include <set>

namespace osmnet::geo
{
namespace
{
using box_grid = util::geo::Grid<int, util::geo::Box, double>;

box make_box(double min_x, double min_y, double max_x, double max_y)
{
    return box{make_location(min_x, min_y), make_location(max_x, max_y)};
}
}// namespace

TEST_CASE("Grid returns values of the cells a box overlaps", "[grid]")
{
    box_grid grid{1, 1, make_box(0, 0, 10, 10)};
    REQUIRE(grid.getXWidth() == 10);
    REQUIRE(grid.getYHeight() == 10);

    grid.add(make_box(0.5, 0.5, 0.6, 0.6), 1);
    grid.add(make_box(5.5, 5.5, 7.5, 5.6), 2);

    std::set<int> found;
    grid.get(make_box(0, 0, 0.9, 0.9), &found);
    REQUIRE(found == std::set<int>{1});

    found.clear();
    grid.get(make_box(7.1, 5.1, 7.2, 5.2), &found);
    REQUIRE(found == std::set<int>{2});

    found.clear();
    grid.get(make_box(3, 3, 4, 4), &found);
    REQUIRE(found.empty());

    REQUIRE(grid.size() == 2);
    REQUIRE(grid.getCells(2).size() == 3);
}

TEST_CASE("Grid clamps geometries outside of its extent", "[grid]")
{
    box_grid grid{1, 1, make_box(0, 0, 10, 10)};
    grid.add(make_box(-5, -5, -4, -4), 1);
    grid.add(make_box(20, 20, 21, 21), 2);

    std::set<int> found;
    grid.get(make_box(0, 0, 0.5, 0.5), &found);
    REQUIRE(found.count(1) == 1);

    found.clear();
    grid.get(make_box(9.5, 9.5, 30, 30), &found);
    REQUIRE(found.count(2) == 1);
}

TEST_CASE("Grid forgets removed values", "[grid]")
{
    box_grid grid{0.5, 0.5, make_box(0, 0, 2, 2)};
    grid.add(make_box(0.1, 0.1, 1.9, 1.9), 1);
    REQUIRE(grid.contains(1));

    grid.remove(1);
    REQUIRE_FALSE(grid.contains(1));

    std::set<int> found;
    grid.get(make_box(0, 0, 2, 2), &found);
    REQUIRE(found.empty());

    grid.add(make_box(1, 1, 1, 1), 3);
    grid.clear();
    REQUIRE(grid.size() == 0);
}

TEST_CASE("Point geometries are indexed", "[grid]")
{
    box_grid grid{1, 1, make_box(0, 0, 4, 4)};
    grid.add(util::geo::getBoundingBox(make_location(2.5, 2.5)), 5);

    std::set<int> found;
    grid.get(envelope_around(make_location(2.5, 2.5), 10), &found);
    REQUIRE(found == std::set<int>{5});
}

TEST_CASE("Grid rejects an invalid cell size", "[grid]")
{
    REQUIRE_THROWS_AS(box_grid(0, 1, make_box(0, 0, 1, 1)), util::geo::GridException);
}

}// namespace osmnet::geo
