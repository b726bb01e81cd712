// test_grid.cpp
//
// Grid model: bounds, traversability and status transitions.

#include <gtest/gtest.h>

#include "hnav/errors.hpp"
#include "hnav/grid.hpp"

using hnav::CellStatus;
using hnav::Grid;
using hnav::Position;

TEST(Grid, DimensionsAndBounds) {
    const Grid grid(3, 4);
    EXPECT_EQ(grid.rows(), 3);
    EXPECT_EQ(grid.cols(), 4);
    EXPECT_EQ(grid.size(), 12u);

    EXPECT_TRUE(grid.contains({0, 0}));
    EXPECT_TRUE(grid.contains({2, 3}));
    EXPECT_FALSE(grid.contains({3, 0}));
    EXPECT_FALSE(grid.contains({0, 4}));
    EXPECT_FALSE(grid.contains({-1, 0}));
    EXPECT_FALSE(grid.contains({0, -1}));
}

TEST(Grid, CellAtReportsOutOfBounds) {
    const Grid grid(2, 2);
    const auto cell = grid.cell_at({1, 1});
    EXPECT_EQ(cell.position, (Position{1, 1}));
    EXPECT_EQ(cell.status, CellStatus::Free);

    try {
        grid.cell_at({2, 0});
        FAIL() << "expected OutOfBoundsError";
    } catch (const hnav::OutOfBoundsError& e) {
        EXPECT_EQ(e.position(), (Position{2, 0}));
    }
    EXPECT_THROW(grid.cell_at({0, -1}), std::out_of_range);
}

TEST(Grid, TraversableStatuses) {
    Grid grid(1, 5);
    grid.set_status({0, 1}, CellStatus::Occupied);
    grid.set_status({0, 2}, CellStatus::Start);
    grid.set_status({0, 3}, CellStatus::Goal);
    grid.set_status({0, 4}, CellStatus::Visited);

    EXPECT_TRUE(grid.is_traversable({0, 0}));
    EXPECT_FALSE(grid.is_traversable({0, 1}));
    EXPECT_TRUE(grid.is_traversable({0, 2}));
    EXPECT_TRUE(grid.is_traversable({0, 3}));
    EXPECT_FALSE(grid.is_traversable({0, 4}));
    EXPECT_FALSE(grid.is_traversable({0, 5}));
    EXPECT_FALSE(grid.is_traversable({-1, 0}));
}

TEST(Grid, MarkVisitedTransitions) {
    Grid grid(2, 2);
    grid.set_endpoints({0, 0}, {1, 1});
    grid.set_status({1, 0}, CellStatus::Occupied);

    grid.mark_visited({0, 1});
    EXPECT_EQ(grid.status_at({0, 1}), CellStatus::Visited);
    EXPECT_FALSE(grid.is_traversable({0, 1}));

    // Endpoints keep their tag; the goal stays enterable.
    grid.mark_visited({0, 0});
    grid.mark_visited({1, 1});
    EXPECT_EQ(grid.status_at({0, 0}), CellStatus::Start);
    EXPECT_EQ(grid.status_at({1, 1}), CellStatus::Goal);
    EXPECT_TRUE(grid.is_traversable({1, 1}));

    EXPECT_THROW(grid.mark_visited({1, 0}), hnav::InvalidTransitionError);
    EXPECT_THROW(grid.mark_visited({0, 1}), hnav::InvalidTransitionError);
    EXPECT_THROW(grid.mark_visited({5, 5}), hnav::OutOfBoundsError);
    EXPECT_EQ(grid.count(CellStatus::Visited), 1u);
}

TEST(Grid, SetEndpointsMovesTags) {
    Grid grid(3, 3);
    grid.set_endpoints({0, 0}, {2, 2});
    EXPECT_EQ(grid.start(), (Position{0, 0}));
    EXPECT_EQ(grid.goal(), (Position{2, 2}));

    grid.set_endpoints({2, 2}, {0, 1});
    EXPECT_EQ(grid.start(), (Position{2, 2}));
    EXPECT_EQ(grid.goal(), (Position{0, 1}));
    EXPECT_EQ(grid.status_at({0, 0}), CellStatus::Free);
    EXPECT_EQ(grid.count(CellStatus::Start), 1u);
    EXPECT_EQ(grid.count(CellStatus::Goal), 1u);
}

TEST(Grid, SetEndpointsRejectsUnavailableCells) {
    Grid grid(3, 3);
    grid.set_status({1, 1}, CellStatus::Occupied);
    grid.set_endpoints({0, 0}, {2, 2});

    EXPECT_THROW(grid.set_endpoints({1, 1}, {2, 2}), hnav::InvalidTransitionError);
    EXPECT_THROW(grid.set_endpoints({0, 0}, {3, 0}), hnav::OutOfBoundsError);

    // A rejected call leaves the previous endpoints in place.
    EXPECT_EQ(grid.start(), (Position{0, 0}));
    EXPECT_EQ(grid.goal(), (Position{2, 2}));
}

TEST(Grid, StartEqualToGoalKeepsGoalTag) {
    Grid grid(2, 2);
    grid.set_endpoints({1, 0}, {1, 0});
    EXPECT_EQ(grid.status_at({1, 0}), CellStatus::Goal);
    EXPECT_FALSE(grid.start().has_value());
}

TEST(Grid, RenderUsesMapSymbols) {
    Grid grid(2, 3);
    grid.set_status({0, 1}, CellStatus::Occupied);
    grid.set_endpoints({0, 0}, {1, 2});
    grid.mark_visited({1, 1});

    EXPECT_EQ(grid.render(), " S||  \n   . E\n");
}
