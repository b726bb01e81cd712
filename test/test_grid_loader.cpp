// test_grid_loader.cpp
//
// CSV map parsing.

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "hnav/errors.hpp"
#include "hnav/grid_loader.hpp"

using hnav::CellStatus;
using hnav::GridFormatError;
using hnav::Position;

namespace {
hnav::Grid parse(const std::string& text) {
    std::istringstream input(text);
    return hnav::parse_grid_csv(input, "test.csv");
}
}  // namespace

TEST(GridLoader, ParsesCellCodes) {
    const auto grid = parse("0,1,0\n3,0,4\n0,2,1\n");
    EXPECT_EQ(grid.rows(), 3);
    EXPECT_EQ(grid.cols(), 3);
    EXPECT_EQ(grid.status_at({0, 1}), CellStatus::Occupied);
    EXPECT_EQ(grid.status_at({2, 1}), CellStatus::Visited);
    EXPECT_EQ(grid.start(), (Position{1, 0}));
    EXPECT_EQ(grid.goal(), (Position{1, 2}));
    EXPECT_EQ(grid.count(CellStatus::Free), 4u);
}

TEST(GridLoader, ToleratesWhitespaceDecimalsAndBlankLines) {
    const auto grid = parse("\n 0 , 1.0 \r\n\n1,0.0\r\n\n");
    EXPECT_EQ(grid.rows(), 2);
    EXPECT_EQ(grid.cols(), 2);
    EXPECT_EQ(grid.status_at({0, 1}), CellStatus::Occupied);
    EXPECT_EQ(grid.status_at({1, 0}), CellStatus::Occupied);
    EXPECT_EQ(grid.status_at({1, 1}), CellStatus::Free);
}

TEST(GridLoader, MapWithoutEndpointsIsAccepted) {
    const auto grid = parse("0,0\n0,0\n");
    EXPECT_FALSE(grid.start().has_value());
    EXPECT_FALSE(grid.goal().has_value());
}

TEST(GridLoader, RejectsRaggedRows) {
    try {
        parse("0,0,0\n0,0\n");
        FAIL() << "expected GridFormatError";
    } catch (const GridFormatError& e) {
        EXPECT_NE(std::string(e.what()).find("test.csv:2"), std::string::npos) << e.what();
    }
}

TEST(GridLoader, RejectsUnknownAndNonIntegerCodes) {
    EXPECT_THROW(parse("0,5\n"), GridFormatError);
    EXPECT_THROW(parse("0,-1\n"), GridFormatError);
    EXPECT_THROW(parse("0,0.5\n"), GridFormatError);
    EXPECT_THROW(parse("0,x\n"), GridFormatError);
    EXPECT_THROW(parse("0,,1\n"), GridFormatError);
    EXPECT_THROW(parse("0,1,\n"), GridFormatError);
}

TEST(GridLoader, RejectsEmptyInputAndDuplicateEndpoints) {
    EXPECT_THROW(parse(""), GridFormatError);
    EXPECT_THROW(parse("\n\n"), GridFormatError);
    EXPECT_THROW(parse("3,0\n0,3\n"), GridFormatError);
    EXPECT_THROW(parse("4,4\n0,0\n"), GridFormatError);
}

TEST(GridLoader, MissingFileNamesThePath) {
    try {
        hnav::load_grid_csv("/nonexistent/hnav/map.csv");
        FAIL() << "expected GridFormatError";
    } catch (const GridFormatError& e) {
        EXPECT_NE(std::string(e.what()).find("/nonexistent/hnav/map.csv"), std::string::npos);
    }
}

TEST(GridLoader, LoadsBundledMap) {
    const auto grid = hnav::load_grid_csv(std::string(HNAV_TEST_MAP_DIR) + "/map11.csv");
    EXPECT_EQ(grid.rows(), 24);
    EXPECT_EQ(grid.cols(), 22);
    EXPECT_EQ(grid.status_at({0, 0}), CellStatus::Occupied);
    EXPECT_EQ(grid.status_at({2, 2}), CellStatus::Free);
    EXPECT_EQ(grid.status_at({21, 19}), CellStatus::Free);
}
