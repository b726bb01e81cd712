// grid.hpp
//
// Rectangular occupancy grid with per-cell status tags. Dimensions are fixed at
// construction; after loading only the Free -> Visited transition and endpoint
// placement change the cells.

#ifndef HNAV_GRID_HPP_
#define HNAV_GRID_HPP_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "hnav/types.hpp"

namespace hnav {

class Grid {
   public:
    Grid() = default;
    Grid(int rows, int cols, CellStatus fill = CellStatus::Free);

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    std::size_t size() const { return cells_.size(); }
    bool empty() const { return cells_.empty(); }

    bool contains(const Position& position) const;

    // Throws OutOfBoundsError.
    Cell cell_at(const Position& position) const;
    CellStatus status_at(const Position& position) const;

    // In bounds and Free, Start or Goal.
    bool is_traversable(const Position& position) const;

    // Unchecked status write used while building a grid. Throws OutOfBoundsError.
    void set_status(const Position& position, CellStatus status);

    // Free -> Visited. Start and Goal keep their tag. Occupied or already Visited
    // cells throw InvalidTransitionError, positions off the grid OutOfBoundsError.
    void mark_visited(const Position& position);

    // Moves the Start/Goal tags to the given cells. Both cells must be Free or
    // already carry an endpoint tag. When start == goal only the Goal tag is set.
    void set_endpoints(const Position& start, const Position& goal);

    std::optional<Position> start() const { return find_first(CellStatus::Start); }
    std::optional<Position> goal() const { return find_first(CellStatus::Goal); }

    std::size_t count(CellStatus status) const;

    // One text line per row, two characters per cell.
    std::string render() const;

   private:
    std::size_t index_of(const Position& position) const;
    void require_in_bounds(const Position& position) const;
    std::optional<Position> find_first(CellStatus status) const;

    int rows_{0};
    int cols_{0};
    std::vector<CellStatus> cells_;  // row-major
};

}  // namespace hnav

#endif  // HNAV_GRID_HPP_
