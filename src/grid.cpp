// grid.cpp
//
// Occupancy grid storage, bounds checks and cell status transitions.

#include "hnav/grid.hpp"

#include <algorithm>
#include <stdexcept>

#include "hnav/errors.hpp"

namespace {
// Two-character symbols used by render(): walls for obstacles, dots for the route.
const char* symbol_for(hnav::CellStatus status) {
    switch (status) {
        case hnav::CellStatus::Free:
            return "  ";
        case hnav::CellStatus::Occupied:
            return "||";
        case hnav::CellStatus::Visited:
            return " .";
        case hnav::CellStatus::Start:
            return " S";
        case hnav::CellStatus::Goal:
            return " E";
    }
    return " ?";
}
}  // namespace

namespace hnav {

Grid::Grid(int rows, int cols, CellStatus fill) : rows_(rows), cols_(cols) {
    if (rows < 0 || cols < 0) {
        throw std::invalid_argument("grid dimensions must be non-negative");
    }
    cells_.assign(static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols), fill);
}

bool Grid::contains(const Position& position) const {
    return position.row >= 0 && position.row < rows_ && position.col >= 0 &&
           position.col < cols_;
}

Cell Grid::cell_at(const Position& position) const { return {position, status_at(position)}; }

CellStatus Grid::status_at(const Position& position) const {
    require_in_bounds(position);
    return cells_[index_of(position)];
}

bool Grid::is_traversable(const Position& position) const {
    if (!contains(position)) return false;
    const CellStatus status = cells_[index_of(position)];
    return status == CellStatus::Free || status == CellStatus::Start ||
           status == CellStatus::Goal;
}

void Grid::set_status(const Position& position, CellStatus status) {
    require_in_bounds(position);
    cells_[index_of(position)] = status;
}

void Grid::mark_visited(const Position& position) {
    require_in_bounds(position);
    CellStatus& status = cells_[index_of(position)];
    switch (status) {
        case CellStatus::Free:
            status = CellStatus::Visited;
            return;
        case CellStatus::Start:
        case CellStatus::Goal:
            return;
        case CellStatus::Occupied:
            throw InvalidTransitionError("cannot mark occupied cell " + to_string(position) +
                                         " as visited");
        case CellStatus::Visited:
            throw InvalidTransitionError("cell " + to_string(position) +
                                         " has already been visited");
    }
}

void Grid::set_endpoints(const Position& start, const Position& goal) {
    require_in_bounds(start);
    require_in_bounds(goal);

    // Validate both cells before touching any tag so a rejected call leaves the grid as is.
    auto check_available = [this](const Position& p, const char* what) {
        const CellStatus status = cells_[index_of(p)];
        if (status == CellStatus::Occupied || status == CellStatus::Visited) {
            throw InvalidTransitionError(std::string(what) + " location " + to_string(p) +
                                         " is not available (" + hnav::to_string(status) + ")");
        }
    };
    check_available(start, "start");
    check_available(goal, "goal");

    std::replace(cells_.begin(), cells_.end(), CellStatus::Start, CellStatus::Free);
    std::replace(cells_.begin(), cells_.end(), CellStatus::Goal, CellStatus::Free);

    cells_[index_of(start)] = CellStatus::Start;
    cells_[index_of(goal)] = CellStatus::Goal;
}

std::size_t Grid::count(CellStatus status) const {
    return static_cast<std::size_t>(std::count(cells_.begin(), cells_.end(), status));
}

std::string Grid::render() const {
    std::string out;
    out.reserve(cells_.size() * 2 + static_cast<std::size_t>(rows_));
    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < cols_; ++c) out += symbol_for(cells_[index_of({r, c})]);
        out += '\n';
    }
    return out;
}

std::size_t Grid::index_of(const Position& position) const {
    return static_cast<std::size_t>(position.row) * static_cast<std::size_t>(cols_) +
           static_cast<std::size_t>(position.col);
}

void Grid::require_in_bounds(const Position& position) const {
    if (!contains(position)) throw OutOfBoundsError(position, rows_, cols_);
}

std::optional<Position> Grid::find_first(CellStatus status) const {
    const auto it = std::find(cells_.begin(), cells_.end(), status);
    if (it == cells_.end()) return std::nullopt;
    const auto index = static_cast<int>(it - cells_.begin());
    return Position{index / cols_, index % cols_};
}

}  // namespace hnav
